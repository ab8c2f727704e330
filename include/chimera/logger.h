/**
 * @file logger.h
 * @brief Server log writer shared by the chimera components
 *
 * Writes timestamped, levelled lines to <log_dir>/server.log:
 *
 *   [2024-01-15 10:30:00.123] [INFO] message
 */

#ifndef CHIMERA_LOGGER_H
#define CHIMERA_LOGGER_H

#include <memory>
#include <mutex>
#include <string>

namespace chimera {

/**
 * @brief Log severity, ordered from most to least verbose
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

std::string logLevelToString(LogLevel level);

/**
 * @brief Parse a level name ("debug", "INFO", ...)
 * @throws std::invalid_argument if the name is not recognized
 */
LogLevel logLevelFromString(const std::string& str);

/**
 * @brief Thread-safe append-only log file writer
 *
 * A Logger constructed without a directory is disabled and drops every
 * message, so components can always hold one.
 */
class Logger {
public:
    /**
     * @brief Construct a Logger
     * @param log_dir Directory for server.log (empty = disabled)
     * @param min_level Messages below this level are dropped
     * @param echo_stderr Also write each line to stderr
     */
    explicit Logger(const std::string& log_dir = "",
                    LogLevel min_level = LogLevel::INFO,
                    bool echo_stderr = false);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }

    bool enabled() const { return !log_dir_.empty() || echo_stderr_; }

    /// Path of the log file, empty when file logging is disabled
    std::string logFilePath() const;

    void setMinLevel(LogLevel level);

    /**
     * @brief Get current local timestamp string
     * @return "YYYY-mm-dd HH:MM:SS.mmm"
     */
    static std::string getTimestamp();

    /// A shared disabled logger for components constructed without one
    static std::shared_ptr<Logger> null();

private:
    std::string log_dir_;
    LogLevel min_level_;
    bool echo_stderr_;
    std::mutex mutex_;
};

} // namespace chimera

#endif // CHIMERA_LOGGER_H
