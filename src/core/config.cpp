/**
 * @file config.cpp
 * @brief Implementation of Config class
 *
 * Handles command-line argument parsing, JSON serialization,
 * and automatic path detection based on system environment.
 */

#include "chimera/config.h"
#include "chimera/errors.h"
#include "chimera/logger.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace chimera {

/**
 * @brief Expand ~ to home directory in path
 * @param path Path that may contain ~
 * @return Expanded path
 */
static std::string expandPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return std::string(home) + path.substr(1);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return std::string(pw->pw_dir) + path.substr(1);
    }
    return path;
}

/**
 * @brief Parse an integer option value, warning on stderr when malformed
 */
static void parseIntOption(const std::string& name, const char* value, int& out) {
    try {
        out = std::stoi(value);
    } catch (const std::exception&) {
        std::cerr << "Ignoring invalid value for " << name << ": " << value << std::endl;
    }
}

std::string Config::getHostname() {
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[sizeof(hostname) - 1] = '\0';
        return std::string(hostname);
    }
    return "localhost";
}

std::string Config::getUsername() {
    const char* user = std::getenv("USER");
    if (user != nullptr && user[0] != '\0') {
        return std::string(user);
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_name != nullptr) {
        return std::string(pw->pw_name);
    }

    return "unknown";
}

std::string Config::getHomeDir() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return std::string(home);
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return std::string(pw->pw_dir);
    }

    return "/tmp";
}

void Config::initDefaultPaths() {
    // Socket path: /tmp/chimera_<username>.sock
    socket_path = "/tmp/chimera_" + getUsername() + ".sock";

    // Data directory: ~/.chimera/<hostname>/
    data_dir = getHomeDir() + "/.chimera/" + getHostname();
}

Config Config::fromArgs(int argc, char* argv[]) {
    Config config;
    config.initDefaultPaths();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--log" && i + 1 < argc) {
            config.enable_logging = true;
            config.log_dir = expandPath(argv[++i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            config.data_dir = expandPath(argv[++i]);
        } else if (arg == "--socket" && i + 1 < argc) {
            config.socket_path = expandPath(argv[++i]);
        } else if (arg == "--max-concurrent" && i + 1 < argc) {
            parseIntOption(arg, argv[++i], config.max_concurrent);
        } else if (arg == "--phase-timeout" && i + 1 < argc) {
            parseIntOption(arg, argv[++i], config.phase_timeout_ms);
        } else if (arg == "--max-retries" && i + 1 < argc) {
            parseIntOption(arg, argv[++i], config.max_retries);
        } else if (arg == "--circuit-threshold" && i + 1 < argc) {
            parseIntOption(arg, argv[++i], config.circuit_failure_threshold);
        } else if (arg == "--poll-interval" && i + 1 < argc) {
            parseIntOption(arg, argv[++i], config.poll_interval_ms);
        } else if (arg == "--agent" && i + 1 < argc) {
            std::string binding = argv[++i];
            size_t eq = binding.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == binding.size()) {
                std::cerr << "Ignoring malformed --agent binding: " << binding << std::endl;
            } else {
                config.agent_commands[binding.substr(0, eq)] = expandPath(binding.substr(eq + 1));
            }
        }
        // Other arguments are ignored (handled by CLI)
    }

    return config;
}

std::string Config::toJson() const {
    nlohmann::json j;

    // Executor pool
    j["max_concurrent"] = max_concurrent;
    j["poll_interval_ms"] = poll_interval_ms;

    // Phases
    j["phase_timeout_ms"] = phase_timeout_ms;
    j["max_retries"] = max_retries;
    j["retry_base_delay_ms"] = retry_base_delay_ms;
    j["retry_max_delay_ms"] = retry_max_delay_ms;
    j["backoff_strategy"] = backoff_strategy;

    // Circuit breakers
    j["circuit_failure_threshold"] = circuit_failure_threshold;
    j["circuit_recovery_timeout_ms"] = circuit_recovery_timeout_ms;

    // Recovery and shutdown
    j["stale_threshold_ms"] = stale_threshold_ms;
    j["shutdown_timeout_ms"] = shutdown_timeout_ms;

    // Storage
    j["storage_retry_attempts"] = storage_retry_attempts;
    j["storage_retry_delay_ms"] = storage_retry_delay_ms;

    j["metrics_window"] = metrics_window;

    // Paths
    j["socket_path"] = socket_path;
    j["data_dir"] = data_dir;
    j["log_dir"] = log_dir;

    // Logging
    j["enable_logging"] = enable_logging;
    j["log_level"] = log_level;

    j["agent_commands"] = agent_commands;

    return j.dump(2);  // Pretty print with 2-space indent
}

Config Config::fromJson(const std::string& json) {
    try {
        nlohmann::json j = nlohmann::json::parse(json);

        Config config;

        config.max_concurrent = j.value("max_concurrent", config.max_concurrent);
        config.poll_interval_ms = j.value("poll_interval_ms", config.poll_interval_ms);

        config.phase_timeout_ms = j.value("phase_timeout_ms", config.phase_timeout_ms);
        config.max_retries = j.value("max_retries", config.max_retries);
        config.retry_base_delay_ms = j.value("retry_base_delay_ms", config.retry_base_delay_ms);
        config.retry_max_delay_ms = j.value("retry_max_delay_ms", config.retry_max_delay_ms);
        config.backoff_strategy = j.value("backoff_strategy", config.backoff_strategy);

        config.circuit_failure_threshold =
            j.value("circuit_failure_threshold", config.circuit_failure_threshold);
        config.circuit_recovery_timeout_ms =
            j.value("circuit_recovery_timeout_ms", config.circuit_recovery_timeout_ms);

        config.stale_threshold_ms = j.value("stale_threshold_ms", config.stale_threshold_ms);
        config.shutdown_timeout_ms = j.value("shutdown_timeout_ms", config.shutdown_timeout_ms);

        config.storage_retry_attempts =
            j.value("storage_retry_attempts", config.storage_retry_attempts);
        config.storage_retry_delay_ms =
            j.value("storage_retry_delay_ms", config.storage_retry_delay_ms);

        config.metrics_window = j.value("metrics_window", config.metrics_window);

        config.socket_path = j.value("socket_path", config.socket_path);
        config.data_dir = j.value("data_dir", config.data_dir);
        config.log_dir = j.value("log_dir", config.log_dir);

        config.enable_logging = j.value("enable_logging", config.enable_logging);
        config.log_level = j.value("log_level", config.log_level);

        if (j.contains("agent_commands")) {
            config.agent_commands =
                j["agent_commands"].get<std::map<std::string, std::string>>();
        }

        return config;

    } catch (const nlohmann::json::exception& e) {
        throw ChimeraException(ErrorCode::FILE_PARSE_ERROR,
                               std::string("Config JSON parse error: ") + e.what());
    }
}

void Config::validate() const {
    auto fail = [](const std::string& msg) {
        throw ChimeraException(ErrorCode::CONFIG_INVALID, msg);
    };

    if (max_concurrent < 1) fail("max_concurrent must be at least 1");
    if (poll_interval_ms < 1) fail("poll_interval_ms must be positive");
    if (phase_timeout_ms < 1) fail("phase_timeout_ms must be positive");
    if (max_retries < 0) fail("max_retries must not be negative");
    if (retry_base_delay_ms < 0) fail("retry_base_delay_ms must not be negative");
    if (retry_max_delay_ms < retry_base_delay_ms) {
        fail("retry_max_delay_ms must not be less than retry_base_delay_ms");
    }
    if (circuit_failure_threshold < 1) fail("circuit_failure_threshold must be at least 1");
    if (circuit_recovery_timeout_ms < 0) fail("circuit_recovery_timeout_ms must not be negative");
    if (stale_threshold_ms < 0) fail("stale_threshold_ms must not be negative");
    if (shutdown_timeout_ms < 0) fail("shutdown_timeout_ms must not be negative");
    if (storage_retry_attempts < 0) fail("storage_retry_attempts must not be negative");
    if (metrics_window < 1) fail("metrics_window must be at least 1");

    try {
        backoffStrategyFromString(backoff_strategy);
        logLevelFromString(log_level);
    } catch (const std::invalid_argument& e) {
        fail(e.what());
    }
}

RetryConfig Config::phaseRetryConfig() const {
    RetryConfig rc;
    rc.max_retries = max_retries;
    rc.base_delay_ms = retry_base_delay_ms;
    rc.max_delay_ms = retry_max_delay_ms;
    rc.strategy = backoffStrategyFromString(backoff_strategy);
    return rc;
}

RetryConfig Config::storageRetryConfig() const {
    RetryConfig rc;
    rc.max_retries = storage_retry_attempts;
    rc.base_delay_ms = storage_retry_delay_ms;
    rc.max_delay_ms = storage_retry_delay_ms * 16;
    rc.strategy = BackoffStrategy::EXPONENTIAL;
    return rc;
}

CircuitBreakerConfig Config::circuitBreakerConfig() const {
    CircuitBreakerConfig cc;
    cc.failure_threshold = circuit_failure_threshold;
    cc.recovery_timeout_ms = circuit_recovery_timeout_ms;
    return cc;
}

bool Config::createDirectoryRecursive(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    size_t pos = 0;
    std::string current_path;

    while ((pos = path.find('/', pos + 1)) != std::string::npos) {
        current_path = path.substr(0, pos);
        if (!current_path.empty()) {
            struct stat st;
            if (stat(current_path.c_str(), &st) != 0) {
                if (mkdir(current_path.c_str(), 0755) != 0 && errno != EEXIST) {
                    return false;
                }
            }
        }
    }

    // Create the final directory
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
    }

    return true;
}

void Config::save() const {
    if (data_dir.empty()) {
        throw ChimeraException(ErrorCode::FILE_WRITE_ERROR, "Data directory not set");
    }

    if (!createDirectoryRecursive(data_dir)) {
        throw ChimeraException(ErrorCode::FILE_WRITE_ERROR,
                               "Failed to create data directory: " + data_dir);
    }

    std::string config_path = data_dir + "/config.json";
    std::ofstream file(config_path);

    if (!file.is_open()) {
        throw ChimeraException(ErrorCode::FILE_WRITE_ERROR,
                               "Failed to open config file for writing: " + config_path);
    }

    file << toJson();

    if (file.fail()) {
        throw ChimeraException(ErrorCode::FILE_WRITE_ERROR,
                               "Failed to write config file: " + config_path);
    }
}

Config Config::load(const std::string& data_dir) {
    std::string config_path = data_dir + "/config.json";
    std::ifstream file(config_path);

    if (!file.is_open()) {
        // File doesn't exist, return default config with paths set
        Config config;
        config.initDefaultPaths();
        config.data_dir = data_dir;
        return config;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    if (file.fail() && !file.eof()) {
        throw ChimeraException(ErrorCode::FILE_READ_ERROR,
                               "Failed to read config file: " + config_path);
    }

    return fromJson(content);
}

bool Config::operator==(const Config& other) const {
    return max_concurrent == other.max_concurrent &&
           poll_interval_ms == other.poll_interval_ms &&
           phase_timeout_ms == other.phase_timeout_ms &&
           max_retries == other.max_retries &&
           retry_base_delay_ms == other.retry_base_delay_ms &&
           retry_max_delay_ms == other.retry_max_delay_ms &&
           backoff_strategy == other.backoff_strategy &&
           circuit_failure_threshold == other.circuit_failure_threshold &&
           circuit_recovery_timeout_ms == other.circuit_recovery_timeout_ms &&
           stale_threshold_ms == other.stale_threshold_ms &&
           shutdown_timeout_ms == other.shutdown_timeout_ms &&
           storage_retry_attempts == other.storage_retry_attempts &&
           storage_retry_delay_ms == other.storage_retry_delay_ms &&
           metrics_window == other.metrics_window &&
           socket_path == other.socket_path &&
           data_dir == other.data_dir &&
           log_dir == other.log_dir &&
           enable_logging == other.enable_logging &&
           log_level == other.log_level &&
           agent_commands == other.agent_commands;
}

} // namespace chimera
