/**
 * @file config.h
 * @brief Configuration management for chimera
 *
 * Defines the Config struct which holds all configuration parameters
 * for the workflow engine: pool sizing, retry and timeout behaviour,
 * durability tuning, paths, and the external agent commands.
 */

#ifndef CHIMERA_CONFIG_H
#define CHIMERA_CONFIG_H

#include "chimera/circuit_breaker.h"
#include "chimera/retry_policy.h"

#include <map>
#include <string>

namespace chimera {

/**
 * @brief Configuration parameters for the chimera daemon
 *
 * Contains all configurable parameters including:
 * - Executor pool sizing and polling
 * - Phase timeout and retry/backoff behaviour
 * - Per-role circuit breakers
 * - Restart recovery and shutdown bounds
 * - File paths (socket, data directory, logs)
 * - Agent command bindings
 *
 * Configuration can be loaded from command-line arguments using fromArgs().
 */
struct Config {
    // ========== Executor Pool ==========

    /// Maximum number of workflows RUNNING at once.
    /// Can be set via --max-concurrent
    int max_concurrent = 3;

    /// Interval in milliseconds between admission attempts.
    int poll_interval_ms = 1000;

    // ========== Phases ==========

    /// Wall-clock limit for one agent call. Default: 300000 ms (5 minutes)
    /// Can be set via --phase-timeout
    int phase_timeout_ms = 300000;

    /// Retries of a single phase before the workflow fails.
    /// Can be set via --max-retries
    int max_retries = 3;

    int retry_base_delay_ms = 1000;
    int retry_max_delay_ms = 60000;

    /// One of "exponential", "linear", "fixed"
    std::string backoff_strategy = "exponential";

    // ========== Circuit breakers ==========

    /// Consecutive failed calls to one agent role that open its circuit.
    /// Can be set via --circuit-threshold
    int circuit_failure_threshold = 5;

    /// How long an open circuit refuses calls before letting one through.
    int circuit_recovery_timeout_ms = 60000;

    // ========== Recovery and shutdown ==========

    /// RUNNING tasks with no live worker whose heartbeat is older than
    /// this are requeued, at startup and on every poll tick.
    int stale_threshold_ms = 60000;

    /// Bound on how long stop() waits for in-flight workers.
    int shutdown_timeout_ms = 30000;

    // ========== Storage ==========

    /// Retries of a failed tasks.json write/read
    int storage_retry_attempts = 3;
    int storage_retry_delay_ms = 50;

    // ========== Metrics ==========

    /// Number of recent workflow durations kept for percentiles
    int metrics_window = 100;

    // ========== Paths ==========

    /// Path to Unix domain socket for IPC.
    /// Format: /tmp/chimera_<username>.sock
    std::string socket_path;

    /// Directory for persistent data storage.
    /// Format: ~/.chimera/<hostname>/
    std::string data_dir;

    /// Directory for log files (empty if logging disabled).
    /// Set via --log command-line argument
    std::string log_dir;

    // ========== Logging ==========

    /// Set to true when --log argument is provided
    bool enable_logging = false;

    /// "debug", "info", "warn" or "error"
    std::string log_level = "info";

    // ========== Agents ==========

    /// Role name -> executable implementing that role's actions.
    /// Set via repeated --agent <role>=<path>
    std::map<std::string, std::string> agent_commands;

    // ========== Methods ==========

    /**
     * @brief Parse configuration from command-line arguments
     *
     * Supported arguments:
     * - --log <path>: Enable logging and set log directory
     * - --log-level <level>
     * - --max-concurrent <n>
     * - --phase-timeout <ms>
     * - --max-retries <n>
     * - --circuit-threshold <n>
     * - --agent <role>=<path>
     *
     * Also automatically sets:
     * - socket_path: /tmp/chimera_<username>.sock
     * - data_dir: ~/.chimera/<hostname>/
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Configured Config object
     */
    static Config fromArgs(int argc, char* argv[]);

    /**
     * @brief Serialize configuration to JSON string
     * @return JSON string representation
     */
    std::string toJson() const;

    /**
     * @brief Deserialize configuration from JSON string
     *
     * Missing keys keep their defaults.
     *
     * @param json JSON string to parse
     * @return Config object
     * @throws ChimeraException if JSON is invalid
     */
    static Config fromJson(const std::string& json);

    /**
     * @brief Check value ranges and names
     * @throws ChimeraException(CONFIG_INVALID) on the first bad field
     */
    void validate() const;

    /// Phase retry settings in RetryPolicy form
    RetryConfig phaseRetryConfig() const;

    /// Storage retry settings in RetryPolicy form
    RetryConfig storageRetryConfig() const;

    /// Settings for each agent role's CircuitBreaker
    CircuitBreakerConfig circuitBreakerConfig() const;

    /**
     * @brief Save configuration to file
     *
     * Saves to data_dir/config.json
     */
    void save() const;

    /**
     * @brief Load configuration from file
     *
     * Loads from data_dir/config.json if it exists.
     *
     * @param data_dir Directory containing config.json
     * @return Config object (default if file doesn't exist)
     */
    static Config load(const std::string& data_dir);

    bool operator==(const Config& other) const;
    bool operator!=(const Config& other) const {
        return !(*this == other);
    }

    /**
     * @brief Create directory recursively (like mkdir -p)
     * @return true if directory exists or was created successfully
     */
    static bool createDirectoryRecursive(const std::string& path);

private:
    /**
     * @brief Initialize default paths based on environment
     *
     * Sets socket_path and data_dir based on username and hostname.
     */
    void initDefaultPaths();

    static std::string getHostname();
    static std::string getUsername();
    static std::string getHomeDir();
};

} // namespace chimera

#endif // CHIMERA_CONFIG_H
