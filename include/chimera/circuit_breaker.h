/**
 * @file circuit_breaker.h
 * @brief Failure gate in front of one agent role
 *
 * After failure_threshold consecutive failed calls the circuit opens and
 * calls are refused without reaching the agent. Once recovery_timeout_ms
 * has passed since the last failure the circuit is half-open: calls go
 * through again, success_threshold successes close it, and a single
 * failure opens it for another recovery period.
 */

#ifndef CHIMERA_CIRCUIT_BREAKER_H
#define CHIMERA_CIRCUIT_BREAKER_H

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace chimera {

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

/// "closed", "open" or "half_open"
std::string circuitStateToString(CircuitState state);

struct CircuitBreakerConfig {
    /// Consecutive failures that open a closed circuit
    int failure_threshold = 5;

    /// Half-open successes needed to close again
    int success_threshold = 1;

    int recovery_timeout_ms = 60000;

    /// Recent calls kept for failure_rate
    size_t window = 100;

    /**
     * @throws ChimeraException(CONFIG_INVALID) on a non-positive threshold
     *         or window, or a negative timeout
     */
    void validate() const;
};

/**
 * @brief Per-role circuit breaker
 *
 * Callers ask allowRequest() before a call and report the result with
 * recordSuccess() or recordFailure(). Thread-safe.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    /// @throws ChimeraException(CONFIG_INVALID) if config is invalid
    explicit CircuitBreaker(std::string name,
                            CircuitBreakerConfig config = CircuitBreakerConfig());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Whether a call may proceed now
     *
     * Moves an open circuit to HALF_OPEN once the recovery timeout has
     * elapsed. A refused call is counted in the metrics but not in the
     * failure rate.
     */
    bool allowRequest();

    void recordSuccess();
    void recordFailure();

    /// Current state; an expired OPEN reports HALF_OPEN
    CircuitState state() const;

    /// Back to CLOSED with the failure streak cleared
    void reset();

    /// Time left before an open circuit lets calls through again
    std::chrono::milliseconds retryAfter() const;

    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }

    /**
     * @brief Monitoring snapshot
     *
     * Keys: name, state, failure_count, consecutive_failures,
     * total_calls, rejected_calls, recent_calls, failure_rate.
     */
    nlohmann::json metrics() const;

private:
    CircuitState stateLocked(Clock::time_point now) const;
    void trip(Clock::time_point now);
    void pushRecent(bool failed);

    const std::string name_;
    const CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    Clock::time_point opened_at_;
    int consecutive_failures_ = 0;
    int half_open_successes_ = 0;
    uint64_t total_calls_ = 0;
    uint64_t failure_count_ = 0;
    uint64_t rejected_calls_ = 0;
    std::deque<bool> recent_;
};

} // namespace chimera

#endif // CHIMERA_CIRCUIT_BREAKER_H
