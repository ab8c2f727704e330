/**
 * @file retry_policy.h
 * @brief Backoff computation and retry loop for transient failures
 *
 * Used by the task queue for storage I/O and by the executor pool for
 * phase retries.
 */

#ifndef CHIMERA_RETRY_POLICY_H
#define CHIMERA_RETRY_POLICY_H

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace chimera {

/**
 * @brief How the delay grows between attempts
 */
enum class BackoffStrategy {
    EXPONENTIAL,  ///< base * 2^(attempt-1)
    LINEAR,       ///< base * attempt
    FIXED         ///< base
};

std::string backoffStrategyToString(BackoffStrategy strategy);

/**
 * @brief Parse a strategy name ("exponential", "linear", "fixed")
 * @throws std::invalid_argument if the name is not recognized
 */
BackoffStrategy backoffStrategyFromString(const std::string& str);

/**
 * @brief Retry parameters
 */
struct RetryConfig {
    /// Retries after the first attempt (0 = try once)
    int max_retries = 3;

    int base_delay_ms = 1000;

    /// Upper bound applied before jitter
    int max_delay_ms = 60000;

    BackoffStrategy strategy = BackoffStrategy::EXPONENTIAL;

    /// Spread each delay by a random +/-10%
    bool jitter = true;
};

/**
 * @brief Computes backoff delays and runs callables with retries
 *
 * Thread-safe.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = RetryConfig());

    const RetryConfig& config() const { return config_; }

    /**
     * @brief Delay before the given retry
     * @param attempt 1 for the first retry, 2 for the second, ...
     * @return Delay in milliseconds, never negative
     */
    int calculateDelay(int attempt) const;

    /**
     * @brief Run fn, retrying on exceptions accepted by is_retryable
     *
     * The last exception is rethrown once retries are exhausted, or
     * immediately when is_retryable rejects it.
     *
     * @param fn Callable to run
     * @param is_retryable Filter over the caught exception (null = retry all)
     * @return Whatever fn returns
     */
    template <typename Fn>
    auto execute(Fn&& fn,
                 const std::function<bool(const std::exception&)>& is_retryable = nullptr)
        -> decltype(fn()) {
        for (int attempt = 0;; ++attempt) {
            try {
                return fn();
            } catch (const std::exception& e) {
                if (attempt >= config_.max_retries) {
                    throw;
                }
                if (is_retryable && !is_retryable(e)) {
                    throw;
                }
            }
            std::this_thread::sleep_for(
                std::chrono::milliseconds(calculateDelay(attempt + 1)));
        }
    }

private:
    RetryConfig config_;
    mutable std::mutex rng_mutex_;
    mutable std::mt19937 rng_;
};

} // namespace chimera

#endif // CHIMERA_RETRY_POLICY_H
