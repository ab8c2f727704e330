/**
 * @file retry_policy.cpp
 * @brief Implementation of RetryPolicy
 */

#include "chimera/retry_policy.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace chimera {

std::string backoffStrategyToString(BackoffStrategy strategy) {
    switch (strategy) {
        case BackoffStrategy::EXPONENTIAL: return "exponential";
        case BackoffStrategy::LINEAR:      return "linear";
        case BackoffStrategy::FIXED:       return "fixed";
        default:                           return "unknown";
    }
}

BackoffStrategy backoffStrategyFromString(const std::string& str) {
    std::string lower;
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "exponential") return BackoffStrategy::EXPONENTIAL;
    if (lower == "linear")      return BackoffStrategy::LINEAR;
    if (lower == "fixed")       return BackoffStrategy::FIXED;
    throw std::invalid_argument("Unknown backoff strategy: " + str);
}

RetryPolicy::RetryPolicy(RetryConfig config)
    : config_(config), rng_(std::random_device{}()) {}

int RetryPolicy::calculateDelay(int attempt) const {
    if (attempt < 1) {
        attempt = 1;
    }

    double delay = 0.0;
    switch (config_.strategy) {
        case BackoffStrategy::EXPONENTIAL: {
            // Cap the exponent; the max_delay_ms clamp below dominates long before
            int exponent = std::min(attempt - 1, 30);
            delay = static_cast<double>(config_.base_delay_ms) * static_cast<double>(1LL << exponent);
            break;
        }
        case BackoffStrategy::LINEAR:
            delay = static_cast<double>(config_.base_delay_ms) * attempt;
            break;
        case BackoffStrategy::FIXED:
            delay = static_cast<double>(config_.base_delay_ms);
            break;
    }

    delay = std::min(delay, static_cast<double>(config_.max_delay_ms));

    if (config_.jitter && delay > 0.0) {
        std::uniform_real_distribution<double> spread(-0.1, 0.1);
        double factor;
        {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            factor = spread(rng_);
        }
        delay += delay * factor;
    }

    return std::max(0, static_cast<int>(delay));
}

} // namespace chimera
