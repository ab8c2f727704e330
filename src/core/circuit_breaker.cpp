/**
 * @file circuit_breaker.cpp
 * @brief Implementation of CircuitBreaker
 */

#include "chimera/circuit_breaker.h"
#include "chimera/errors.h"

#include <algorithm>

namespace chimera {

std::string circuitStateToString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half_open";
        default:                      return "unknown";
    }
}

void CircuitBreakerConfig::validate() const {
    if (failure_threshold < 1) {
        throw ChimeraException(ErrorCode::CONFIG_INVALID,
                               "circuit failure_threshold must be at least 1");
    }
    if (success_threshold < 1) {
        throw ChimeraException(ErrorCode::CONFIG_INVALID,
                               "circuit success_threshold must be at least 1");
    }
    if (recovery_timeout_ms < 0) {
        throw ChimeraException(ErrorCode::CONFIG_INVALID,
                               "circuit recovery_timeout_ms must not be negative");
    }
    if (window < 1) {
        throw ChimeraException(ErrorCode::CONFIG_INVALID,
                               "circuit window must be at least 1");
    }
}

namespace {

const CircuitBreakerConfig& validated(const CircuitBreakerConfig& config) {
    config.validate();
    return config;
}

} // anonymous namespace

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config)
    : name_(std::move(name)), config_(validated(config)) {}

CircuitState CircuitBreaker::stateLocked(Clock::time_point now) const {
    if (state_ == CircuitState::OPEN &&
        now - opened_at_ >= std::chrono::milliseconds(config_.recovery_timeout_ms)) {
        return CircuitState::HALF_OPEN;
    }
    return state_;
}

bool CircuitBreaker::allowRequest() {
    std::lock_guard<std::mutex> lock(mutex_);

    CircuitState current = stateLocked(Clock::now());
    if (current == CircuitState::OPEN) {
        ++rejected_calls_;
        return false;
    }
    if (current == CircuitState::HALF_OPEN && state_ == CircuitState::OPEN) {
        state_ = CircuitState::HALF_OPEN;
        half_open_successes_ = 0;
    }
    return true;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_calls_;
    pushRecent(false);
    consecutive_failures_ = 0;

    if (state_ == CircuitState::HALF_OPEN) {
        if (++half_open_successes_ >= config_.success_threshold) {
            state_ = CircuitState::CLOSED;
            half_open_successes_ = 0;
        }
    }
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    ++total_calls_;
    ++failure_count_;
    pushRecent(true);
    ++consecutive_failures_;

    CircuitState current = stateLocked(now);
    if (current == CircuitState::HALF_OPEN ||
        (current == CircuitState::CLOSED && consecutive_failures_ >= config_.failure_threshold)) {
        trip(now);
    } else if (current == CircuitState::OPEN) {
        // A call admitted before the trip failed late; restart the period
        opened_at_ = now;
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stateLocked(Clock::now());
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::CLOSED;
    consecutive_failures_ = 0;
    half_open_successes_ = 0;
}

std::chrono::milliseconds CircuitBreaker::retryAfter() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (stateLocked(now) != CircuitState::OPEN) {
        return std::chrono::milliseconds(0);
    }
    auto reopen = opened_at_ + std::chrono::milliseconds(config_.recovery_timeout_ms);
    return std::chrono::duration_cast<std::chrono::milliseconds>(reopen - now);
}

nlohmann::json CircuitBreaker::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t recent_failures = static_cast<size_t>(std::count(recent_.begin(), recent_.end(), true));
    double failure_rate = recent_.empty()
        ? 0.0
        : static_cast<double>(recent_failures) / static_cast<double>(recent_.size());

    nlohmann::json j;
    j["name"] = name_;
    j["state"] = circuitStateToString(stateLocked(Clock::now()));
    j["failure_count"] = failure_count_;
    j["consecutive_failures"] = consecutive_failures_;
    j["total_calls"] = total_calls_;
    j["rejected_calls"] = rejected_calls_;
    j["recent_calls"] = recent_.size();
    j["failure_rate"] = failure_rate;
    return j;
}

void CircuitBreaker::trip(Clock::time_point now) {
    state_ = CircuitState::OPEN;
    opened_at_ = now;
    half_open_successes_ = 0;
}

void CircuitBreaker::pushRecent(bool failed) {
    recent_.push_back(failed);
    while (recent_.size() > config_.window) {
        recent_.pop_front();
    }
}

} // namespace chimera
