/**
 * @file test_circuit_breaker.cpp
 * @brief Unit tests for CircuitBreaker
 */

#include <gtest/gtest.h>
#include "chimera/circuit_breaker.h"
#include "chimera/errors.h"

#include <chrono>
#include <thread>

namespace chimera {
namespace testing {

namespace {

CircuitBreakerConfig quickConfig(int failures, int recovery_ms, int successes = 1) {
    CircuitBreakerConfig config;
    config.failure_threshold = failures;
    config.recovery_timeout_ms = recovery_ms;
    config.success_threshold = successes;
    return config;
}

} // anonymous namespace

TEST(CircuitBreakerTest, StartsClosedAndStaysClosedOnSuccess) {
    CircuitBreaker breaker("coder-agent", quickConfig(2, 1000));
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(breaker.allowRequest());
        breaker.recordSuccess();
    }
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker.retryAfter().count(), 0);
}

TEST(CircuitBreakerTest, ConsecutiveFailuresOpenTheCircuit) {
    CircuitBreaker breaker("coder-agent", quickConfig(3, 60000));

    breaker.recordFailure();
    breaker.recordFailure();
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);

    breaker.recordFailure();
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);
    EXPECT_FALSE(breaker.allowRequest());
    EXPECT_GT(breaker.retryAfter().count(), 0);
    EXPECT_LE(breaker.retryAfter().count(), 60000);
}

TEST(CircuitBreakerTest, SuccessBreaksTheFailureStreak) {
    CircuitBreaker breaker("tester-agent", quickConfig(2, 60000));

    breaker.recordFailure();
    breaker.recordSuccess();
    breaker.recordFailure();
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);

    breaker.recordFailure();
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);
}

TEST(CircuitBreakerTest, HalfOpenAfterRecoveryTimeout) {
    CircuitBreaker breaker("coder-agent", quickConfig(1, 50));

    breaker.recordFailure();
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    EXPECT_EQ(breaker.state(), CircuitState::HALF_OPEN);
    EXPECT_TRUE(breaker.allowRequest());
}

TEST(CircuitBreakerTest, HalfOpenSuccessCloses) {
    CircuitBreaker breaker("coder-agent", quickConfig(1, 30, 2));

    breaker.recordFailure();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    ASSERT_TRUE(breaker.allowRequest());

    breaker.recordSuccess();
    EXPECT_EQ(breaker.state(), CircuitState::HALF_OPEN);

    breaker.recordSuccess();
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
}

TEST(CircuitBreakerTest, HalfOpenFailureReopens) {
    CircuitBreaker breaker("coder-agent", quickConfig(3, 30));

    breaker.recordFailure();
    breaker.recordFailure();
    breaker.recordFailure();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    ASSERT_TRUE(breaker.allowRequest());
    ASSERT_EQ(breaker.state(), CircuitState::HALF_OPEN);

    // One failure is enough in half-open, regardless of the threshold
    breaker.recordFailure();
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);
    EXPECT_FALSE(breaker.allowRequest());
}

TEST(CircuitBreakerTest, MetricsReportRecentFailureRate) {
    CircuitBreaker breaker("reviewer-agent", quickConfig(5, 1000));

    breaker.recordSuccess();
    breaker.recordFailure();
    breaker.recordSuccess();

    nlohmann::json m = breaker.metrics();
    EXPECT_EQ(m["name"], "reviewer-agent");
    EXPECT_EQ(m["state"], "closed");
    EXPECT_EQ(m["total_calls"], 3);
    EXPECT_EQ(m["failure_count"], 1);
    EXPECT_EQ(m["consecutive_failures"], 0);
    EXPECT_EQ(m["recent_calls"], 3);
    EXPECT_NEAR(m["failure_rate"].get<double>(), 1.0 / 3.0, 1e-9);
}

TEST(CircuitBreakerTest, RefusedCallsAreCountedSeparately) {
    CircuitBreaker breaker("coder-agent", quickConfig(1, 60000));

    breaker.recordFailure();
    EXPECT_FALSE(breaker.allowRequest());
    EXPECT_FALSE(breaker.allowRequest());

    nlohmann::json m = breaker.metrics();
    EXPECT_EQ(m["state"], "open");
    EXPECT_EQ(m["rejected_calls"], 2);
    EXPECT_EQ(m["total_calls"], 1);
}

TEST(CircuitBreakerTest, WindowBoundsRecentCalls) {
    CircuitBreakerConfig config = quickConfig(100, 1000);
    config.window = 4;
    CircuitBreaker breaker("coder-agent", config);

    breaker.recordFailure();
    breaker.recordFailure();
    for (int i = 0; i < 4; ++i) {
        breaker.recordSuccess();
    }

    nlohmann::json m = breaker.metrics();
    EXPECT_EQ(m["recent_calls"], 4);
    EXPECT_DOUBLE_EQ(m["failure_rate"].get<double>(), 0.0);
    EXPECT_EQ(m["failure_count"], 2);
}

TEST(CircuitBreakerTest, ResetCloses) {
    CircuitBreaker breaker("coder-agent", quickConfig(1, 60000));
    breaker.recordFailure();
    ASSERT_EQ(breaker.state(), CircuitState::OPEN);

    breaker.reset();
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
    EXPECT_TRUE(breaker.allowRequest());
}

TEST(CircuitBreakerTest, StateNames) {
    EXPECT_EQ(circuitStateToString(CircuitState::CLOSED), "closed");
    EXPECT_EQ(circuitStateToString(CircuitState::OPEN), "open");
    EXPECT_EQ(circuitStateToString(CircuitState::HALF_OPEN), "half_open");
}

TEST(CircuitBreakerTest, InvalidConfigRejected) {
    try {
        CircuitBreaker breaker("coder-agent", quickConfig(0, 1000));
        FAIL() << "Expected ChimeraException";
    } catch (const ChimeraException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
    }

    EXPECT_THROW(quickConfig(1, -1).validate(), ChimeraException);
    EXPECT_THROW(quickConfig(1, 1000, 0).validate(), ChimeraException);

    CircuitBreakerConfig no_window = quickConfig(1, 1000);
    no_window.window = 0;
    EXPECT_THROW(no_window.validate(), ChimeraException);
}

} // namespace testing
} // namespace chimera
