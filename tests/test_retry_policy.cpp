/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for RetryPolicy
 */

#include <gtest/gtest.h>
#include "chimera/retry_policy.h"
#include "chimera/errors.h"

#include <stdexcept>

namespace chimera {
namespace testing {

namespace {

RetryConfig noJitter(BackoffStrategy strategy, int base, int max, int retries = 3) {
    RetryConfig config;
    config.strategy = strategy;
    config.base_delay_ms = base;
    config.max_delay_ms = max;
    config.max_retries = retries;
    config.jitter = false;
    return config;
}

} // anonymous namespace

TEST(RetryPolicyTest, ExponentialDoublesUntilCap) {
    RetryPolicy policy(noJitter(BackoffStrategy::EXPONENTIAL, 1000, 60000));
    EXPECT_EQ(policy.calculateDelay(1), 1000);
    EXPECT_EQ(policy.calculateDelay(2), 2000);
    EXPECT_EQ(policy.calculateDelay(3), 4000);
    EXPECT_EQ(policy.calculateDelay(6), 32000);
    EXPECT_EQ(policy.calculateDelay(7), 60000);
    EXPECT_EQ(policy.calculateDelay(100), 60000);
}

TEST(RetryPolicyTest, LinearAndFixed) {
    RetryPolicy linear(noJitter(BackoffStrategy::LINEAR, 200, 700));
    EXPECT_EQ(linear.calculateDelay(1), 200);
    EXPECT_EQ(linear.calculateDelay(3), 600);
    EXPECT_EQ(linear.calculateDelay(4), 700);

    RetryPolicy fixed(noJitter(BackoffStrategy::FIXED, 250, 1000));
    EXPECT_EQ(fixed.calculateDelay(1), 250);
    EXPECT_EQ(fixed.calculateDelay(9), 250);
}

TEST(RetryPolicyTest, AttemptBelowOneIsTreatedAsFirst) {
    RetryPolicy policy(noJitter(BackoffStrategy::EXPONENTIAL, 100, 1000));
    EXPECT_EQ(policy.calculateDelay(0), 100);
    EXPECT_EQ(policy.calculateDelay(-3), 100);
}

TEST(RetryPolicyTest, JitterStaysWithinTenPercent) {
    RetryConfig config = noJitter(BackoffStrategy::FIXED, 1000, 1000);
    config.jitter = true;
    RetryPolicy policy(config);

    for (int i = 0; i < 200; ++i) {
        int delay = policy.calculateDelay(1);
        EXPECT_GE(delay, 900);
        EXPECT_LE(delay, 1100);
    }
}

TEST(RetryPolicyTest, ExecuteRetriesUntilSuccess) {
    RetryPolicy policy(noJitter(BackoffStrategy::FIXED, 1, 1, 3));
    int calls = 0;

    int result = policy.execute([&calls] {
        if (++calls < 3) {
            throw StorageError("busy");
        }
        return 42;
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, ExecuteRethrowsAfterExhaustion) {
    RetryPolicy policy(noJitter(BackoffStrategy::FIXED, 1, 1, 2));
    int calls = 0;

    EXPECT_THROW(policy.execute([&calls]() -> int {
        ++calls;
        throw StorageError("disk gone");
    }), StorageError);
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, ExecuteStopsOnNonRetryable) {
    RetryPolicy policy(noJitter(BackoffStrategy::FIXED, 1, 1, 5));
    int calls = 0;

    auto only_storage = [](const std::exception& e) {
        return dynamic_cast<const StorageError*>(&e) != nullptr;
    };

    EXPECT_THROW(policy.execute([&calls]() -> int {
        ++calls;
        throw NotFoundError("t1");
    }, only_storage), NotFoundError);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, StrategyNames) {
    EXPECT_EQ(backoffStrategyFromString("linear"), BackoffStrategy::LINEAR);
    EXPECT_EQ(backoffStrategyToString(BackoffStrategy::EXPONENTIAL), "exponential");
    EXPECT_THROW(backoffStrategyFromString("random"), std::invalid_argument);
}

} // namespace testing
} // namespace chimera
