/**
 * @file test_config.cpp
 * @brief Unit tests for Config class
 *
 * Tests command-line argument parsing, validation, JSON
 * serialization/deserialization, and path initialization.
 */

#include "chimera/config.h"
#include "chimera/errors.h"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace chimera {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Save original environment
        const char* home = std::getenv("HOME");
        original_home_ = home ? home : "";
        test_dir_ = "/tmp/chimera_config_test_" + std::to_string(getpid());
        std::filesystem::remove_all(test_dir_);
    }

    void TearDown() override {
        // Restore original environment
        if (!original_home_.empty()) {
            setenv("HOME", original_home_.c_str(), 1);
        }
        std::filesystem::remove_all(test_dir_);
    }

    std::string original_home_;
    std::string test_dir_;
};

// ========== Default Values Tests ==========

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.max_concurrent, 3);
    EXPECT_EQ(config.poll_interval_ms, 1000);
    EXPECT_EQ(config.phase_timeout_ms, 300000);
    EXPECT_EQ(config.max_retries, 3);
    EXPECT_EQ(config.retry_base_delay_ms, 1000);
    EXPECT_EQ(config.retry_max_delay_ms, 60000);
    EXPECT_EQ(config.backoff_strategy, "exponential");
    EXPECT_EQ(config.stale_threshold_ms, 60000);
    EXPECT_EQ(config.metrics_window, 100);
    EXPECT_EQ(config.circuit_failure_threshold, 5);
    EXPECT_EQ(config.circuit_recovery_timeout_ms, 60000);

    EXPECT_FALSE(config.enable_logging);
    EXPECT_TRUE(config.log_dir.empty());
    EXPECT_TRUE(config.agent_commands.empty());

    EXPECT_NO_THROW(config.validate());
}

// ========== Command Line Parsing Tests ==========

TEST_F(ConfigTest, FromArgsSetsDefaultPaths) {
    setenv("HOME", "/home/tester", 1);
    char* argv[] = {const_cast<char*>("chimera"), const_cast<char*>("server")};

    Config config = Config::fromArgs(2, argv);

    // Socket path should be /tmp/chimera_<username>.sock
    EXPECT_EQ(config.socket_path.find("/tmp/chimera_"), 0u);
    EXPECT_EQ(config.socket_path.substr(config.socket_path.size() - 5), ".sock");

    // Data dir should be ~/.chimera/<hostname>
    EXPECT_EQ(config.data_dir.find("/home/tester/.chimera/"), 0u);
}

TEST_F(ConfigTest, FromArgsParsesOptions) {
    setenv("HOME", "/home/tester", 1);
    char* argv[] = {
        const_cast<char*>("chimera"),
        const_cast<char*>("server"),
        const_cast<char*>("--log"),
        const_cast<char*>("~/logs"),
        const_cast<char*>("--log-level"),
        const_cast<char*>("debug"),
        const_cast<char*>("--max-concurrent"),
        const_cast<char*>("5"),
        const_cast<char*>("--phase-timeout"),
        const_cast<char*>("1500"),
        const_cast<char*>("--max-retries"),
        const_cast<char*>("1"),
        const_cast<char*>("--circuit-threshold"),
        const_cast<char*>("2"),
        const_cast<char*>("--socket"),
        const_cast<char*>("/tmp/custom.sock"),
        const_cast<char*>("--agent"),
        const_cast<char*>("coder-agent=/opt/agents/coder"),
        const_cast<char*>("--foreground"),
    };

    Config config = Config::fromArgs(19, argv);

    EXPECT_TRUE(config.enable_logging);
    EXPECT_EQ(config.log_dir, "/home/tester/logs");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.max_concurrent, 5);
    EXPECT_EQ(config.phase_timeout_ms, 1500);
    EXPECT_EQ(config.max_retries, 1);
    EXPECT_EQ(config.circuit_failure_threshold, 2);
    EXPECT_EQ(config.socket_path, "/tmp/custom.sock");
    ASSERT_EQ(config.agent_commands.size(), 1u);
    EXPECT_EQ(config.agent_commands.at("coder-agent"), "/opt/agents/coder");
}

TEST_F(ConfigTest, FromArgsIgnoresMalformedValues) {
    char* argv[] = {
        const_cast<char*>("chimera"),
        const_cast<char*>("--max-concurrent"),
        const_cast<char*>("lots"),
        const_cast<char*>("--agent"),
        const_cast<char*>("no-equals-sign"),
    };

    Config config = Config::fromArgs(5, argv);

    EXPECT_EQ(config.max_concurrent, 3);
    EXPECT_TRUE(config.agent_commands.empty());
}

// ========== Validation Tests ==========

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    auto expectInvalid = [](const Config& config) {
        try {
            config.validate();
            FAIL() << "expected CONFIG_INVALID";
        } catch (const ChimeraException& e) {
            EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
        }
    };

    Config config;
    config.max_concurrent = 0;
    expectInvalid(config);

    config = Config();
    config.phase_timeout_ms = 0;
    expectInvalid(config);

    config = Config();
    config.max_retries = -1;
    expectInvalid(config);

    config = Config();
    config.retry_base_delay_ms = 5000;
    config.retry_max_delay_ms = 1000;
    expectInvalid(config);

    config = Config();
    config.backoff_strategy = "random";
    expectInvalid(config);

    config = Config();
    config.log_level = "chatty";
    expectInvalid(config);

    config = Config();
    config.metrics_window = 0;
    expectInvalid(config);

    config = Config();
    config.circuit_failure_threshold = 0;
    expectInvalid(config);

    config = Config();
    config.circuit_recovery_timeout_ms = -1;
    expectInvalid(config);
}

TEST_F(ConfigTest, RetryConfigsFollowSettings) {
    Config config;
    config.max_retries = 2;
    config.retry_base_delay_ms = 10;
    config.retry_max_delay_ms = 80;
    config.backoff_strategy = "linear";

    RetryConfig phase = config.phaseRetryConfig();
    EXPECT_EQ(phase.max_retries, 2);
    EXPECT_EQ(phase.base_delay_ms, 10);
    EXPECT_EQ(phase.max_delay_ms, 80);
    EXPECT_EQ(phase.strategy, BackoffStrategy::LINEAR);

    RetryConfig storage = config.storageRetryConfig();
    EXPECT_EQ(storage.max_retries, config.storage_retry_attempts);
    EXPECT_EQ(storage.base_delay_ms, config.storage_retry_delay_ms);
}

TEST_F(ConfigTest, CircuitBreakerConfigFollowsSettings) {
    Config config;
    config.circuit_failure_threshold = 4;
    config.circuit_recovery_timeout_ms = 2500;

    CircuitBreakerConfig circuit = config.circuitBreakerConfig();
    EXPECT_EQ(circuit.failure_threshold, 4);
    EXPECT_EQ(circuit.recovery_timeout_ms, 2500);
    EXPECT_NO_THROW(circuit.validate());
}

// ========== JSON Serialization Tests ==========

TEST_F(ConfigTest, JsonRoundTrip) {
    Config original;
    original.max_concurrent = 7;
    original.phase_timeout_ms = 42000;
    original.backoff_strategy = "fixed";
    original.socket_path = "/tmp/roundtrip.sock";
    original.data_dir = "/tmp/roundtrip";
    original.enable_logging = true;
    original.log_dir = "/tmp/roundtrip/logs";
    original.circuit_failure_threshold = 8;
    original.circuit_recovery_timeout_ms = 1234;
    original.agent_commands = {{"coder-agent", "/opt/coder"}, {"guardian-agent", "/opt/guardian"}};

    Config restored = Config::fromJson(original.toJson());
    EXPECT_EQ(restored, original);
}

TEST_F(ConfigTest, FromJsonKeepsDefaultsForMissingKeys) {
    Config config = Config::fromJson(R"({"max_concurrent": 9})");
    EXPECT_EQ(config.max_concurrent, 9);
    EXPECT_EQ(config.max_retries, 3);
    EXPECT_EQ(config.backoff_strategy, "exponential");
    EXPECT_EQ(config.circuit_failure_threshold, 5);
}

TEST_F(ConfigTest, FromJsonRejectsInvalidJson) {
    EXPECT_THROW(Config::fromJson("{max_concurrent:"), ChimeraException);
    EXPECT_THROW(Config::fromJson(R"({"max_concurrent": "three"})"), ChimeraException);
}

// ========== File Persistence Tests ==========

TEST_F(ConfigTest, SaveAndLoad) {
    Config config;
    config.data_dir = test_dir_ + "/data";
    config.max_concurrent = 4;
    config.agent_commands["deployment-agent"] = "/opt/deploy";

    ASSERT_TRUE(Config::createDirectoryRecursive(config.data_dir));
    config.save();

    Config loaded = Config::load(config.data_dir);
    EXPECT_EQ(loaded.max_concurrent, 4);
    EXPECT_EQ(loaded.agent_commands.at("deployment-agent"), "/opt/deploy");
}

TEST_F(ConfigTest, CreateDirectoryRecursive) {
    std::string nested = test_dir_ + "/a/b/c";
    EXPECT_TRUE(Config::createDirectoryRecursive(nested));

    struct stat st;
    ASSERT_EQ(stat(nested.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));

    // Existing directory is fine
    EXPECT_TRUE(Config::createDirectoryRecursive(nested));
    EXPECT_FALSE(Config::createDirectoryRecursive(""));
}

} // anonymous namespace
} // namespace chimera
