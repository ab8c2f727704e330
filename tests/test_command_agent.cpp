/**
 * @file test_command_agent.cpp
 * @brief Unit tests for CommandAgent (external executable agents)
 */

#include <gtest/gtest.h>
#include "chimera/command_agent.h"
#include "chimera/errors.h"
#include "chimera/phase_driver.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace chimera {
namespace testing {

class CommandAgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = "/tmp/chimera_agent_test_" + std::to_string(getpid());
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::string writeScript(const std::string& name, const std::string& body) {
        std::string path = test_dir_ + "/" + name;
        std::ofstream file(path);
        file << "#!/bin/bash\n" << body;
        file.close();
        chmod(path.c_str(), 0755);
        return path;
    }

    std::string test_dir_;
};

TEST_F(CommandAgentTest, RunProcessCapturesOutputAndExitCode) {
    std::string script = writeScript("echo.sh",
        "cat\n"
        "echo \"warn: $CHIMERA_ROLE\" >&2\n"
        "exit 3\n");

    auto result = CommandAgent::runProcess({script}, "hello",
                                           {{"CHIMERA_ROLE", "coder-agent"}},
                                           std::chrono::milliseconds(5000));

    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.signaled);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_data, "hello");
    EXPECT_EQ(result.stderr_data, "warn: coder-agent\n");
}

TEST_F(CommandAgentTest, RunProcessKillsOnTimeout) {
    std::string script = writeScript("hang.sh", "sleep 30\n");

    auto start = std::chrono::steady_clock::now();
    auto result = CommandAgent::runProcess({script}, "", {}, std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(CommandAgentTest, CallPassesActionAndParams) {
    std::string script = writeScript("coder.sh",
        "input=$(cat)\n"
        "echo \"{\\\"status\\\": \\\"success\\\", \\\"action\\\": \\\"$1\\\", "
        "\\\"role\\\": \\\"$CHIMERA_ROLE\\\", \\\"env_action\\\": \\\"$CHIMERA_ACTION\\\", "
        "\\\"params\\\": $input}\"\n");

    CommandAgent agent(roles::CODER, script, std::chrono::milliseconds(5000));
    auto result = agent.call("implement_feature", {{"feature", "login"}});

    EXPECT_EQ(result["status"], "success");
    EXPECT_EQ(result["action"], "implement_feature");
    EXPECT_EQ(result["role"], "coder-agent");
    EXPECT_EQ(result["env_action"], "implement_feature");
    EXPECT_EQ(result["params"]["feature"], "login");
}

TEST_F(CommandAgentTest, CallReportsFailures) {
    std::string failing = writeScript("fail.sh", "echo boom >&2\nexit 1\n");
    CommandAgent failing_agent("coder-agent", failing, std::chrono::milliseconds(5000));
    try {
        failing_agent.call("implement_feature", {});
        FAIL() << "expected AgentError";
    } catch (const AgentError& e) {
        EXPECT_NE(e.message().find("exited with code 1"), std::string::npos);
        EXPECT_NE(e.message().find("boom"), std::string::npos);
    }

    std::string garbage = writeScript("garbage.sh", "echo 'not json'\n");
    CommandAgent garbage_agent("coder-agent", garbage, std::chrono::milliseconds(5000));
    EXPECT_THROW(garbage_agent.call("implement_feature", {}), AgentError);

    std::string array = writeScript("array.sh", "echo '[1, 2]'\n");
    CommandAgent array_agent("coder-agent", array, std::chrono::milliseconds(5000));
    EXPECT_THROW(array_agent.call("implement_feature", {}), AgentError);

    std::string slow = writeScript("slow.sh", "sleep 30\n");
    CommandAgent slow_agent("coder-agent", slow, std::chrono::milliseconds(200));
    EXPECT_THROW(slow_agent.call("implement_feature", {}), PhaseTimeoutError);
}

TEST_F(CommandAgentTest, CapabilityRunsAsynchronously) {
    std::string script = writeScript("deploy.sh",
        "cat > /dev/null\n"
        "echo '{\"status\": \"success\", \"staging_url\": \"https://staging.test\"}'\n");

    auto agent = std::make_shared<CommandAgent>(roles::DEPLOYMENT, script,
                                                std::chrono::milliseconds(5000));
    AgentCapability capability = agent->capability("deploy_to_staging");
    agent.reset();  // the capability keeps the agent alive

    auto future = capability({{"commit_sha", "abc"}});
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(future.get()["staging_url"], "https://staging.test");
}

TEST_F(CommandAgentTest, RegisterAllBindsPipelineActionsPerRole) {
    std::string script = writeScript("agent.sh", "echo '{}'\n");
    AgentRegistry registry;

    size_t bound = CommandAgent::registerAll(
        registry,
        {{roles::E2E_TESTER, script}, {roles::GUARDIAN, script}, {"poet-agent", script}},
        std::chrono::milliseconds(1000));

    EXPECT_EQ(bound, 3u);
    EXPECT_TRUE(registry.has(roles::E2E_TESTER, "generate_test"));
    EXPECT_TRUE(registry.has(roles::E2E_TESTER, "execute_test"));
    EXPECT_TRUE(registry.has(roles::GUARDIAN, "review_pr"));
    EXPECT_FALSE(registry.has(roles::CODER, "implement_feature"));
    EXPECT_TRUE(registry.actions("poet-agent").empty());
}

TEST_F(CommandAgentTest, RegisterAllRejectsMissingExecutable) {
    AgentRegistry registry;
    try {
        CommandAgent::registerAll(registry, {{roles::CODER, test_dir_ + "/missing.sh"}},
                                  std::chrono::milliseconds(1000));
        FAIL() << "expected CONFIG_INVALID";
    } catch (const ChimeraException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
    }
    EXPECT_EQ(registry.size(), 0u);
}

} // namespace testing
} // namespace chimera
