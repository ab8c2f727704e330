/**
 * @file test_ipc_client.cpp
 * @brief Unit tests for IPCClient class
 *
 * The client talks to an IPCServer with a scripted handler so each
 * response shape can be controlled.
 */

#include <gtest/gtest.h>
#include "chimera/ipc_client.h"
#include "chimera/ipc_server.h"
#include "chimera/errors.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <unistd.h>

namespace chimera {
namespace testing {

namespace {

WorkflowTask sampleTask(const std::string& id) {
    WorkflowTask task;
    task.id = id;
    task.feature_description = "feature-" + id;
    task.target_url = "https://app.example.test";
    return task;
}

} // anonymous namespace

class IPCClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket_path_ = "/tmp/chimera_test_client_" +
                       std::to_string(getpid()) + "_" +
                       std::to_string(test_counter_++) + ".sock";
        std::filesystem::remove(socket_path_);
    }

    void TearDown() override {
        std::filesystem::remove(socket_path_);
    }

    std::string socket_path_;
    static int test_counter_;
};

int IPCClientTest::test_counter_ = 0;

TEST_F(IPCClientTest, Construction) {
    IPCClient client(socket_path_);
    EXPECT_EQ(client.socketPath(), socket_path_);
    EXPECT_FALSE(client.isConnected());
}

TEST_F(IPCClientTest, ConnectWithoutServer) {
    IPCClient client(socket_path_);
    EXPECT_FALSE(client.connect());
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(client.lastError(), "Server is not running");
    EXPECT_EQ(client.lastErrorCode(), static_cast<int>(ErrorCode::IPC_SERVER_NOT_RUNNING));
}

TEST_F(IPCClientTest, RequestsWithoutConnection) {
    IPCClient client(socket_path_);

    EnqueueRequest req;
    req.task_id = "wf-1";
    EXPECT_FALSE(client.enqueue(req).has_value());
    EXPECT_EQ(client.lastError(), "Not connected to server");
    EXPECT_FALSE(client.getTask("wf-1").has_value());
    EXPECT_FALSE(client.listTasks().has_value());
    EXPECT_FALSE(client.getMetrics().has_value());
    EXPECT_FALSE(client.getHealth().has_value());
    EXPECT_FALSE(client.shutdown());
}

TEST_F(IPCClientTest, EnqueueSendsRequestAndParsesTask) {
    IPCServer server(socket_path_);
    server.start([](MsgType type, const std::string& payload) {
        EXPECT_EQ(type, MsgType::ENQUEUE);
        EnqueueRequest req = EnqueueRequest::fromJson(payload);
        WorkflowTask task = sampleTask(req.task_id);
        task.feature_description = req.feature_description;
        task.priority = req.priority;
        return task.toJson();
    });

    IPCClient client(socket_path_);
    ASSERT_TRUE(client.connect());

    EnqueueRequest req;
    req.task_id = "wf-7";
    req.feature_description = "dark mode";
    req.target_url = "https://app.example.test";
    req.priority = 3;

    auto task = client.enqueue(req);
    ASSERT_TRUE(task.has_value()) << client.lastError();
    EXPECT_EQ(task->id, "wf-7");
    EXPECT_EQ(task->feature_description, "dark mode");
    EXPECT_EQ(task->priority, 3);
    EXPECT_EQ(task->status, TaskStatus::QUEUED);

    client.disconnect();
    server.stop();
}

TEST_F(IPCClientTest, ServerErrorCarriesCode) {
    IPCServer server(socket_path_);
    server.start([](MsgType, const std::string& payload) -> std::string {
        throw NotFoundError(TaskRequest::fromJson(payload).task_id);
    });

    IPCClient client(socket_path_);
    ASSERT_TRUE(client.connect());

    EXPECT_FALSE(client.getTask("ghost").has_value());
    EXPECT_EQ(client.lastErrorCode(), static_cast<int>(ErrorCode::TASK_NOT_FOUND));
    EXPECT_NE(client.lastError().find("ghost"), std::string::npos);

    // Still usable after an error reply
    EXPECT_TRUE(client.isConnected());

    client.disconnect();
    server.stop();
}

TEST_F(IPCClientTest, ListMetricsAndHealth) {
    IPCServer server(socket_path_);
    server.start([](MsgType type, const std::string& payload) {
        switch (type) {
            case MsgType::LIST_TASKS: {
                ListRequest req = ListRequest::fromJson(payload);
                TaskListResponse resp;
                resp.tasks.push_back(sampleTask("a"));
                if (req.include_finished) {
                    resp.tasks.push_back(sampleTask("b"));
                }
                return resp.toJson();
            }
            case MsgType::GET_METRICS: {
                PoolMetrics m;
                m.pool_size = 4;
                m.total_workflows_processed = 9;
                return m.toJson().dump();
            }
            case MsgType::GET_HEALTH:
                return std::string(R"({"status": "warning", "alerts": [], "recommendations": []})");
            default:
                return std::string("{}");
        }
    });

    IPCClient client(socket_path_);
    ASSERT_TRUE(client.connect());

    auto active = client.listTasks();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->size(), 1u);

    ListRequest all;
    all.include_finished = true;
    auto everything = client.listTasks(all);
    ASSERT_TRUE(everything.has_value());
    EXPECT_EQ(everything->size(), 2u);

    auto metrics = client.getMetrics();
    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ(metrics->pool_size, 4);
    EXPECT_EQ(metrics->total_workflows_processed, 9u);

    auto health = client.getHealth();
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ((*health)["status"], "warning");

    client.disconnect();
    server.stop();
}

TEST_F(IPCClientTest, MalformedResponsesReported) {
    IPCServer server(socket_path_);
    server.start([](MsgType type, const std::string&) {
        if (type == MsgType::GET_HEALTH) {
            return std::string("[1, 2, 3]");
        }
        return std::string(R"({"unexpected": true})");
    });

    IPCClient client(socket_path_);
    ASSERT_TRUE(client.connect());

    EXPECT_FALSE(client.getTask("wf-1").has_value());
    EXPECT_EQ(client.lastError().rfind("Failed to parse response", 0), 0u);

    EXPECT_FALSE(client.listTasks().has_value());
    EXPECT_FALSE(client.getHealth().has_value());

    client.disconnect();
    server.stop();
}

TEST_F(IPCClientTest, Reconnect) {
    IPCServer server(socket_path_);
    server.start([](MsgType, const std::string&) {
        return TaskListResponse().toJson();
    });

    IPCClient client(socket_path_);
    ASSERT_TRUE(client.connect());
    EXPECT_TRUE(client.listTasks().has_value());
    client.disconnect();
    EXPECT_FALSE(client.isConnected());

    ASSERT_TRUE(client.connect());
    EXPECT_TRUE(client.listTasks().has_value());
    client.disconnect();

    server.stop();
}

TEST_F(IPCClientTest, MoveSemantics) {
    IPCServer server(socket_path_);
    server.start([](MsgType, const std::string&) { return std::string("{}"); });

    IPCClient first(socket_path_);
    ASSERT_TRUE(first.connect());

    IPCClient second(std::move(first));
    EXPECT_TRUE(second.isConnected());
    EXPECT_EQ(second.socketPath(), socket_path_);

    IPCClient third(socket_path_);
    third = std::move(second);
    EXPECT_TRUE(third.isConnected());
    EXPECT_TRUE(third.shutdown());

    third.disconnect();
    server.stop();
}

TEST_F(IPCClientTest, ShutdownRequest) {
    std::atomic<bool> shutdown_received{false};

    IPCServer server(socket_path_);
    server.start([&shutdown_received](MsgType type, const std::string&) {
        if (type == MsgType::SHUTDOWN) {
            shutdown_received = true;
        }
        return std::string(R"({"success": true})");
    });

    IPCClient client(socket_path_);
    ASSERT_TRUE(client.connect());
    EXPECT_TRUE(client.shutdown());
    EXPECT_TRUE(shutdown_received.load());

    client.disconnect();
    server.stop();
}

} // namespace testing
} // namespace chimera
