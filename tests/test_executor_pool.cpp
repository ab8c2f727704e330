/**
 * @file test_executor_pool.cpp
 * @brief Integration tests for ExecutorPool
 *
 * Runs whole workflows through an in-memory TaskQueue, the real
 * PhaseDriver and in-process agents.
 */

#include <gtest/gtest.h>
#include "chimera/executor_pool.h"
#include "chimera/errors.h"
#include "fake_agents.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <tuple>
#include <unistd.h>
#include <vector>

namespace chimera {
namespace testing {

class ExecutorPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.max_concurrent = 3;
        config_.poll_interval_ms = 20;
        config_.phase_timeout_ms = 2000;
        config_.max_retries = 3;
        config_.retry_base_delay_ms = 5;
        config_.retry_max_delay_ms = 20;
        config_.stale_threshold_ms = 60000;
        config_.shutdown_timeout_ms = 5000;

        queue_ = std::make_unique<TaskQueue>();
        registry_ = std::make_unique<AgentRegistry>();
        dead_letters_ = std::make_unique<DeadLetterQueue>();

        static int counter = 0;
        test_dir_ = "/tmp/chimera_pool_test_" + std::to_string(getpid()) + "_" +
                    std::to_string(counter++);
        std::filesystem::remove_all(test_dir_);
    }

    void TearDown() override {
        // Pool first: its workers reference the queue and driver
        pool_.reset();
        driver_.reset();
        dead_letters_.reset();
        registry_.reset();
        queue_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    /// Replace the queue with a fresh instance over test_dir_
    void openPersistentQueue() {
        queue_ = std::make_unique<TaskQueue>(test_dir_);
        queue_->initialize();
    }

    void createPool() {
        driver_ = std::make_unique<PhaseDriver>(*registry_,
                                                std::chrono::milliseconds(config_.phase_timeout_ms));
        pool_ = std::make_unique<ExecutorPool>(*queue_, *driver_, config_, nullptr,
                                               dead_letters_.get());
    }

    WorkflowTask add(const std::string& id, int priority = 0) {
        return queue_->enqueue(id, "feature-" + id, "https://app.example.test", priority);
    }

    static bool waitFor(const std::function<bool()>& condition,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return condition();
    }

    bool waitTerminal(const std::string& id) {
        return waitFor([this, &id] { return queue_->get(id).isTerminal(); });
    }

    std::string test_dir_;
    Config config_;
    std::unique_ptr<TaskQueue> queue_;
    std::unique_ptr<AgentRegistry> registry_;
    std::unique_ptr<PhaseDriver> driver_;
    std::unique_ptr<DeadLetterQueue> dead_letters_;
    std::unique_ptr<ExecutorPool> pool_;
};

TEST_F(ExecutorPoolTest, InvalidConfigIsRejected) {
    config_.max_concurrent = 0;
    try {
        createPool();
        FAIL() << "expected CONFIG_INVALID";
    } catch (const ChimeraException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
    }
}

TEST_F(ExecutorPoolTest, HappyPathCompletesWorkflow) {
    registerFakeAgents(*registry_);
    createPool();
    add("wf-1");

    pool_->start();
    EXPECT_TRUE(pool_->isRunning());
    ASSERT_TRUE(waitTerminal("wf-1"));

    WorkflowTask task = queue_->get("wf-1");
    EXPECT_EQ(task.status, TaskStatus::COMPLETED);
    EXPECT_EQ(task.current_phase, ChimeraPhase::COMPLETE);
    EXPECT_EQ(task.workflow_context["test_path"], "tests/feature-wf-1.spec.ts");
    EXPECT_EQ(task.workflow_context["pr_id"], "PR-7");
    EXPECT_EQ(task.workflow_context["review_decision"], "approved");
    EXPECT_EQ(task.workflow_context["staging_url"], "https://staging.example.test");
    EXPECT_EQ(task.workflow_context["validation_status"], "passed");

    ASSERT_TRUE(waitFor([this] { return pool_->activeCount() == 0; }));
    PoolMetrics m = pool_->getMetrics();
    EXPECT_EQ(m.total_workflows_processed, 1u);
    EXPECT_EQ(m.total_workflows_succeeded, 1u);
    EXPECT_DOUBLE_EQ(m.success_rate, 1.0);
    EXPECT_GT(m.avg_workflow_duration_ms, 0.0);

    pool_->stop();
    EXPECT_FALSE(pool_->isRunning());
}

TEST_F(ExecutorPoolTest, RejectedReviewFailsWithoutRetry) {
    FakeAgentOptions opts;
    opts.review_decision = "rejected";
    auto stats = registerFakeAgents(*registry_, opts);
    createPool();
    add("wf-1");

    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));

    WorkflowTask task = queue_->get("wf-1");
    EXPECT_EQ(task.status, TaskStatus::FAILED);
    EXPECT_EQ(task.current_phase, ChimeraPhase::FAILED);
    EXPECT_EQ(task.workflow_context["review_decision"], "rejected");
    EXPECT_EQ(task.workflow_context["failed_phase"], "REVIEW");
    EXPECT_FALSE(task.workflow_context.contains("staging_url"));
    EXPECT_EQ(task.retry_count, 0);

    // generate, implement, review
    EXPECT_EQ(stats->calls.load(), 3);

    ASSERT_TRUE(waitFor([this] { return pool_->getMetrics().total_workflows_failed == 1u; }));
    EXPECT_DOUBLE_EQ(pool_->getMetrics().failure_rate_by_phase.at("REVIEW"), 1.0);
}

TEST_F(ExecutorPoolTest, ConcurrencyCeilingHolds) {
    FakeAgentOptions opts;
    opts.delay = std::chrono::milliseconds(40);
    auto stats = registerFakeAgents(*registry_, opts);
    createPool();

    for (int i = 0; i < 5; ++i) {
        add("wf-" + std::to_string(i));
    }

    std::atomic<bool> sampling{true};
    std::atomic<int> max_active{0};
    std::atomic<bool> invariant_broken{false};
    std::thread sampler([&] {
        while (sampling.load()) {
            int active = pool_->activeCount();
            int available = pool_->availableSlots();
            if (active > 3 || available < 0) {
                invariant_broken = true;
            }
            max_active = std::max(max_active.load(), active);
            if (queue_->countByStatus(TaskStatus::RUNNING) > 3) {
                invariant_broken = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    });

    pool_->start();
    bool all_done = waitFor([this] {
        return queue_->countByStatus(TaskStatus::COMPLETED) == 5;
    }, std::chrono::milliseconds(20000));

    sampling = false;
    sampler.join();

    ASSERT_TRUE(all_done);
    EXPECT_FALSE(invariant_broken.load());
    EXPECT_EQ(max_active.load(), 3);
    EXPECT_LE(stats->max_in_flight.load(), 3);
}

TEST_F(ExecutorPoolTest, HigherPriorityAdmittedFirst) {
    FakeAgentOptions opts;
    opts.delay = std::chrono::milliseconds(30);
    registerFakeAgents(*registry_, opts);
    config_.max_concurrent = 1;
    createPool();

    add("low", 0);
    add("high", 10);

    // Manual tick: one slot, highest priority wins
    EXPECT_EQ(pool_->pollOnce(), 1u);
    EXPECT_EQ(queue_->get("high").status, TaskStatus::RUNNING);
    EXPECT_EQ(queue_->get("low").status, TaskStatus::QUEUED);
    EXPECT_EQ(pool_->availableSlots(), 0);
    EXPECT_EQ(pool_->pollOnce(), 0u);

    ASSERT_TRUE(waitTerminal("high"));
    ASSERT_TRUE(waitFor([this] { return pool_->pollOnce() == 1u; }));
    ASSERT_TRUE(waitTerminal("low"));
}

TEST_F(ExecutorPoolTest, PhaseChangesAreForwardOnly) {
    registerFakeAgents(*registry_);
    createPool();

    std::mutex mutex;
    std::vector<std::tuple<std::string, ChimeraPhase, ChimeraPhase>> changes;
    pool_->setPhaseCallback([&](const std::string& id, ChimeraPhase from, ChimeraPhase to) {
        std::lock_guard<std::mutex> lock(mutex);
        changes.emplace_back(id, from, to);
    });

    add("wf-1");
    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));
    pool_->stop();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(changes.size(), 5u);
    for (const auto& [id, from, to] : changes) {
        EXPECT_EQ(id, "wf-1");
        ASSERT_TRUE(nextPhase(from).has_value());
        EXPECT_EQ(*nextPhase(from), to);
    }
    EXPECT_EQ(std::get<2>(changes.back()), ChimeraPhase::COMPLETE);
}

TEST_F(ExecutorPoolTest, TransientFailuresAreRetried) {
    FakeAgentOptions opts;
    opts.generate_failures = 2;
    auto stats = registerFakeAgents(*registry_, opts);
    createPool();
    add("wf-1");

    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));

    WorkflowTask task = queue_->get("wf-1");
    EXPECT_EQ(task.status, TaskStatus::COMPLETED);
    EXPECT_EQ(stats->generate_attempts.load(), 3);
    ASSERT_TRUE(task.workflow_context["errors"].is_array());
    EXPECT_EQ(task.workflow_context["errors"].size(), 2u);
    EXPECT_EQ(task.workflow_context["errors"][0]["phase"], "E2E_TEST_GENERATION");

    // Counter restarted once the phase advanced
    EXPECT_EQ(task.retry_count, 0);

    ASSERT_TRUE(waitFor([this] { return pool_->getMetrics().total_workflows_processed == 1u; }));
    EXPECT_DOUBLE_EQ(pool_->getMetrics().retry_success_rate, 1.0);
}

TEST_F(ExecutorPoolTest, ExhaustedRetriesFailTheWorkflow) {
    FakeAgentOptions opts;
    opts.generate_failures = 1000;
    auto stats = registerFakeAgents(*registry_, opts);
    config_.max_retries = 2;
    createPool();
    add("wf-1");

    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));

    WorkflowTask task = queue_->get("wf-1");
    EXPECT_EQ(task.status, TaskStatus::FAILED);
    EXPECT_EQ(task.current_phase, ChimeraPhase::FAILED);
    EXPECT_EQ(task.workflow_context["failed_phase"], "E2E_TEST_GENERATION");
    EXPECT_NE(task.workflow_context["last_error"].get<std::string>().find("test generator unavailable"),
              std::string::npos);
    EXPECT_EQ(task.retry_count, 2);
    EXPECT_EQ(stats->generate_attempts.load(), 3);
}

TEST_F(ExecutorPoolTest, ExhaustedWorkflowIsDeadLettered) {
    FakeAgentOptions opts;
    opts.generate_failures = 1000;
    registerFakeAgents(*registry_, opts);
    config_.max_retries = 1;
    createPool();
    add("wf-1");
    add("wf-2");

    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));
    ASSERT_TRUE(waitTerminal("wf-2"));

    EXPECT_EQ(dead_letters_->count(), 2u);
    auto entry = dead_letters_->get("wf-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->retry_count, 1);
    EXPECT_EQ(entry->last_error_phase, "E2E_TEST_GENERATION");
    EXPECT_NE(entry->failure_reason.find("test generator unavailable"), std::string::npos);
    EXPECT_EQ(entry->feature_description, "feature-wf-1");
    EXPECT_EQ(entry->workflow_context["failed_phase"], "E2E_TEST_GENERATION");
}

TEST_F(ExecutorPoolTest, RejectedWorkflowIsNotDeadLettered) {
    FakeAgentOptions opts;
    opts.review_decision = "rejected";
    registerFakeAgents(*registry_, opts);
    createPool();
    add("wf-1");

    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));

    EXPECT_EQ(queue_->get("wf-1").status, TaskStatus::FAILED);
    EXPECT_EQ(dead_letters_->count(), 0u);
}

TEST_F(ExecutorPoolTest, DeadLetterWriteFailureStillFailsWorkflow) {
    FakeAgentOptions opts;
    opts.generate_failures = 1000;
    registerFakeAgents(*registry_, opts);
    config_.max_retries = 0;

    // Never initialized, so every add throws StorageError
    dead_letters_ = std::make_unique<DeadLetterQueue>(test_dir_);
    createPool();
    add("wf-1");

    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));

    EXPECT_EQ(queue_->get("wf-1").status, TaskStatus::FAILED);
    EXPECT_EQ(dead_letters_->count(), 0u);
}

TEST_F(ExecutorPoolTest, TimeoutIsTransient) {
    FakeAgentOptions opts;
    opts.delay = std::chrono::milliseconds(300);
    registerFakeAgents(*registry_, opts);
    config_.phase_timeout_ms = 30;
    config_.max_retries = 1;
    createPool();
    add("wf-1");

    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));

    WorkflowTask task = queue_->get("wf-1");
    EXPECT_EQ(task.status, TaskStatus::FAILED);
    EXPECT_EQ(task.retry_count, 1);
    EXPECT_NE(task.workflow_context["last_error"].get<std::string>().find("timed out"),
              std::string::npos);
}

TEST_F(ExecutorPoolTest, StopRequeuesInFlightWork) {
    FakeAgentOptions opts;
    opts.delay = std::chrono::milliseconds(100);
    registerFakeAgents(*registry_, opts);
    createPool();
    add("wf-1");

    pool_->start();
    ASSERT_TRUE(waitFor([this] { return queue_->get("wf-1").status == TaskStatus::RUNNING; }));

    pool_->stop();

    WorkflowTask task = queue_->get("wf-1");
    EXPECT_EQ(task.status, TaskStatus::QUEUED);
    EXPECT_FALSE(isTerminalPhase(task.current_phase));
    EXPECT_EQ(pool_->activeCount(), 0);
    EXPECT_EQ(pool_->availableSlots(), 3);

    // Nothing is admitted while stopped
    EXPECT_EQ(pool_->submitWorkflow(task), 0u);
}

TEST_F(ExecutorPoolTest, RestartRecoversTaskWithFreshHeartbeat) {
    auto stats = registerFakeAgents(*registry_);

    // State left behind by a process that crashed moments ago
    openPersistentQueue();
    add("wf-1");
    queue_->dequeueReady(1);
    queue_->updatePhase("wf-1", ChimeraPhase::CODE_IMPLEMENTATION,
                        {{"test_path", "tests/feature-wf-1.spec.ts"}});

    openPersistentQueue();
    config_.stale_threshold_ms = 300;
    createPool();
    pool_->start();

    // Heartbeat is younger than the threshold, so start() leaves it alone
    EXPECT_EQ(queue_->get("wf-1").status, TaskStatus::RUNNING);
    EXPECT_EQ(stats->calls.load(), 0);

    ASSERT_TRUE(waitTerminal("wf-1"));

    WorkflowTask task = queue_->get("wf-1");
    EXPECT_EQ(task.status, TaskStatus::COMPLETED);
    EXPECT_EQ(task.workflow_context["test_path"], "tests/feature-wf-1.spec.ts");
    EXPECT_EQ(stats->generate_attempts.load(), 0);
}

TEST_F(ExecutorPoolTest, OrphanedTaskRequeuedOnceStale) {
    auto stats = registerFakeAgents(*registry_);
    config_.stale_threshold_ms = 100;
    createPool();

    // Claimed with no worker behind it
    add("wf-1");
    ASSERT_EQ(queue_->dequeueReady(1).size(), 1u);

    EXPECT_EQ(pool_->pollOnce(), 0u);
    EXPECT_EQ(queue_->get("wf-1").status, TaskStatus::RUNNING);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(pool_->pollOnce(), 1u);
    ASSERT_TRUE(waitTerminal("wf-1"));

    EXPECT_EQ(queue_->get("wf-1").status, TaskStatus::COMPLETED);
    EXPECT_EQ(stats->generate_attempts.load(), 1);
}

TEST_F(ExecutorPoolTest, LiveTasksAreNeverRecovered) {
    FakeAgentOptions opts;
    opts.delay = std::chrono::milliseconds(40);
    auto stats = registerFakeAgents(*registry_, opts);
    config_.stale_threshold_ms = 0;
    createPool();
    add("wf-1");

    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));

    EXPECT_EQ(queue_->get("wf-1").status, TaskStatus::COMPLETED);
    EXPECT_EQ(stats->calls.load(), 5);
    EXPECT_EQ(stats->max_in_flight.load(), 1);
}

TEST_F(ExecutorPoolTest, ConcurrentPhaseChangeFailsTheWorkflow) {
    registerFakeAgents(*registry_);

    // Another writer moves the task on while the generator is running
    TaskQueue* queue = queue_.get();
    registry_->registerFunction(roles::E2E_TESTER, "generate_test",
        [queue](const nlohmann::json&) {
            queue->updatePhase("wf-1", ChimeraPhase::CODE_IMPLEMENTATION,
                               {{"test_path", "tests/other.spec.ts"}});
            queue->updatePhase("wf-1", ChimeraPhase::REVIEW, {{"pr_id", "PR-9"}});
            return nlohmann::json{{"status", "success"}, {"test_path", "tests/wf-1.spec.ts"}};
        });

    createPool();
    add("wf-1");
    pool_->start();
    ASSERT_TRUE(waitTerminal("wf-1"));

    WorkflowTask task = queue_->get("wf-1");
    EXPECT_EQ(task.status, TaskStatus::FAILED);
    EXPECT_EQ(task.current_phase, ChimeraPhase::FAILED);
    ASSERT_TRUE(task.workflow_context.contains("last_error"));
    EXPECT_FALSE(task.workflow_context["last_error"].get<std::string>().empty());
    EXPECT_EQ(task.workflow_context["failed_phase"], "E2E_TEST_GENERATION");
    EXPECT_EQ(task.workflow_context["test_path"], "tests/other.spec.ts");
}

TEST_F(ExecutorPoolTest, SubmitHintAdmitsWithoutWaitingForPoll) {
    registerFakeAgents(*registry_);
    config_.poll_interval_ms = 60000;
    createPool();

    pool_->start();
    WorkflowTask task = add("wf-1");
    EXPECT_EQ(pool_->submitWorkflow(task), 1u);
    ASSERT_TRUE(waitTerminal("wf-1"));
}

TEST_F(ExecutorPoolTest, MetricsStayConsistent) {
    FakeAgentOptions opts;
    opts.validation_status = "failed";
    registerFakeAgents(*registry_, opts);
    createPool();

    add("a");
    add("b");
    add("c");
    add("d");

    pool_->start();
    ASSERT_TRUE(waitFor([this] {
        return queue_->countByStatus(TaskStatus::FAILED) == 4;
    }));
    ASSERT_TRUE(waitFor([this] { return pool_->getMetrics().total_workflows_processed == 4u; }));

    PoolMetrics m = pool_->getMetrics();
    EXPECT_EQ(m.total_workflows_succeeded + m.total_workflows_failed, m.total_workflows_processed);
    EXPECT_EQ(m.active_workflows + m.available_slots, m.pool_size);
    EXPECT_EQ(m.queue_depth, 0u);
    EXPECT_DOUBLE_EQ(m.success_rate, 0.0);
    EXPECT_DOUBLE_EQ(m.failure_rate_by_phase.at("E2E_VALIDATION"), 1.0);
    EXPECT_GE(m.peak_utilization_pct, 100.0 / 3.0);
}

TEST_F(ExecutorPoolTest, StopLogReportsProcessedCount) {
    registerFakeAgents(*registry_);
    auto logger = std::make_shared<Logger>(test_dir_ + "/logs");
    driver_ = std::make_unique<PhaseDriver>(*registry_,
                                            std::chrono::milliseconds(config_.phase_timeout_ms));
    pool_ = std::make_unique<ExecutorPool>(*queue_, *driver_, config_, logger);

    add("a");
    add("b");
    pool_->start();
    ASSERT_TRUE(waitFor([this] { return pool_->getMetrics().total_workflows_processed == 2u; }));
    pool_->stop();

    std::ifstream file(logger->logFilePath());
    std::stringstream log;
    log << file.rdbuf();
    EXPECT_NE(log.str().find("Executor pool stopped (2 workflow(s) processed)"), std::string::npos);
}

TEST_F(ExecutorPoolTest, StartIsIdempotent) {
    registerFakeAgents(*registry_);
    createPool();

    pool_->start();
    pool_->start();
    EXPECT_TRUE(pool_->isRunning());

    pool_->stop();
    pool_->stop();
    EXPECT_FALSE(pool_->isRunning());
}

} // namespace testing
} // namespace chimera
