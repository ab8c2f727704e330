/**
 * @file executor_pool.h
 * @brief ExecutorPool class driving admitted workflows to completion
 *
 * Coordinates between TaskQueue, PhaseDriver and MetricsCollector to
 * admit ready workflows under a concurrency ceiling and run each one on
 * its own worker thread.
 */

#ifndef CHIMERA_EXECUTOR_POOL_H
#define CHIMERA_EXECUTOR_POOL_H

#include "chimera/config.h"
#include "chimera/dead_letter_queue.h"
#include "chimera/logger.h"
#include "chimera/metrics.h"
#include "chimera/phase_driver.h"
#include "chimera/retry_policy.h"
#include "chimera/task_queue.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace chimera {

/**
 * @brief Callback type for persisted phase changes
 */
using PhaseChangeCallback = std::function<void(const std::string& task_id,
                                               ChimeraPhase old_phase,
                                               ChimeraPhase new_phase)>;

/**
 * @brief Bounded-concurrency scheduler for workflows
 *
 * The ExecutorPool is responsible for:
 * - Running a poll loop that admits QUEUED tasks into free slots
 * - Driving each admitted task phase by phase on its own thread
 * - Retrying transient phase failures with backoff
 * - Dead-lettering workflows that exhaust their retries
 * - Refreshing heartbeats of live tasks and re-queueing stale orphans
 * - Requeueing in-flight tasks on graceful shutdown
 * - Aggregate metrics
 *
 * activeCount() + availableSlots() == max_concurrent at all times.
 */
class ExecutorPool {
public:
    /**
     * @brief Construct an ExecutorPool
     * @param queue Task queue; must outlive the pool
     * @param driver Phase driver; must outlive the pool
     * @param config Pool size, intervals, retry and shutdown settings
     * @param logger Log sink (null = disabled)
     * @param dead_letters Receives workflows that exhaust their retries;
     *        must outlive the pool (null = not recorded)
     */
    ExecutorPool(TaskQueue& queue,
                 const PhaseDriver& driver,
                 const Config& config,
                 std::shared_ptr<Logger> logger = nullptr,
                 DeadLetterQueue* dead_letters = nullptr);

    /**
     * @brief Destructor - stops the pool and joins every worker
     */
    ~ExecutorPool();

    // Disable copy
    ExecutorPool(const ExecutorPool&) = delete;
    ExecutorPool& operator=(const ExecutorPool&) = delete;

    /**
     * @brief Recover stale tasks and start the poll loop
     *
     * A second call while running is a no-op.
     *
     * @throws StorageError if stale-task recovery cannot be persisted
     */
    void start();

    /**
     * @brief Stop admitting and wait for in-flight work
     *
     * Workers finish their current phase step, requeue their task and
     * exit. Returns once every worker is gone or shutdown_timeout_ms has
     * elapsed; the destructor joins any worker still in a phase call.
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Admission hint for a just-enqueued task
     *
     * Runs an admission step now instead of waiting for the next poll
     * tick. Admission order and the ceiling are unchanged, so the hinted
     * task is admitted only if it wins a free slot.
     *
     * @return Number of tasks admitted by this step
     */
    size_t submitWorkflow(const WorkflowTask& task);

    /**
     * @brief Run one poll tick: reap workers, refresh heartbeats, re-queue orphans, admit
     *
     * Useful for testing without the background loop.
     * @return Number of tasks admitted
     */
    size_t pollOnce();

    int activeCount() const;

    int availableSlots() const;

    int poolSize() const { return max_concurrent_; }

    /**
     * @brief Point-in-time metrics snapshot
     *
     * Also samples queue depth and utilization for trend tracking.
     */
    PoolMetrics getMetrics();

    /**
     * @brief Set callback for persisted phase changes
     *
     * Called from worker threads after each successful updatePhase.
     */
    void setPhaseCallback(PhaseChangeCallback callback);

private:
    struct Worker {
        std::string task_id;
        std::thread thread;
        bool finished = false;
    };

    using Clock = std::chrono::steady_clock;

    /**
     * @brief Main poll loop
     */
    void pollLoop();

    /**
     * @brief Claim up to availableSlots() tasks and launch their workers
     */
    size_t admit();

    /// Join and drop workers that have released their slot
    void reapFinished();

    /**
     * @brief Re-queue RUNNING tasks with no live worker and a stale heartbeat
     * @return Number of tasks re-queued
     */
    size_t recoverOrphans();

    /// Ids of tasks whose worker has not finished
    std::set<std::string> liveTaskIds() const;

    /**
     * @brief Worker thread entry: runs the workflow, then releases the slot
     */
    void workerMain(uint64_t worker_id, WorkflowTask task, Clock::time_point admitted_at);

    /**
     * @brief Step the workflow until it is terminal or shutdown is requested
     */
    void runWorkflow(WorkflowTask task, Clock::time_point admitted_at);

    /// Set terminal status and record metrics
    void finishWorkflow(const WorkflowTask& task,
                        bool succeeded,
                        ChimeraPhase last_phase,
                        int retries,
                        Clock::time_point admitted_at);

    /// Move the task to FAILED with the error recorded, then complete it
    void failWorkflow(const std::string& task_id,
                      const std::string& error,
                      ChimeraPhase failed_phase,
                      nlohmann::json patch,
                      int retries,
                      Clock::time_point admitted_at,
                      bool dead_letter = false);

    /// Persist a phase change and notify the callback
    WorkflowTask persistPhase(const WorkflowTask& task,
                              ChimeraPhase phase,
                              const nlohmann::json& patch);

    /**
     * @brief Sleep for delay unless stop() is called first
     * @return false if interrupted by stop()
     */
    bool waitBackoff(std::chrono::milliseconds delay);

    void notifyPhaseChange(const std::string& task_id, ChimeraPhase old_phase, ChimeraPhase new_phase);

    /// Reference to task queue
    TaskQueue& queue_;

    /// Reference to phase driver
    const PhaseDriver& driver_;

    DeadLetterQueue* dead_letters_;

    std::shared_ptr<Logger> logger_;

    int max_concurrent_;
    std::chrono::milliseconds poll_interval_;
    std::chrono::milliseconds stale_threshold_;
    std::chrono::milliseconds shutdown_timeout_;

    RetryPolicy retry_policy_;

    MetricsCollector metrics_;

    /// Running flag
    std::atomic<bool> running_{false};

    /// Set by stop(), cleared by start()
    std::atomic<bool> stopping_{false};

    /// Poll thread
    std::thread poll_thread_;

    /// Serializes admission steps
    std::mutex admission_mutex_;

    /// Guards active_, workers_ and next_worker_id_
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int active_ = 0;
    std::map<uint64_t, Worker> workers_;
    uint64_t next_worker_id_ = 1;

    /// Phase change callback
    PhaseChangeCallback phase_callback_;

    /// Mutex for callback
    mutable std::mutex callback_mutex_;
};

} // namespace chimera

#endif // CHIMERA_EXECUTOR_POOL_H
