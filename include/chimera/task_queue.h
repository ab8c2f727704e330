/**
 * @file task_queue.h
 * @brief Durable task queue for workflow records
 *
 * Provides thread-safe enqueue, atomic admission, forward-only phase
 * transitions and crash-consistent persistence of WorkflowTask records.
 */

#ifndef CHIMERA_TASK_QUEUE_H
#define CHIMERA_TASK_QUEUE_H

#include "chimera/logger.h"
#include "chimera/retry_policy.h"
#include "chimera/workflow_task.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chimera {

/**
 * @brief Manages WorkflowTask records with thread-safe operations
 *
 * TaskQueue is responsible for:
 * - Task enqueue with caller-assigned unique ids
 * - Admission of ready tasks (QUEUED -> RUNNING) in priority/FIFO order
 * - Phase transitions and append-only context merges
 * - Terminal status, retries, heartbeats and restart recovery
 * - Persistence to <data_dir>/tasks.json
 *
 * Every mutation is applied to a staged copy, written to disk and only
 * then made visible, so a failed write leaves the queue unchanged. The
 * internal mutex makes the queue the single serialization point for
 * concurrent callers.
 */
class TaskQueue {
public:
    /**
     * @brief Construct a TaskQueue
     * @param data_dir Directory holding tasks.json (empty = in-memory only)
     * @param logger Log sink (null = disabled)
     * @param storage_retry Retry policy for tasks.json reads and writes
     */
    explicit TaskQueue(const std::string& data_dir = "",
                       std::shared_ptr<Logger> logger = nullptr,
                       RetryConfig storage_retry = defaultStorageRetry());

    ~TaskQueue() = default;

    // Disable copy
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /// Short-delay storage retries: 3 retries starting at 50 ms
    static RetryConfig defaultStorageRetry();

    /**
     * @brief Open or create the backing store and load existing records
     *
     * Idempotent. Disk-backed queues reject every other operation with
     * StorageError until this has succeeded.
     *
     * @throws StorageError if the directory is inaccessible or tasks.json is corrupt
     */
    void initialize();

    bool isInitialized() const;

    /**
     * @brief Insert a new QUEUED task
     * @return The stored record
     * @throws DuplicateTaskError if id already exists
     * @throws StorageError if the write fails after retries
     */
    WorkflowTask enqueue(const std::string& id,
                         const std::string& feature_description,
                         const std::string& target_url,
                         int priority = 0);

    /**
     * @brief Claim up to limit QUEUED tasks and mark them RUNNING
     *
     * Ordered by priority descending, then created_at ascending, then
     * enqueue sequence. The claim is a single persisted step; no task is
     * returned to more than one caller.
     *
     * @param limit Maximum number of tasks to claim
     * @return Claimed tasks, already RUNNING
     */
    std::vector<WorkflowTask> dequeueReady(size_t limit);

    /**
     * @brief Move a task to the given phase and merge context_patch
     *
     * Allowed targets are the immediate successor of the stored phase and
     * FAILED from any non-terminal phase. Requesting the stored phase
     * again is a no-op and merges nothing. Patch keys already present in
     * workflow_context are left untouched.
     *
     * @return The record after the update
     * @throws NotFoundError if id is unknown
     * @throws InvalidTransitionError for any other target
     */
    WorkflowTask updatePhase(const std::string& id,
                             ChimeraPhase phase,
                             const nlohmann::json& context_patch = nlohmann::json::object());

    /**
     * @brief Set terminal status of a RUNNING task
     *
     * A successful completion requires current_phase COMPLETE; a failed
     * one moves a non-terminal phase to FAILED.
     *
     * @throws NotFoundError if id is unknown
     * @throws InvalidTransitionError if the task is not RUNNING
     */
    WorkflowTask complete(const std::string& id, bool succeeded);

    /**
     * @brief Point lookup
     * @throws NotFoundError if id is unknown
     */
    WorkflowTask get(const std::string& id) const;

    /// Point lookup without throwing
    std::optional<WorkflowTask> find(const std::string& id) const;

    /**
     * @brief Record a recoverable failure of the current phase
     *
     * Increments retry_count and appends {phase, error, attempt} to
     * workflow_context["errors"].
     *
     * @return The new retry_count
     */
    int recordRetry(const std::string& id, const std::string& error);

    /**
     * @brief Refresh heartbeat_at of the given RUNNING tasks
     *
     * Unknown or non-RUNNING ids are skipped.
     */
    void heartbeat(const std::vector<std::string>& ids);

    /**
     * @brief Return a RUNNING task to QUEUED, keeping its phase and context
     * @throws InvalidTransitionError if the task is not RUNNING
     */
    WorkflowTask requeue(const std::string& id);

    /**
     * @brief Requeue RUNNING tasks whose worker is gone
     *
     * A task is stale when its heartbeat (or updated_at, if it never had
     * one) is older than threshold and its id is not in live_ids.
     *
     * @return Ids moved back to QUEUED
     */
    std::vector<std::string> recoverStale(std::chrono::milliseconds threshold,
                                          const std::set<std::string>& live_ids = {});

    /**
     * @brief List tasks in enqueue order
     * @param status Only tasks with this status (nullopt = all)
     */
    std::vector<WorkflowTask> list(std::optional<TaskStatus> status = std::nullopt) const;

    size_t countByStatus(TaskStatus status) const;

    size_t size() const;

    /**
     * @brief Get the path to the tasks JSON file
     * @return Full path to tasks.json, empty for in-memory queues
     */
    std::string getTasksFilePath() const;

private:
    using TaskMap = std::map<std::string, WorkflowTask>;

    /// Data directory for persistence
    std::string data_dir_;

    std::shared_ptr<Logger> logger_;

    RetryPolicy storage_retry_;

    /// Records keyed by id
    TaskMap tasks_;

    /// Next enqueue sequence number (monotonically increasing)
    uint64_t next_sequence_ = 1;

    bool initialized_ = false;

    /// Mutex for thread safety
    mutable std::mutex mutex_;

    /// Throws StorageError when a disk-backed queue is not initialized. Caller holds mutex_.
    void requireInitialized() const;

    /// Lookup that throws NotFoundError. Caller holds mutex_.
    const WorkflowTask& at(const TaskMap& tasks, const std::string& id) const;

    /**
     * @brief Persist staged records, then make them visible
     *
     * Caller holds mutex_. On failure neither disk nor memory changes.
     *
     * @throws StorageError after storage retries are exhausted
     */
    void commit(TaskMap staged, uint64_t next_sequence);

    /// Write tmp file, fsync and rename over tasks.json
    void writeFile(const TaskMap& tasks, uint64_t next_sequence) const;

    /// Parse tasks.json into tasks_/next_sequence_. Caller holds mutex_.
    void readFile();
};

} // namespace chimera

#endif // CHIMERA_TASK_QUEUE_H
