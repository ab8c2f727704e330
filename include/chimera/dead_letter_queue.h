/**
 * @file dead_letter_queue.h
 * @brief Durable record of workflows that exhausted their retries
 *
 * Entries keep enough of the failed workflow to diagnose or resubmit it
 * by hand. They are persisted to <data_dir>/dead_letters.json the same
 * way TaskQueue persists tasks.json.
 */

#ifndef CHIMERA_DEAD_LETTER_QUEUE_H
#define CHIMERA_DEAD_LETTER_QUEUE_H

#include "chimera/logger.h"
#include "chimera/retry_policy.h"
#include "chimera/workflow_task.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chimera {

/**
 * @brief One dead-lettered workflow
 */
struct DeadLetterEntry {
    std::string task_id;
    std::string feature_description;
    std::string target_url;

    /// Error of the final failed attempt
    std::string failure_reason;

    int retry_count = 0;

    /// Phase the workflow was stuck at, e.g. "E2E_VALIDATION"
    std::string last_error_phase;

    /// Context at the time of failure
    nlohmann::json workflow_context = nlohmann::json::object();

    /// When the workflow was originally enqueued
    std::chrono::system_clock::time_point created_at;

    std::chrono::system_clock::time_point failed_at;

    /// Insertion order, assigned by the queue
    uint64_t sequence = 0;

    /// Snapshot of a failed task; failed_at is now
    static DeadLetterEntry fromTask(const WorkflowTask& task,
                                    const std::string& failure_reason,
                                    ChimeraPhase failed_phase);

    nlohmann::json toJsonValue() const;

    /// @throws ChimeraException(FILE_PARSE_ERROR) on missing or mistyped fields
    static DeadLetterEntry fromJsonValue(const nlohmann::json& j);
};

/**
 * @brief Durable dead letter queue keyed by task id
 *
 * Adding an entry for a task id that is already present replaces it.
 * Thread-safe.
 */
class DeadLetterQueue {
public:
    /**
     * @param data_dir Directory holding dead_letters.json (empty = in-memory only)
     * @param logger Log sink (null = disabled)
     * @param storage_retry Retry policy for file writes
     */
    explicit DeadLetterQueue(const std::string& data_dir = "",
                             std::shared_ptr<Logger> logger = nullptr,
                             RetryConfig storage_retry = RetryConfig());

    DeadLetterQueue(const DeadLetterQueue&) = delete;
    DeadLetterQueue& operator=(const DeadLetterQueue&) = delete;

    /**
     * @brief Load existing entries; idempotent
     * @throws StorageError if the file cannot be read, STORAGE_CORRUPT if it does not parse
     */
    void initialize();

    bool isInitialized() const;

    /**
     * @brief Store an entry
     * @return The stored entry with its sequence assigned
     * @throws ChimeraException(TASK_INVALID_STATE) if task_id is empty
     * @throws StorageError if the write fails after retries
     */
    DeadLetterEntry add(DeadLetterEntry entry);

    std::optional<DeadLetterEntry> get(const std::string& task_id) const;

    /**
     * @brief Page through entries, most recently added first
     */
    std::vector<DeadLetterEntry> list(size_t limit = 100, size_t offset = 0) const;

    /**
     * @return false if there was no entry for task_id
     * @throws StorageError if the write fails after retries
     */
    bool remove(const std::string& task_id);

    size_t count() const;

    /// Empty for an in-memory queue
    std::string getFilePath() const;

private:
    using EntryMap = std::map<std::string, DeadLetterEntry>;

    void requireInitialized() const;
    void commit(EntryMap staged, uint64_t next_sequence);
    void writeFile(const EntryMap& entries, uint64_t next_sequence) const;
    void readFile();

    std::string data_dir_;
    std::shared_ptr<Logger> logger_;
    RetryPolicy storage_retry_;

    mutable std::mutex mutex_;
    EntryMap entries_;
    uint64_t next_sequence_ = 1;
    bool initialized_;
};

} // namespace chimera

#endif // CHIMERA_DEAD_LETTER_QUEUE_H
