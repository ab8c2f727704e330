/**
 * @file task_queue.cpp
 * @brief Implementation of TaskQueue class
 *
 * Provides thread-safe workflow record management with atomic
 * write-then-swap persistence.
 */

#include "chimera/task_queue.h"
#include "chimera/config.h"
#include "chimera/durable_file.h"
#include "chimera/errors.h"

#include <algorithm>
#include <sys/stat.h>
#include <unistd.h>

namespace chimera {

TaskQueue::TaskQueue(const std::string& data_dir,
                     std::shared_ptr<Logger> logger,
                     RetryConfig storage_retry)
    : data_dir_(data_dir)
    , logger_(logger ? std::move(logger) : Logger::null())
    , storage_retry_(storage_retry)
    , initialized_(data_dir.empty()) {
}

RetryConfig TaskQueue::defaultStorageRetry() {
    RetryConfig rc;
    rc.max_retries = 3;
    rc.base_delay_ms = 50;
    rc.max_delay_ms = 800;
    rc.strategy = BackoffStrategy::EXPONENTIAL;
    return rc;
}

void TaskQueue::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (data_dir_.empty() || initialized_) {
        initialized_ = true;
        return;
    }

    if (!Config::createDirectoryRecursive(data_dir_)) {
        throw StorageError("Cannot create data directory: " + data_dir_);
    }

    struct stat st;
    if (stat(data_dir_.c_str(), &st) != 0 || !S_ISDIR(st.st_mode) ||
        access(data_dir_.c_str(), R_OK | W_OK | X_OK) != 0) {
        throw StorageError("Data directory is not accessible: " + data_dir_);
    }

    readFile();
    initialized_ = true;

    logger_->info("Task queue loaded " + std::to_string(tasks_.size()) +
                  " task(s) from " + getTasksFilePath());
}

bool TaskQueue::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

WorkflowTask TaskQueue::enqueue(const std::string& id,
                                const std::string& feature_description,
                                const std::string& target_url,
                                int priority) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    if (id.empty()) {
        throw ChimeraException(ErrorCode::TASK_INVALID_STATE, "Task id must not be empty");
    }
    if (tasks_.count(id) > 0) {
        throw DuplicateTaskError(id);
    }

    auto now = std::chrono::system_clock::now();

    WorkflowTask task;
    task.id = id;
    task.feature_description = feature_description;
    task.target_url = target_url;
    task.priority = priority;
    task.status = TaskStatus::QUEUED;
    task.current_phase = ChimeraPhase::E2E_TEST_GENERATION;
    task.sequence = next_sequence_;
    task.created_at = now;
    task.updated_at = now;

    TaskMap staged = tasks_;
    staged[id] = task;
    commit(std::move(staged), next_sequence_ + 1);

    logger_->info("Enqueued task " + id + " (priority " + std::to_string(priority) + ")");
    return task;
}

std::vector<WorkflowTask> TaskQueue::dequeueReady(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    if (limit == 0) {
        return {};
    }

    std::vector<const WorkflowTask*> ready;
    for (const auto& [id, task] : tasks_) {
        if (task.status == TaskStatus::QUEUED) {
            ready.push_back(&task);
        }
    }
    if (ready.empty()) {
        return {};
    }

    std::sort(ready.begin(), ready.end(),
              [](const WorkflowTask* a, const WorkflowTask* b) {
                  if (a->priority != b->priority) {
                      return a->priority > b->priority;
                  }
                  if (a->created_at != b->created_at) {
                      return a->created_at < b->created_at;
                  }
                  return a->sequence < b->sequence;
              });
    if (ready.size() > limit) {
        ready.resize(limit);
    }

    auto now = std::chrono::system_clock::now();
    TaskMap staged = tasks_;
    std::vector<WorkflowTask> claimed;
    claimed.reserve(ready.size());

    for (const WorkflowTask* candidate : ready) {
        WorkflowTask& task = staged.at(candidate->id);
        task.status = TaskStatus::RUNNING;
        task.updated_at = now;
        task.heartbeat_at = now;
        claimed.push_back(task);
    }

    commit(std::move(staged), next_sequence_);

    for (const auto& task : claimed) {
        logger_->debug("Admitted task " + task.id + " at phase " +
                       phaseToString(task.current_phase));
    }
    return claimed;
}

WorkflowTask TaskQueue::updatePhase(const std::string& id,
                                    ChimeraPhase phase,
                                    const nlohmann::json& context_patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    const WorkflowTask& current = at(tasks_, id);

    if (current.current_phase == phase) {
        return current;
    }

    if (isTerminalPhase(current.current_phase)) {
        throw InvalidTransitionError(id + ": " + phaseToString(current.current_phase) +
                                     " is terminal, cannot move to " + phaseToString(phase));
    }

    auto successor = nextPhase(current.current_phase);
    bool advancing = successor.has_value() && successor.value() == phase;
    if (!advancing && phase != ChimeraPhase::FAILED) {
        throw InvalidTransitionError(id + ": " + phaseToString(current.current_phase) +
                                     " -> " + phaseToString(phase));
    }

    if (!context_patch.is_null() && !context_patch.is_object()) {
        throw ChimeraException(ErrorCode::TASK_INVALID_STATE,
                               "Context patch for " + id + " must be a JSON object");
    }

    auto now = std::chrono::system_clock::now();
    TaskMap staged = tasks_;
    WorkflowTask& task = staged.at(id);

    task.current_phase = phase;
    task.updated_at = now;
    if (task.status == TaskStatus::RUNNING) {
        task.heartbeat_at = now;
    }
    if (advancing) {
        task.retry_count = 0;
    }

    if (context_patch.is_object()) {
        for (auto it = context_patch.begin(); it != context_patch.end(); ++it) {
            if (!task.workflow_context.contains(it.key())) {
                task.workflow_context[it.key()] = it.value();
            }
        }
    }

    WorkflowTask result = task;
    commit(std::move(staged), next_sequence_);

    logger_->info("Task " + id + " -> " + phaseToString(phase));
    return result;
}

WorkflowTask TaskQueue::complete(const std::string& id, bool succeeded) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    const WorkflowTask& current = at(tasks_, id);

    if (current.status != TaskStatus::RUNNING) {
        throw InvalidTransitionError(id + " is " + taskStatusToString(current.status) +
                                     ", not running");
    }
    if (succeeded && current.current_phase != ChimeraPhase::COMPLETE) {
        throw InvalidTransitionError(id + " cannot complete at phase " +
                                     phaseToString(current.current_phase));
    }

    TaskMap staged = tasks_;
    WorkflowTask& task = staged.at(id);

    task.status = succeeded ? TaskStatus::COMPLETED : TaskStatus::FAILED;
    if (!succeeded && !isTerminalPhase(task.current_phase)) {
        task.current_phase = ChimeraPhase::FAILED;
    }
    task.updated_at = std::chrono::system_clock::now();

    WorkflowTask result = task;
    commit(std::move(staged), next_sequence_);

    logger_->info("Task " + id + " " + taskStatusToString(result.status));
    return result;
}

WorkflowTask TaskQueue::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();
    return at(tasks_, id);
}

std::optional<WorkflowTask> TaskQueue::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    auto it = tasks_.find(id);
    if (it != tasks_.end()) {
        return it->second;
    }
    return std::nullopt;
}

int TaskQueue::recordRetry(const std::string& id, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    at(tasks_, id);

    auto now = std::chrono::system_clock::now();
    TaskMap staged = tasks_;
    WorkflowTask& task = staged.at(id);

    task.retry_count += 1;
    task.updated_at = now;
    if (task.status == TaskStatus::RUNNING) {
        task.heartbeat_at = now;
    }

    nlohmann::json entry;
    entry["phase"] = phaseToString(task.current_phase);
    entry["error"] = error;
    entry["attempt"] = task.retry_count;
    entry["at"] = formatTimestamp(now);

    if (!task.workflow_context.contains("errors") ||
        !task.workflow_context["errors"].is_array()) {
        task.workflow_context["errors"] = nlohmann::json::array();
    }
    task.workflow_context["errors"].push_back(entry);

    int retry_count = task.retry_count;
    commit(std::move(staged), next_sequence_);

    logger_->warn("Task " + id + " retry " + std::to_string(retry_count) + " at " +
                  phaseToString(tasks_.at(id).current_phase) + ": " + error);
    return retry_count;
}

void TaskQueue::heartbeat(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    if (ids.empty()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    TaskMap staged = tasks_;
    bool changed = false;

    for (const auto& id : ids) {
        auto it = staged.find(id);
        if (it == staged.end() || it->second.status != TaskStatus::RUNNING) {
            continue;
        }
        it->second.heartbeat_at = now;
        changed = true;
    }

    if (changed) {
        commit(std::move(staged), next_sequence_);
    }
}

WorkflowTask TaskQueue::requeue(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    const WorkflowTask& current = at(tasks_, id);
    if (current.status != TaskStatus::RUNNING) {
        throw InvalidTransitionError(id + " is " + taskStatusToString(current.status) +
                                     ", cannot requeue");
    }

    TaskMap staged = tasks_;
    WorkflowTask& task = staged.at(id);
    task.status = TaskStatus::QUEUED;
    task.heartbeat_at.reset();
    task.updated_at = std::chrono::system_clock::now();

    WorkflowTask result = task;
    commit(std::move(staged), next_sequence_);

    logger_->info("Requeued task " + id + " at phase " + phaseToString(result.current_phase));
    return result;
}

std::vector<std::string> TaskQueue::recoverStale(std::chrono::milliseconds threshold,
                                                 const std::set<std::string>& live_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    auto now = std::chrono::system_clock::now();
    TaskMap staged = tasks_;
    std::vector<std::string> recovered;

    for (auto& [id, task] : staged) {
        if (task.status != TaskStatus::RUNNING || live_ids.count(id) > 0) {
            continue;
        }
        auto last_seen = task.heartbeat_at.value_or(task.updated_at);
        if (now - last_seen < threshold) {
            continue;
        }
        task.status = TaskStatus::QUEUED;
        task.heartbeat_at.reset();
        task.updated_at = now;
        recovered.push_back(id);
    }

    if (!recovered.empty()) {
        commit(std::move(staged), next_sequence_);
        for (const auto& id : recovered) {
            logger_->warn("Recovered stale task " + id + " at phase " +
                          phaseToString(tasks_.at(id).current_phase));
        }
    }

    return recovered;
}

std::vector<WorkflowTask> TaskQueue::list(std::optional<TaskStatus> status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    std::vector<WorkflowTask> result;
    for (const auto& [id, task] : tasks_) {
        if (!status.has_value() || task.status == status.value()) {
            result.push_back(task);
        }
    }

    std::sort(result.begin(), result.end(),
              [](const WorkflowTask& a, const WorkflowTask& b) {
                  return a.sequence < b.sequence;
              });
    return result;
}

size_t TaskQueue::countByStatus(TaskStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    return static_cast<size_t>(std::count_if(
        tasks_.begin(), tasks_.end(),
        [status](const TaskMap::value_type& entry) { return entry.second.status == status; }));
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::string TaskQueue::getTasksFilePath() const {
    if (data_dir_.empty()) {
        return "";
    }
    return data_dir_ + "/tasks.json";
}

void TaskQueue::requireInitialized() const {
    if (!initialized_) {
        throw StorageError("Task queue not initialized: " + data_dir_);
    }
}

const WorkflowTask& TaskQueue::at(const TaskMap& tasks, const std::string& id) const {
    auto it = tasks.find(id);
    if (it == tasks.end()) {
        throw NotFoundError(id);
    }
    return it->second;
}

void TaskQueue::commit(TaskMap staged, uint64_t next_sequence) {
    if (!data_dir_.empty()) {
        try {
            storage_retry_.execute(
                [&]() { writeFile(staged, next_sequence); },
                [this](const std::exception& e) {
                    logger_->warn(std::string("Task store write failed, retrying: ") + e.what());
                    return true;
                });
        } catch (const StorageError&) {
            throw;
        } catch (const std::exception& e) {
            throw StorageError(e.what());
        }
    }

    tasks_ = std::move(staged);
    next_sequence_ = next_sequence;
}

void TaskQueue::writeFile(const TaskMap& tasks, uint64_t next_sequence) const {
    nlohmann::json j;
    j["next_sequence"] = next_sequence;

    nlohmann::json tasks_array = nlohmann::json::array();
    for (const auto& [id, task] : tasks) {
        tasks_array.push_back(task.toJsonValue());
    }
    j["tasks"] = tasks_array;

    replaceFileDurably(getTasksFilePath(), j.dump(2), *logger_);
}

void TaskQueue::readFile() {
    std::string filepath = getTasksFilePath();

    std::optional<std::string> content = storage_retry_.execute([&]() {
        return readWholeFile(filepath);
    });
    if (!content) {
        // No store yet, start with empty queue
        tasks_.clear();
        next_sequence_ = 1;
        return;
    }

    TaskMap loaded;
    uint64_t next_sequence = 1;

    try {
        nlohmann::json j = nlohmann::json::parse(*content);

        for (const auto& task_json : j.at("tasks")) {
            WorkflowTask task = WorkflowTask::fromJsonValue(task_json);
            next_sequence = std::max(next_sequence, task.sequence + 1);
            loaded[task.id] = std::move(task);
        }
        next_sequence = std::max(next_sequence, j.value("next_sequence", next_sequence));

    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Corrupt task store " + filepath + ": " + e.what(),
                           ErrorCode::STORAGE_CORRUPT);
    } catch (const ChimeraException& e) {
        throw StorageError("Corrupt task store " + filepath + ": " + e.message(),
                           ErrorCode::STORAGE_CORRUPT);
    }

    tasks_ = std::move(loaded);
    next_sequence_ = next_sequence;
}

} // namespace chimera
