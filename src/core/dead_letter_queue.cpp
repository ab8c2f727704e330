/**
 * @file dead_letter_queue.cpp
 * @brief Implementation of DeadLetterQueue
 */

#include "chimera/dead_letter_queue.h"
#include "chimera/config.h"
#include "chimera/durable_file.h"
#include "chimera/errors.h"

#include <algorithm>
#include <stdexcept>

namespace chimera {

DeadLetterEntry DeadLetterEntry::fromTask(const WorkflowTask& task,
                                          const std::string& failure_reason,
                                          ChimeraPhase failed_phase) {
    DeadLetterEntry entry;
    entry.task_id = task.id;
    entry.feature_description = task.feature_description;
    entry.target_url = task.target_url;
    entry.failure_reason = failure_reason;
    entry.retry_count = task.retry_count;
    entry.last_error_phase = phaseToString(failed_phase);
    entry.workflow_context = task.workflow_context;
    entry.created_at = task.created_at;
    entry.failed_at = std::chrono::system_clock::now();
    return entry;
}

nlohmann::json DeadLetterEntry::toJsonValue() const {
    nlohmann::json j;
    j["task_id"] = task_id;
    j["feature_description"] = feature_description;
    j["target_url"] = target_url;
    j["failure_reason"] = failure_reason;
    j["retry_count"] = retry_count;
    j["last_error_phase"] = last_error_phase;
    j["workflow_context"] = workflow_context;
    j["created_at"] = formatTimestamp(created_at);
    j["failed_at"] = formatTimestamp(failed_at);
    j["sequence"] = sequence;
    return j;
}

DeadLetterEntry DeadLetterEntry::fromJsonValue(const nlohmann::json& j) {
    try {
        DeadLetterEntry entry;
        entry.task_id = j.at("task_id").get<std::string>();
        entry.feature_description = j.at("feature_description").get<std::string>();
        entry.target_url = j.at("target_url").get<std::string>();
        entry.failure_reason = j.value("failure_reason", std::string());
        entry.retry_count = j.value("retry_count", 0);
        entry.last_error_phase = j.value("last_error_phase", std::string());
        entry.workflow_context = j.value("workflow_context", nlohmann::json::object());
        entry.created_at = parseTimestamp(j.at("created_at").get<std::string>());
        entry.failed_at = parseTimestamp(j.at("failed_at").get<std::string>());
        entry.sequence = j.value("sequence", static_cast<uint64_t>(0));
        return entry;

    } catch (const nlohmann::json::exception& e) {
        throw ChimeraException(ErrorCode::FILE_PARSE_ERROR,
                               std::string("JSON parse error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ChimeraException(ErrorCode::FILE_PARSE_ERROR, e.what());
    } catch (const std::runtime_error& e) {
        throw ChimeraException(ErrorCode::FILE_PARSE_ERROR, e.what());
    }
}

DeadLetterQueue::DeadLetterQueue(const std::string& data_dir,
                                 std::shared_ptr<Logger> logger,
                                 RetryConfig storage_retry)
    : data_dir_(data_dir)
    , logger_(logger ? std::move(logger) : Logger::null())
    , storage_retry_(storage_retry)
    , initialized_(data_dir.empty()) {
}

void DeadLetterQueue::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (data_dir_.empty() || initialized_) {
        initialized_ = true;
        return;
    }

    if (!Config::createDirectoryRecursive(data_dir_)) {
        throw StorageError("Cannot create data directory: " + data_dir_);
    }

    readFile();
    initialized_ = true;

    if (!entries_.empty()) {
        logger_->warn("Dead letter queue holds " + std::to_string(entries_.size()) +
                      " workflow(s)");
    }
}

bool DeadLetterQueue::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

DeadLetterEntry DeadLetterQueue::add(DeadLetterEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    if (entry.task_id.empty()) {
        throw ChimeraException(ErrorCode::TASK_INVALID_STATE,
                               "Dead letter entry needs a task id");
    }

    entry.sequence = next_sequence_;

    EntryMap staged = entries_;
    staged[entry.task_id] = entry;
    commit(std::move(staged), next_sequence_ + 1);

    logger_->warn("Dead-lettered task " + entry.task_id + " at " + entry.last_error_phase +
                  " after " + std::to_string(entry.retry_count) + " retries: " +
                  entry.failure_reason);
    return entry;
}

std::optional<DeadLetterEntry> DeadLetterQueue::get(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(task_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DeadLetterEntry> DeadLetterQueue::list(size_t limit, size_t offset) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<const DeadLetterEntry*> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const DeadLetterEntry* a, const DeadLetterEntry* b) {
                  return a->sequence > b->sequence;
              });

    std::vector<DeadLetterEntry> page;
    for (size_t i = offset; i < ordered.size() && page.size() < limit; ++i) {
        page.push_back(*ordered[i]);
    }
    return page;
}

bool DeadLetterQueue::remove(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireInitialized();

    if (entries_.count(task_id) == 0) {
        return false;
    }

    EntryMap staged = entries_;
    staged.erase(task_id);
    commit(std::move(staged), next_sequence_);

    logger_->info("Removed dead letter for task " + task_id);
    return true;
}

size_t DeadLetterQueue::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string DeadLetterQueue::getFilePath() const {
    if (data_dir_.empty()) {
        return "";
    }
    return data_dir_ + "/dead_letters.json";
}

void DeadLetterQueue::requireInitialized() const {
    if (!initialized_) {
        throw StorageError("Dead letter queue not initialized: " + data_dir_);
    }
}

void DeadLetterQueue::commit(EntryMap staged, uint64_t next_sequence) {
    if (!data_dir_.empty()) {
        try {
            storage_retry_.execute(
                [&]() { writeFile(staged, next_sequence); },
                [this](const std::exception& e) {
                    logger_->warn(std::string("Dead letter write failed, retrying: ") + e.what());
                    return true;
                });
        } catch (const StorageError&) {
            throw;
        } catch (const std::exception& e) {
            throw StorageError(e.what());
        }
    }

    entries_ = std::move(staged);
    next_sequence_ = next_sequence;
}

void DeadLetterQueue::writeFile(const EntryMap& entries, uint64_t next_sequence) const {
    nlohmann::json j;
    j["next_sequence"] = next_sequence;

    nlohmann::json entries_array = nlohmann::json::array();
    for (const auto& [id, entry] : entries) {
        entries_array.push_back(entry.toJsonValue());
    }
    j["entries"] = entries_array;

    replaceFileDurably(getFilePath(), j.dump(2), *logger_);
}

void DeadLetterQueue::readFile() {
    std::string filepath = getFilePath();

    std::optional<std::string> content = storage_retry_.execute([&]() {
        return readWholeFile(filepath);
    });
    if (!content) {
        entries_.clear();
        next_sequence_ = 1;
        return;
    }

    EntryMap loaded;
    uint64_t next_sequence = 1;

    try {
        nlohmann::json j = nlohmann::json::parse(*content);

        for (const auto& entry_json : j.at("entries")) {
            DeadLetterEntry entry = DeadLetterEntry::fromJsonValue(entry_json);
            next_sequence = std::max(next_sequence, entry.sequence + 1);
            loaded[entry.task_id] = std::move(entry);
        }
        next_sequence = std::max(next_sequence, j.value("next_sequence", next_sequence));

    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Corrupt dead letter store " + filepath + ": " + e.what(),
                           ErrorCode::STORAGE_CORRUPT);
    } catch (const ChimeraException& e) {
        throw StorageError("Corrupt dead letter store " + filepath + ": " + e.message(),
                           ErrorCode::STORAGE_CORRUPT);
    }

    entries_ = std::move(loaded);
    next_sequence_ = next_sequence;
}

} // namespace chimera
