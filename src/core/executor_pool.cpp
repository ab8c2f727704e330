/**
 * @file executor_pool.cpp
 * @brief Implementation of ExecutorPool class
 *
 * Manages workflow admission and the per-task worker lifecycle.
 */

#include "chimera/executor_pool.h"
#include "chimera/errors.h"

#include <vector>

namespace chimera {

namespace {

const Config& validated(const Config& config) {
    config.validate();
    return config;
}

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - since).count();
}

/// Phase a FAILED task failed at, as recorded in its context
ChimeraPhase recordedFailedPhase(const WorkflowTask& task) {
    auto it = task.workflow_context.find("failed_phase");
    if (it != task.workflow_context.end() && it->is_string()) {
        try {
            return phaseFromString(it->get<std::string>());
        } catch (const std::invalid_argument&) {
            // fall through
        }
    }
    return ChimeraPhase::E2E_TEST_GENERATION;
}

} // anonymous namespace

ExecutorPool::ExecutorPool(TaskQueue& queue,
                           const PhaseDriver& driver,
                           const Config& config,
                           std::shared_ptr<Logger> logger,
                           DeadLetterQueue* dead_letters)
    : queue_(queue)
    , driver_(driver)
    , dead_letters_(dead_letters)
    , logger_(logger ? std::move(logger) : Logger::null())
    , max_concurrent_(validated(config).max_concurrent)
    , poll_interval_(config.poll_interval_ms)
    , stale_threshold_(config.stale_threshold_ms)
    , shutdown_timeout_(config.shutdown_timeout_ms)
    , retry_policy_(config.phaseRetryConfig())
    , metrics_(static_cast<size_t>(config.metrics_window)) {
}

ExecutorPool::~ExecutorPool() {
    stop();

    // Workers still inside a phase call are bounded by the phase timeout
    std::vector<std::thread> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, worker] : workers_) {
            remaining.push_back(std::move(worker.thread));
        }
        workers_.clear();
    }
    for (auto& t : remaining) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void ExecutorPool::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }
    stopping_ = false;

    try {
        auto recovered = queue_.recoverStale(stale_threshold_, liveTaskIds());
        if (!recovered.empty()) {
            logger_->info("Recovered " + std::to_string(recovered.size()) +
                          " stale task(s) for re-admission");
        }
    } catch (const ChimeraException&) {
        running_ = false;
        throw;
    }

    poll_thread_ = std::thread(&ExecutorPool::pollLoop, this);
    logger_->info("Executor pool started (max_concurrent=" +
                  std::to_string(max_concurrent_) + ")");
}

void ExecutorPool::stop() {
    {
        // Under mutex_ so no waiter misses the wakeup
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    bool was_running = running_.exchange(false);
    cv_.notify_all();

    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool drained = cv_.wait_for(lock, shutdown_timeout_, [this] { return active_ == 0; });
        if (!drained) {
            logger_->warn("Shutdown timeout: " + std::to_string(active_) +
                          " worker(s) still in a phase call");
        }
    }

    reapFinished();

    if (was_running) {
        logger_->info("Executor pool stopped (" + std::to_string(metrics_.totalProcessed()) +
                      " workflow(s) processed)");
    }
}

bool ExecutorPool::isRunning() const {
    return running_.load();
}

void ExecutorPool::setPhaseCallback(PhaseChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    phase_callback_ = std::move(callback);
}

void ExecutorPool::pollLoop() {
    while (running_.load()) {
        pollOnce();

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, poll_interval_, [this] { return stopping_.load(); });
    }
}

size_t ExecutorPool::pollOnce() {
    reapFinished();

    auto live = liveTaskIds();
    if (!live.empty()) {
        try {
            queue_.heartbeat(std::vector<std::string>(live.begin(), live.end()));
        } catch (const ChimeraException& e) {
            logger_->warn(std::string("Heartbeat failed: ") + e.what());
        }
    }

    recoverOrphans();

    return admit();
}

size_t ExecutorPool::recoverOrphans() {
    // Held so a task claimed by a concurrent admit() is already in workers_
    std::lock_guard<std::mutex> admission(admission_mutex_);

    try {
        auto recovered = queue_.recoverStale(stale_threshold_, liveTaskIds());
        if (!recovered.empty()) {
            logger_->info("Re-queued " + std::to_string(recovered.size()) +
                          " orphaned task(s)");
        }
        return recovered.size();
    } catch (const ChimeraException& e) {
        logger_->warn(std::string("Stale recovery failed: ") + e.what());
        return 0;
    }
}

size_t ExecutorPool::submitWorkflow(const WorkflowTask& task) {
    logger_->debug("Admission hint for task " + task.id);
    return admit();
}

int ExecutorPool::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

int ExecutorPool::availableSlots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_concurrent_ - active_;
}

PoolMetrics ExecutorPool::getMetrics() {
    int active = activeCount();
    size_t queue_depth = queue_.countByStatus(TaskStatus::QUEUED);
    return metrics_.snapshot(max_concurrent_, active, queue_depth);
}

size_t ExecutorPool::admit() {
    if (stopping_.load()) {
        return 0;
    }

    std::lock_guard<std::mutex> admission(admission_mutex_);

    // Only admission raises active_, so this bound holds until we return
    int available = availableSlots();
    if (available <= 0) {
        return 0;
    }

    std::vector<WorkflowTask> tasks;
    try {
        tasks = queue_.dequeueReady(static_cast<size_t>(available));
    } catch (const ChimeraException& e) {
        logger_->error(std::string("Admission failed: ") + e.what());
        return 0;
    }

    auto admitted_at = Clock::now();
    int active = 0;
    for (const auto& task : tasks) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++active_;
        active = active_;
        uint64_t worker_id = next_worker_id_++;
        Worker& worker = workers_[worker_id];
        worker.task_id = task.id;
        worker.thread = std::thread(&ExecutorPool::workerMain, this, worker_id, task, admitted_at);

        logger_->info("Admitted task " + task.id + " at phase " +
                      phaseToString(task.current_phase) + " (" +
                      std::to_string(active_) + "/" + std::to_string(max_concurrent_) + ")");
    }

    if (!tasks.empty()) {
        metrics_.updatePeakUtilization(static_cast<double>(active) / max_concurrent_ * 100.0);
    }

    return tasks.size();
}

void ExecutorPool::reapFinished() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->second.finished) {
                finished.push_back(std::move(it->second.thread));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& t : finished) {
        if (t.joinable()) {
            t.join();
        }
    }
}

std::set<std::string> ExecutorPool::liveTaskIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> ids;
    for (const auto& [id, worker] : workers_) {
        if (!worker.finished) {
            ids.insert(worker.task_id);
        }
    }
    return ids;
}

void ExecutorPool::workerMain(uint64_t worker_id, WorkflowTask task, Clock::time_point admitted_at) {
    const std::string task_id = task.id;

    try {
        runWorkflow(std::move(task), admitted_at);
    } catch (const std::exception& e) {
        // Left RUNNING; the poll loop re-queues it once its heartbeat is stale
        logger_->error("Worker for task " + task_id + " aborted: " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        auto it = workers_.find(worker_id);
        if (it != workers_.end()) {
            it->second.finished = true;
        }
    }
    cv_.notify_all();
}

void ExecutorPool::runWorkflow(WorkflowTask task, Clock::time_point admitted_at) {
    int retries = 0;

    while (true) {
        if (stopping_.load()) {
            queue_.requeue(task.id);
            return;
        }

        // Terminal phase persisted before a crash, status not yet set
        if (task.current_phase == ChimeraPhase::COMPLETE) {
            finishWorkflow(task, true, ChimeraPhase::E2E_VALIDATION, retries, admitted_at);
            return;
        }
        if (task.current_phase == ChimeraPhase::FAILED) {
            finishWorkflow(task, false, recordedFailedPhase(task), retries, admitted_at);
            return;
        }

        const ChimeraPhase phase = task.current_phase;

        try {
            PhaseOutcome outcome = driver_.step(task);

            switch (outcome.kind) {
                case PhaseOutcome::Kind::ADVANCE:
                    task = persistPhase(task, outcome.next_phase, outcome.context_patch);
                    break;

                case PhaseOutcome::Kind::COMPLETE:
                    task = persistPhase(task, ChimeraPhase::COMPLETE, outcome.context_patch);
                    finishWorkflow(task, true, phase, retries, admitted_at);
                    return;

                case PhaseOutcome::Kind::BUSINESS_FAILURE:
                    logger_->warn("Task " + task.id + " rejected at " + phaseToString(phase) +
                                  ": " + outcome.error);
                    failWorkflow(task.id, outcome.error, phase, outcome.context_patch,
                                 retries, admitted_at);
                    return;

                case PhaseOutcome::Kind::TRANSIENT_FAILURE: {
                    if (task.retry_count >= retry_policy_.config().max_retries) {
                        logger_->error("Task " + task.id + " exhausted retries at " +
                                       phaseToString(phase) + ": " + outcome.error);
                        failWorkflow(task.id, outcome.error, phase, nlohmann::json::object(),
                                     retries, admitted_at, true);
                        return;
                    }

                    int attempt = queue_.recordRetry(task.id, outcome.error);
                    ++retries;
                    task = queue_.get(task.id);

                    // An interrupted wait falls through to the shutdown check
                    waitBackoff(std::chrono::milliseconds(retry_policy_.calculateDelay(attempt)));
                    break;
                }
            }

        } catch (const InvalidTransitionError& e) {
            logger_->error("Task " + task.id + " invalid transition: " + e.message());
            failWorkflow(task.id, e.message(), phase, nlohmann::json::object(),
                         retries, admitted_at);
            return;
        }
    }
}

void ExecutorPool::finishWorkflow(const WorkflowTask& task,
                                  bool succeeded,
                                  ChimeraPhase last_phase,
                                  int retries,
                                  Clock::time_point admitted_at) {
    queue_.complete(task.id, succeeded);

    double duration_ms = elapsedMs(admitted_at);
    metrics_.recordWorkflow(task.id, duration_ms, succeeded, last_phase, retries);

    logger_->info("Task " + task.id + (succeeded ? " completed" : " failed") + " after " +
                  std::to_string(static_cast<long long>(duration_ms)) + " ms");
}

void ExecutorPool::failWorkflow(const std::string& task_id,
                                const std::string& error,
                                ChimeraPhase failed_phase,
                                nlohmann::json patch,
                                int retries,
                                Clock::time_point admitted_at,
                                bool dead_letter) {
    if (!patch.is_object()) {
        patch = nlohmann::json::object();
    }
    patch["last_error"] = error;
    patch["failed_phase"] = phaseToString(failed_phase);

    WorkflowTask current = queue_.get(task_id);
    if (!isTerminalPhase(current.current_phase)) {
        current = persistPhase(current, ChimeraPhase::FAILED, patch);
    }

    // Recorded before the status flips so a FAILED status implies the entry
    if (dead_letter && dead_letters_ != nullptr) {
        try {
            dead_letters_->add(DeadLetterEntry::fromTask(current, error, failed_phase));
        } catch (const ChimeraException& e) {
            logger_->error("Cannot dead-letter task " + task_id + ": " + e.what());
        }
    }

    finishWorkflow(current, false, failed_phase, retries, admitted_at);
}

WorkflowTask ExecutorPool::persistPhase(const WorkflowTask& task,
                                        ChimeraPhase phase,
                                        const nlohmann::json& patch) {
    WorkflowTask updated = queue_.updatePhase(task.id, phase, patch);
    if (updated.current_phase != task.current_phase) {
        notifyPhaseChange(task.id, task.current_phase, updated.current_phase);
    }
    return updated;
}

bool ExecutorPool::waitBackoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this] { return stopping_.load(); });
}

void ExecutorPool::notifyPhaseChange(const std::string& task_id,
                                     ChimeraPhase old_phase,
                                     ChimeraPhase new_phase) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (phase_callback_) {
        phase_callback_(task_id, old_phase, new_phase);
    }
}

} // namespace chimera
