/**
 * @file workflow_task.h
 * @brief WorkflowTask record, status and pipeline phase definitions
 *
 * Defines the persisted unit of work driven through the Chimera
 * pipeline, together with its lifecycle status and the ordered phase
 * enumeration.
 */

#ifndef CHIMERA_WORKFLOW_TASK_H
#define CHIMERA_WORKFLOW_TASK_H

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace chimera {

/**
 * @brief Workflow lifecycle status
 *
 * - QUEUED: Waiting for admission
 * - RUNNING: Admitted, occupies an executor slot
 * - COMPLETED: Pipeline reached COMPLETE
 * - FAILED: Pipeline reached FAILED
 */
enum class TaskStatus {
    QUEUED,
    RUNNING,
    COMPLETED,
    FAILED
};

/**
 * @brief Convert TaskStatus to string representation
 * @param status The task status to convert
 * @return String representation ("queued", "running", etc.)
 */
inline std::string taskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::QUEUED:    return "queued";
        case TaskStatus::RUNNING:   return "running";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED:    return "failed";
        default:                    return "unknown";
    }
}

/**
 * @brief Parse TaskStatus from string
 * @param str String representation of status
 * @return Corresponding TaskStatus enum value
 * @throws std::invalid_argument if string is not recognized
 */
inline TaskStatus taskStatusFromString(const std::string& str) {
    if (str == "queued")    return TaskStatus::QUEUED;
    if (str == "running")   return TaskStatus::RUNNING;
    if (str == "completed") return TaskStatus::COMPLETED;
    if (str == "failed")    return TaskStatus::FAILED;
    throw std::invalid_argument("Unknown task status: " + str);
}

/**
 * @brief Pipeline phases in execution order
 *
 * FAILED is a parallel terminal reachable from any non-terminal phase.
 */
enum class ChimeraPhase {
    E2E_TEST_GENERATION,
    CODE_IMPLEMENTATION,
    REVIEW,
    STAGING_DEPLOYMENT,
    E2E_VALIDATION,
    COMPLETE,
    FAILED
};

std::string phaseToString(ChimeraPhase phase);

/**
 * @brief Parse ChimeraPhase from its string form
 * @throws std::invalid_argument if string is not recognized
 */
ChimeraPhase phaseFromString(const std::string& str);

/**
 * @brief Immediate successor of a phase in the pipeline
 * @param phase Current phase
 * @return Next phase, or nullopt for COMPLETE and FAILED
 */
std::optional<ChimeraPhase> nextPhase(ChimeraPhase phase);

/// true for COMPLETE and FAILED
inline bool isTerminalPhase(ChimeraPhase phase) {
    return phase == ChimeraPhase::COMPLETE || phase == ChimeraPhase::FAILED;
}

/// Position in the pipeline; FAILED orders after every other phase.
inline int phaseOrdinal(ChimeraPhase phase) {
    return static_cast<int>(phase);
}

/**
 * @brief A workflow request moving through the Chimera pipeline
 *
 * Contains:
 * - Identification (id, sequence)
 * - Immutable inputs (feature_description, target_url)
 * - Scheduling data (priority, status, retry_count)
 * - Pipeline progress (current_phase, workflow_context)
 * - Timestamps (created_at, updated_at, heartbeat_at)
 */
struct WorkflowTask {
    /// Caller-assigned unique identifier
    std::string id;

    /// Feature to build, free-form
    std::string feature_description;

    /// URL the feature is exercised against
    std::string target_url;

    /// Higher value is served first among ready tasks
    int priority = 0;

    /// Lifecycle status
    TaskStatus status = TaskStatus::QUEUED;

    /// Pipeline position, never regresses
    ChimeraPhase current_phase = ChimeraPhase::E2E_TEST_GENERATION;

    /// Outputs accumulated by each phase (JSON object, append-only)
    nlohmann::json workflow_context = nlohmann::json::object();

    /// Retries of the current phase
    int retry_count = 0;

    /// Enqueue order, breaks created_at ties
    uint64_t sequence = 0;

    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;

    /// Last liveness signal from the worker driving this task
    std::optional<std::chrono::system_clock::time_point> heartbeat_at;

    /**
     * @brief Serialize task to a JSON value
     * @return JSON object with all fields
     */
    nlohmann::json toJsonValue() const;

    /**
     * @brief Serialize task to JSON string
     * @return JSON string representation of the task
     */
    std::string toJson() const;

    /**
     * @brief Deserialize task from a JSON value
     * @throws ChimeraException(FILE_PARSE_ERROR) on missing or mistyped fields
     */
    static WorkflowTask fromJsonValue(const nlohmann::json& j);

    /**
     * @brief Deserialize task from JSON string
     * @param json JSON string to parse
     * @return WorkflowTask object
     * @throws ChimeraException(FILE_PARSE_ERROR) if JSON is invalid
     */
    static WorkflowTask fromJson(const std::string& json);

    /**
     * @brief Check if task is in a terminal state
     * @return true if task is COMPLETED or FAILED
     */
    bool isTerminal() const {
        return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED;
    }

    /**
     * @brief Check if task can be admitted
     * @return true if task is QUEUED
     */
    bool canAdmit() const {
        return status == TaskStatus::QUEUED;
    }

    bool operator==(const WorkflowTask& other) const;
    bool operator!=(const WorkflowTask& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Format a time point as ISO 8601 UTC with milliseconds
 * @param tp Time point to convert
 * @return e.g. "2024-01-15T10:30:00.123Z"
 */
std::string formatTimestamp(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Parse a timestamp produced by formatTimestamp()
 *
 * The fractional part is optional.
 *
 * @throws std::runtime_error if parsing fails
 */
std::chrono::system_clock::time_point parseTimestamp(const std::string& str);

} // namespace chimera

#endif // CHIMERA_WORKFLOW_TASK_H
