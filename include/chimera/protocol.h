/**
 * @file protocol.h
 * @brief IPC protocol definitions for chimera
 *
 * Defines the message types, request/response payloads and framing used
 * between the chimera CLI and the daemon over a Unix Domain Socket.
 *
 * Frame format:
 * - 4 bytes: body length (network byte order)
 * - N bytes: JSON body {"type": "<MsgType>", "payload": {...}}
 */

#ifndef CHIMERA_PROTOCOL_H
#define CHIMERA_PROTOCOL_H

#include "chimera/dead_letter_queue.h"
#include "chimera/workflow_task.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chimera {

/**
 * @brief Message types for IPC communication
 *
 * Request types (1-99):
 * - ENQUEUE: Add a workflow to the queue
 * - GET_TASK: Fetch one workflow record
 * - LIST_TASKS: List workflow records
 * - GET_METRICS: Executor pool metrics snapshot
 * - GET_HEALTH: Health report
 * - SHUTDOWN: Request daemon shutdown
 * - LIST_DEAD_LETTERS: Page through dead-lettered workflows
 *
 * Response types (100+):
 * - OK: Operation succeeded
 * - ERROR: Operation failed, payload is an ErrorResponse
 */
enum class MsgType : uint8_t {
    // Request types
    ENQUEUE = 1,
    GET_TASK = 2,
    LIST_TASKS = 3,
    GET_METRICS = 4,
    GET_HEALTH = 5,
    SHUTDOWN = 6,
    LIST_DEAD_LETTERS = 7,

    // Response types
    OK = 100,
    ERROR = 101,
};

/// Largest accepted frame body (16 MB)
constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

std::string msgTypeToString(MsgType type);

/**
 * @brief Parse MsgType from string
 * @throws std::invalid_argument if string is not recognized
 */
MsgType msgTypeFromString(const std::string& str);

/**
 * @brief Request to enqueue a workflow
 */
struct EnqueueRequest {
    std::string task_id;
    std::string feature_description;
    std::string target_url;
    int priority = 0;

    std::string toJson() const;

    /**
     * @brief Deserialize request from JSON string
     * @throws ChimeraException(IPC_PROTOCOL_ERROR) if JSON is invalid
     */
    static EnqueueRequest fromJson(const std::string& json);

    bool operator==(const EnqueueRequest& other) const;
    bool operator!=(const EnqueueRequest& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Request naming a single workflow
 */
struct TaskRequest {
    std::string task_id;

    std::string toJson() const;
    static TaskRequest fromJson(const std::string& json);
};

/**
 * @brief Request to list workflows
 *
 * Without a status filter only QUEUED and RUNNING workflows are listed
 * unless include_finished is set.
 */
struct ListRequest {
    /// "queued", "running", "completed", "failed" or empty
    std::string status;

    bool include_finished = false;

    std::string toJson() const;
    static ListRequest fromJson(const std::string& json);
};

/**
 * @brief Response carrying workflow records in enqueue order
 */
struct TaskListResponse {
    std::vector<WorkflowTask> tasks;

    std::string toJson() const;
    static TaskListResponse fromJson(const std::string& json);
};

/**
 * @brief Request for one page of dead letters, newest first
 */
struct DeadLetterListRequest {
    size_t limit = 20;
    size_t offset = 0;

    std::string toJson() const;
    static DeadLetterListRequest fromJson(const std::string& json);
};

struct DeadLetterListResponse {
    std::vector<DeadLetterEntry> entries;

    /// Entries in the queue, not just on this page
    size_t total = 0;

    std::string toJson() const;
    static DeadLetterListResponse fromJson(const std::string& json);
};

/**
 * @brief Error response
 *
 * Contains error code and message when an operation fails.
 */
struct ErrorResponse {
    /// ErrorCode value
    int code = 0;

    std::string message;

    std::string toJson() const;
    static ErrorResponse fromJson(const std::string& json);

    bool operator==(const ErrorResponse& other) const {
        return code == other.code && message == other.message;
    }
    bool operator!=(const ErrorResponse& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Write one frame to a socket
 * @param fd Connected socket
 * @param type Message type
 * @param payload JSON payload; non-JSON text is sent as a JSON string
 * @param[out] error Reason on failure
 * @return true if the whole frame was written
 */
bool writeFrame(int fd, MsgType type, const std::string& payload, std::string& error);

/**
 * @brief Read one frame from a socket
 * @param fd Connected socket
 * @param[out] type Message type
 * @param[out] payload JSON payload ("{}" when absent)
 * @param[out] error Reason on failure, empty on orderly close
 * @return true if a valid frame was read
 */
bool readFrame(int fd, MsgType& type, std::string& payload, std::string& error);

} // namespace chimera

#endif // CHIMERA_PROTOCOL_H
