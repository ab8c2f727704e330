/**
 * @file errors.h
 * @brief Error codes and exception classes for chimera
 *
 * Defines the error codes used across the workflow engine and the
 * exception hierarchy raised by the task queue, phase driver and
 * daemon components.
 */

#ifndef CHIMERA_ERRORS_H
#define CHIMERA_ERRORS_H

#include <stdexcept>
#include <string>

namespace chimera {

/**
 * @brief Error codes for chimera operations
 *
 * Categorized by type:
 * - 0: Success
 * - 100-199: Task errors
 * - 200-299: Storage errors
 * - 300-399: IPC errors
 * - 400-499: File errors
 * - 500-599: Agent errors
 * - 600-699: Configuration errors
 */
enum class ErrorCode {
    SUCCESS = 0,

    // Task errors (100-199)
    TASK_NOT_FOUND = 100,
    TASK_INVALID_STATE = 102,
    TASK_ALREADY_EXISTS = 103,
    TASK_INVALID_TRANSITION = 104,

    // Storage errors (200-299)
    STORAGE_ERROR = 200,
    STORAGE_CORRUPT = 201,

    // IPC errors (300-399)
    IPC_CONNECTION_FAILED = 300,
    IPC_SERVER_NOT_RUNNING = 301,
    IPC_SEND_FAILED = 302,
    IPC_RECEIVE_FAILED = 303,
    IPC_PROTOCOL_ERROR = 304,

    // File errors (400-499)
    FILE_PARSE_ERROR = 401,
    FILE_WRITE_ERROR = 403,
    FILE_READ_ERROR = 404,

    // Agent errors (500-599)
    AGENT_CALL_FAILED = 501,
    AGENT_TIMEOUT = 502,

    // Configuration errors (600-699)
    CONFIG_INVALID = 600,
};

/**
 * @brief Convert ErrorCode to human-readable string
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return "Success";

        // Task errors
        case ErrorCode::TASK_NOT_FOUND:
            return "Task not found";
        case ErrorCode::TASK_INVALID_STATE:
            return "Invalid task state";
        case ErrorCode::TASK_ALREADY_EXISTS:
            return "Task already exists";
        case ErrorCode::TASK_INVALID_TRANSITION:
            return "Invalid phase transition";

        // Storage errors
        case ErrorCode::STORAGE_ERROR:
            return "Storage error";
        case ErrorCode::STORAGE_CORRUPT:
            return "Storage corrupt";

        // IPC errors
        case ErrorCode::IPC_CONNECTION_FAILED:
            return "IPC connection failed";
        case ErrorCode::IPC_SERVER_NOT_RUNNING:
            return "Server is not running";
        case ErrorCode::IPC_SEND_FAILED:
            return "Failed to send IPC message";
        case ErrorCode::IPC_RECEIVE_FAILED:
            return "Failed to receive IPC message";
        case ErrorCode::IPC_PROTOCOL_ERROR:
            return "IPC protocol error";

        // File errors
        case ErrorCode::FILE_PARSE_ERROR:
            return "File parse error";
        case ErrorCode::FILE_WRITE_ERROR:
            return "Failed to write file";
        case ErrorCode::FILE_READ_ERROR:
            return "Failed to read file";

        // Agent errors
        case ErrorCode::AGENT_CALL_FAILED:
            return "Agent call failed";
        case ErrorCode::AGENT_TIMEOUT:
            return "Agent call timed out";

        // Configuration errors
        case ErrorCode::CONFIG_INVALID:
            return "Invalid configuration";

        default:
            return "Unknown error";
    }
}

/**
 * @brief Base exception class for chimera errors
 *
 * Provides structured error handling with error codes and messages.
 */
class ChimeraException : public std::runtime_error {
public:
    /**
     * @brief Construct exception with error code and message
     * @param code The error code
     * @param message Additional error message
     */
    ChimeraException(ErrorCode code, const std::string& message)
        : std::runtime_error(buildMessage(code, message))
        , code_(code)
        , message_(message) {}

    /**
     * @brief Construct exception with error code only
     * @param code The error code
     */
    explicit ChimeraException(ErrorCode code)
        : std::runtime_error(errorCodeToString(code))
        , code_(code)
        , message_() {}

    /**
     * @brief Get the error code
     * @return The error code associated with this exception
     */
    ErrorCode code() const noexcept { return code_; }

    /**
     * @brief Get the additional message
     * @return The additional message (may be empty)
     */
    const std::string& message() const noexcept { return message_; }

private:
    ErrorCode code_;
    std::string message_;

    static std::string buildMessage(ErrorCode code, const std::string& message) {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        return result;
    }
};

/// Raised by enqueue when the task id is already present.
class DuplicateTaskError : public ChimeraException {
public:
    explicit DuplicateTaskError(const std::string& task_id)
        : ChimeraException(ErrorCode::TASK_ALREADY_EXISTS, task_id) {}
};

/// Raised by point lookups and mutations on an unknown task id.
class NotFoundError : public ChimeraException {
public:
    explicit NotFoundError(const std::string& task_id)
        : ChimeraException(ErrorCode::TASK_NOT_FOUND, task_id) {}
};

/// Raised when a phase or status change does not follow the pipeline.
class InvalidTransitionError : public ChimeraException {
public:
    explicit InvalidTransitionError(const std::string& message)
        : ChimeraException(ErrorCode::TASK_INVALID_TRANSITION, message) {}
};

/// Raised when the backing store cannot be read or written.
/// A store that reads back but does not parse carries STORAGE_CORRUPT.
class StorageError : public ChimeraException {
public:
    explicit StorageError(const std::string& message,
                          ErrorCode code = ErrorCode::STORAGE_ERROR)
        : ChimeraException(code, message) {}
};

/// Raised when an agent capability fails or returns an unusable result.
class AgentError : public ChimeraException {
public:
    explicit AgentError(const std::string& message)
        : ChimeraException(ErrorCode::AGENT_CALL_FAILED, message) {}
};

/// Raised when an agent capability exceeds the per-phase timeout.
class PhaseTimeoutError : public ChimeraException {
public:
    explicit PhaseTimeoutError(const std::string& message)
        : ChimeraException(ErrorCode::AGENT_TIMEOUT, message) {}
};

} // namespace chimera

#endif // CHIMERA_ERRORS_H
