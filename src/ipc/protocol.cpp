/**
 * @file protocol.cpp
 * @brief Implementation of IPC message serialization and framing
 */

#include "chimera/protocol.h"
#include "chimera/errors.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>  // for htonl, ntohl
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace chimera {

using json = nlohmann::json;

namespace {

[[noreturn]] void throwParseError(const char* what, const std::exception& e) {
    throw ChimeraException(ErrorCode::IPC_PROTOCOL_ERROR,
                           std::string("Failed to parse ") + what + " JSON: " + e.what());
}

bool readExact(int fd, void* buffer, size_t n) {
    char* buf = static_cast<char*>(buffer);
    size_t total_read = 0;

    while (total_read < n) {
        ssize_t bytes_read = read(fd, buf + total_read, n - total_read);

        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (bytes_read == 0) {
            return false;  // Connection closed
        }

        total_read += static_cast<size_t>(bytes_read);
    }

    return true;
}

bool writeExact(int fd, const void* buffer, size_t n) {
    const char* buf = static_cast<const char*>(buffer);
    size_t total_written = 0;

    while (total_written < n) {
        // MSG_NOSIGNAL: a vanished peer is an error return, not SIGPIPE
        ssize_t bytes_written = send(fd, buf + total_written, n - total_written, MSG_NOSIGNAL);

        if (bytes_written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }

        total_written += static_cast<size_t>(bytes_written);
    }

    return true;
}

} // anonymous namespace

// ============================================================================
// MsgType conversion functions
// ============================================================================

std::string msgTypeToString(MsgType type) {
    switch (type) {
        case MsgType::ENQUEUE:     return "ENQUEUE";
        case MsgType::GET_TASK:    return "GET_TASK";
        case MsgType::LIST_TASKS:  return "LIST_TASKS";
        case MsgType::GET_METRICS: return "GET_METRICS";
        case MsgType::GET_HEALTH:  return "GET_HEALTH";
        case MsgType::SHUTDOWN:    return "SHUTDOWN";
        case MsgType::LIST_DEAD_LETTERS: return "LIST_DEAD_LETTERS";
        case MsgType::OK:          return "OK";
        case MsgType::ERROR:       return "ERROR";
        default:                   return "UNKNOWN";
    }
}

MsgType msgTypeFromString(const std::string& str) {
    if (str == "ENQUEUE")     return MsgType::ENQUEUE;
    if (str == "GET_TASK")    return MsgType::GET_TASK;
    if (str == "LIST_TASKS")  return MsgType::LIST_TASKS;
    if (str == "GET_METRICS") return MsgType::GET_METRICS;
    if (str == "GET_HEALTH")  return MsgType::GET_HEALTH;
    if (str == "SHUTDOWN")    return MsgType::SHUTDOWN;
    if (str == "LIST_DEAD_LETTERS") return MsgType::LIST_DEAD_LETTERS;
    if (str == "OK")          return MsgType::OK;
    if (str == "ERROR")       return MsgType::ERROR;
    throw std::invalid_argument("Unknown message type: " + str);
}

// ============================================================================
// EnqueueRequest
// ============================================================================

std::string EnqueueRequest::toJson() const {
    json j;
    j["task_id"] = task_id;
    j["feature_description"] = feature_description;
    j["target_url"] = target_url;
    j["priority"] = priority;
    return j.dump();
}

EnqueueRequest EnqueueRequest::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        if (!j.contains("task_id") || !j.contains("feature_description") ||
            !j.contains("target_url")) {
            throw ChimeraException(ErrorCode::IPC_PROTOCOL_ERROR,
                                   "EnqueueRequest missing required fields");
        }

        EnqueueRequest req;
        req.task_id = j["task_id"].get<std::string>();
        req.feature_description = j["feature_description"].get<std::string>();
        req.target_url = j["target_url"].get<std::string>();
        req.priority = j.value("priority", 0);
        return req;

    } catch (const json::exception& e) {
        throwParseError("EnqueueRequest", e);
    }
}

bool EnqueueRequest::operator==(const EnqueueRequest& other) const {
    return task_id == other.task_id &&
           feature_description == other.feature_description &&
           target_url == other.target_url &&
           priority == other.priority;
}

// ============================================================================
// TaskRequest
// ============================================================================

std::string TaskRequest::toJson() const {
    json j;
    j["task_id"] = task_id;
    return j.dump();
}

TaskRequest TaskRequest::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        TaskRequest req;
        req.task_id = j.at("task_id").get<std::string>();
        return req;

    } catch (const json::exception& e) {
        throwParseError("TaskRequest", e);
    }
}

// ============================================================================
// ListRequest
// ============================================================================

std::string ListRequest::toJson() const {
    json j;
    j["status"] = status;
    j["include_finished"] = include_finished;
    return j.dump();
}

ListRequest ListRequest::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        ListRequest req;
        req.status = j.value("status", "");
        req.include_finished = j.value("include_finished", false);
        return req;

    } catch (const json::exception& e) {
        throwParseError("ListRequest", e);
    }
}

// ============================================================================
// TaskListResponse
// ============================================================================

std::string TaskListResponse::toJson() const {
    json j;
    j["tasks"] = json::array();
    for (const auto& task : tasks) {
        j["tasks"].push_back(task.toJsonValue());
    }
    return j.dump();
}

TaskListResponse TaskListResponse::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        TaskListResponse resp;
        for (const auto& item : j.at("tasks")) {
            resp.tasks.push_back(WorkflowTask::fromJsonValue(item));
        }
        return resp;

    } catch (const json::exception& e) {
        throwParseError("TaskListResponse", e);
    }
}

// ============================================================================
// DeadLetterListRequest / DeadLetterListResponse
// ============================================================================

std::string DeadLetterListRequest::toJson() const {
    json j;
    j["limit"] = limit;
    j["offset"] = offset;
    return j.dump();
}

DeadLetterListRequest DeadLetterListRequest::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        DeadLetterListRequest req;
        req.limit = j.value("limit", req.limit);
        req.offset = j.value("offset", req.offset);
        return req;

    } catch (const json::exception& e) {
        throwParseError("DeadLetterListRequest", e);
    }
}

std::string DeadLetterListResponse::toJson() const {
    json j;
    j["entries"] = json::array();
    for (const auto& entry : entries) {
        j["entries"].push_back(entry.toJsonValue());
    }
    j["total"] = total;
    return j.dump();
}

DeadLetterListResponse DeadLetterListResponse::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        DeadLetterListResponse resp;
        for (const auto& item : j.at("entries")) {
            resp.entries.push_back(DeadLetterEntry::fromJsonValue(item));
        }
        resp.total = j.value("total", resp.entries.size());
        return resp;

    } catch (const json::exception& e) {
        throwParseError("DeadLetterListResponse", e);
    }
}

// ============================================================================
// ErrorResponse
// ============================================================================

std::string ErrorResponse::toJson() const {
    json j;
    j["code"] = code;
    j["message"] = message;
    return j.dump();
}

ErrorResponse ErrorResponse::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        ErrorResponse resp;
        resp.code = j.value("code", 0);
        resp.message = j.value("message", "");
        return resp;

    } catch (const json::exception& e) {
        throwParseError("ErrorResponse", e);
    }
}

// ============================================================================
// Framing
// ============================================================================

bool writeFrame(int fd, MsgType type, const std::string& payload, std::string& error) {
    json j;
    j["type"] = msgTypeToString(type);

    // Payloads are JSON documents; anything else travels as a string
    json body = json::parse(payload, nullptr, false);
    if (body.is_discarded()) {
        j["payload"] = payload;
    } else {
        j["payload"] = std::move(body);
    }

    std::string message = j.dump();
    if (message.size() > MAX_MESSAGE_SIZE) {
        error = "Message too large";
        return false;
    }

    uint32_t length_net = htonl(static_cast<uint32_t>(message.size()));

    if (!writeExact(fd, &length_net, sizeof(length_net))) {
        error = "Failed to send message header: " + std::string(strerror(errno));
        return false;
    }
    if (!writeExact(fd, message.data(), message.size())) {
        error = "Failed to send message body: " + std::string(strerror(errno));
        return false;
    }

    return true;
}

bool readFrame(int fd, MsgType& type, std::string& payload, std::string& error) {
    error.clear();

    uint32_t length_net;
    if (!readExact(fd, &length_net, sizeof(length_net))) {
        return false;  // Closed between frames
    }

    uint32_t length = ntohl(length_net);
    if (length == 0 || length > MAX_MESSAGE_SIZE) {
        error = "Invalid message length";
        return false;
    }

    std::string message(length, '\0');
    if (!readExact(fd, &message[0], length)) {
        error = "Failed to read message body";
        return false;
    }

    try {
        json j = json::parse(message);

        if (!j.contains("type")) {
            error = "Message missing type field";
            return false;
        }

        type = msgTypeFromString(j["type"].get<std::string>());

        if (!j.contains("payload")) {
            payload = "{}";
        } else if (j["payload"].is_string()) {
            payload = j["payload"].get<std::string>();
        } else {
            payload = j["payload"].dump();
        }

        return true;

    } catch (const json::exception& e) {
        error = std::string("Failed to parse message: ") + e.what();
    } catch (const std::invalid_argument& e) {
        error = e.what();
    }
    return false;
}

} // namespace chimera
