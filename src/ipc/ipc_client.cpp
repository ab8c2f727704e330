/**
 * @file ipc_client.cpp
 * @brief Implementation of Unix Domain Socket client
 */

#include "chimera/ipc_client.h"
#include "chimera/errors.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace chimera {

using json = nlohmann::json;

// Read/Write timeout in seconds
constexpr int IO_TIMEOUT_SEC = 30;

IPCClient::IPCClient(const std::string& socket_path)
    : socket_path_(socket_path) {
}

IPCClient::~IPCClient() {
    disconnect();
}

IPCClient::IPCClient(IPCClient&& other) noexcept
    : socket_path_(std::move(other.socket_path_))
    , fd_(other.fd_)
    , last_error_(std::move(other.last_error_))
    , last_error_code_(other.last_error_code_) {
    other.fd_ = -1;
}

IPCClient& IPCClient::operator=(IPCClient&& other) noexcept {
    if (this != &other) {
        disconnect();
        socket_path_ = std::move(other.socket_path_);
        fd_ = other.fd_;
        last_error_ = std::move(other.last_error_);
        last_error_code_ = other.last_error_code_;
        other.fd_ = -1;
    }
    return *this;
}

bool IPCClient::connect() {
    if (fd_ >= 0) {
        return true;  // Already connected
    }

    last_error_.clear();
    last_error_code_ = 0;

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (socket_path_.length() >= sizeof(addr.sun_path)) {
        last_error_ = "Socket path too long";
        return false;
    }
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        last_error_ = "Failed to create socket: " + std::string(strerror(errno));
        return false;
    }

    struct timeval tv;
    tv.tv_sec = IO_TIMEOUT_SEC;
    tv.tv_usec = 0;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd_);
        fd_ = -1;

        if (err == ENOENT || err == ECONNREFUSED) {
            last_error_ = "Server is not running";
            last_error_code_ = static_cast<int>(ErrorCode::IPC_SERVER_NOT_RUNNING);
        } else {
            last_error_ = "Failed to connect: " + std::string(strerror(err));
            last_error_code_ = static_cast<int>(ErrorCode::IPC_CONNECTION_FAILED);
        }
        return false;
    }

    return true;
}

void IPCClient::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

std::optional<std::string> IPCClient::request(MsgType type, const std::string& payload) {
    last_error_.clear();
    last_error_code_ = 0;

    if (!isConnected()) {
        last_error_ = "Not connected to server";
        return std::nullopt;
    }

    std::string error;
    if (!writeFrame(fd_, type, payload, error)) {
        last_error_ = error;
        last_error_code_ = static_cast<int>(ErrorCode::IPC_SEND_FAILED);
        return std::nullopt;
    }

    MsgType response_type;
    std::string response_payload;
    if (!readFrame(fd_, response_type, response_payload, error)) {
        last_error_ = error.empty() ? "Connection closed by server" : error;
        last_error_code_ = static_cast<int>(ErrorCode::IPC_RECEIVE_FAILED);
        return std::nullopt;
    }

    if (response_type == MsgType::ERROR) {
        try {
            ErrorResponse err = ErrorResponse::fromJson(response_payload);
            last_error_ = err.message;
            last_error_code_ = err.code;
        } catch (const ChimeraException& e) {
            last_error_ = std::string("Server returned error: ") + e.what();
            last_error_code_ = static_cast<int>(ErrorCode::IPC_PROTOCOL_ERROR);
        }
        return std::nullopt;
    }

    return response_payload;
}

std::optional<WorkflowTask> IPCClient::enqueue(const EnqueueRequest& req) {
    auto payload = request(MsgType::ENQUEUE, req.toJson());
    if (!payload) {
        return std::nullopt;
    }

    try {
        return WorkflowTask::fromJson(*payload);
    } catch (const ChimeraException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
        return std::nullopt;
    }
}

std::optional<WorkflowTask> IPCClient::getTask(const std::string& task_id) {
    TaskRequest req;
    req.task_id = task_id;

    auto payload = request(MsgType::GET_TASK, req.toJson());
    if (!payload) {
        return std::nullopt;
    }

    try {
        return WorkflowTask::fromJson(*payload);
    } catch (const ChimeraException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<WorkflowTask>> IPCClient::listTasks(const ListRequest& req) {
    auto payload = request(MsgType::LIST_TASKS, req.toJson());
    if (!payload) {
        return std::nullopt;
    }

    try {
        return TaskListResponse::fromJson(*payload).tasks;
    } catch (const ChimeraException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
        return std::nullopt;
    }
}

std::optional<DeadLetterListResponse> IPCClient::listDeadLetters(const DeadLetterListRequest& req) {
    auto payload = request(MsgType::LIST_DEAD_LETTERS, req.toJson());
    if (!payload) {
        return std::nullopt;
    }

    try {
        return DeadLetterListResponse::fromJson(*payload);
    } catch (const ChimeraException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
        return std::nullopt;
    }
}

std::optional<PoolMetrics> IPCClient::getMetrics() {
    auto payload = request(MsgType::GET_METRICS, "{}");
    if (!payload) {
        return std::nullopt;
    }

    try {
        return PoolMetrics::fromJson(json::parse(*payload));
    } catch (const json::exception& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
    } catch (const ChimeraException& e) {
        last_error_ = "Failed to parse response: " + std::string(e.what());
    }
    return std::nullopt;
}

std::optional<json> IPCClient::getHealth() {
    auto payload = request(MsgType::GET_HEALTH, "{}");
    if (!payload) {
        return std::nullopt;
    }

    json report = json::parse(*payload, nullptr, false);
    if (report.is_discarded() || !report.is_object()) {
        last_error_ = "Failed to parse response: not a JSON object";
        return std::nullopt;
    }
    return report;
}

bool IPCClient::shutdown() {
    return request(MsgType::SHUTDOWN, "{}").has_value();
}

} // namespace chimera
