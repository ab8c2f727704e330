/**
 * @file ipc_server.cpp
 * @brief Implementation of Unix Domain Socket server
 */

#include "chimera/ipc_server.h"
#include "chimera/errors.h"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace chimera {

namespace {

// Connection backlog
constexpr int LISTEN_BACKLOG = 10;

// Poll timeout in milliseconds
constexpr int POLL_TIMEOUT_MS = 100;

// Idle connections are dropped after this long
constexpr int CLIENT_IO_TIMEOUT_SEC = 30;

} // anonymous namespace

IPCServer::IPCServer(const std::string& socket_path, std::shared_ptr<Logger> logger)
    : socket_path_(socket_path)
    , logger_(logger ? std::move(logger) : Logger::null()) {
}

IPCServer::~IPCServer() {
    stop();
}

void IPCServer::start(RequestHandler handler) {
    if (running_.load()) {
        return;  // Already running
    }

    handler_ = std::move(handler);

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (socket_path_.length() >= sizeof(addr.sun_path)) {
        throw ChimeraException(ErrorCode::IPC_CONNECTION_FAILED,
                               "Socket path too long: " + socket_path_);
    }
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    // Remove a stale socket file left by a previous run
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw ChimeraException(ErrorCode::IPC_CONNECTION_FAILED,
                               "Failed to create socket: " + std::string(strerror(errno)));
    }

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string msg = "Failed to bind socket: " + std::string(strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        throw ChimeraException(ErrorCode::IPC_CONNECTION_FAILED, msg);
    }

    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        std::string msg = "Failed to listen on socket: " + std::string(strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        throw ChimeraException(ErrorCode::IPC_CONNECTION_FAILED, msg);
    }

    running_ = true;
    accept_thread_ = std::thread(&IPCServer::acceptLoop, this);
    logger_->info("IPC server listening on " + socket_path_);
}

void IPCServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // The accept loop polls running_, so it exits within one poll timeout
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }

    std::list<Client> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.splice(clients.end(), clients_);
    }
    for (auto& client : clients) {
        if (client.thread.joinable()) {
            client.thread.join();
        }
    }

    unlink(socket_path_.c_str());
    logger_->info("IPC server stopped");
}

void IPCServer::acceptLoop() {
    while (running_.load()) {
        struct pollfd pfd;
        pfd.fd = server_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, POLL_TIMEOUT_MS);

        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_->error("IPC poll failed: " + std::string(strerror(errno)));
            break;
        }

        reapClients();

        if (ret == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                logger_->warn("IPC accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }

        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.emplace_back();
        Client* client = &clients_.back();
        client->thread = std::thread(&IPCServer::handleClient, this, client_fd, client);
    }
}

void IPCServer::reapClients() {
    std::list<Client> finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto it = clients_.begin(); it != clients_.end();) {
            auto next = std::next(it);
            if (it->done.load()) {
                finished.splice(finished.end(), clients_, it);
            }
            it = next;
        }
    }
    for (auto& client : finished) {
        if (client.thread.joinable()) {
            client.thread.join();
        }
    }
}

void IPCServer::handleClient(int client_fd, Client* client) {
    struct timeval tv;
    tv.tv_sec = CLIENT_IO_TIMEOUT_SEC;
    tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    while (running_.load()) {
        MsgType type;
        std::string payload;
        std::string error;

        if (!readFrame(client_fd, type, payload, error)) {
            if (!error.empty()) {
                logger_->warn("IPC read failed: " + error);
            }
            break;
        }

        logger_->debug("IPC request " + msgTypeToString(type));

        MsgType response_type = MsgType::OK;
        std::string response = dispatch(type, payload, response_type);

        if (!writeFrame(client_fd, response_type, response, error)) {
            logger_->warn("IPC write failed: " + error);
            break;
        }

        if (type == MsgType::SHUTDOWN) {
            break;
        }
    }

    close(client_fd);
    client->done = true;
}

std::string IPCServer::dispatch(MsgType type, const std::string& payload, MsgType& response_type) {
    ErrorResponse err;

    try {
        if (handler_) {
            response_type = MsgType::OK;
            return handler_(type, payload);
        }
        err.code = static_cast<int>(ErrorCode::IPC_PROTOCOL_ERROR);
        err.message = "No handler registered";
    } catch (const ChimeraException& e) {
        err.code = static_cast<int>(e.code());
        err.message = e.message().empty() ? std::string(e.what()) : e.message();
    } catch (const std::exception& e) {
        err.code = static_cast<int>(ErrorCode::IPC_PROTOCOL_ERROR);
        err.message = e.what();
    }

    response_type = MsgType::ERROR;
    return err.toJson();
}

} // namespace chimera
