/**
 * @file server.cpp
 * @brief Implementation of Server class
 *
 * Main daemon that integrates all chimera components.
 */

#include "chimera/server.h"
#include "chimera/command_agent.h"
#include "chimera/errors.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <thread>
#include <unistd.h>

namespace chimera {

// Global server instance for signal handling
Server* g_server_instance = nullptr;

// Only flips an atomic flag; run() does the actual stop
static void signalHandler(int /* signum */) {
    if (g_server_instance) {
        g_server_instance->requestShutdown();
    }
}

namespace {

std::shared_ptr<Logger> makeLogger(const Config& config) {
    std::string dir = config.enable_logging ? config.log_dir : "";
    return std::make_shared<Logger>(dir, logLevelFromString(config.log_level));
}

const Config& validated(const Config& config) {
    config.validate();
    return config;
}

} // anonymous namespace

Server::Server(const Config& config)
    : config_(validated(config))
    , logger_(makeLogger(config_)) {
    if (!config_.data_dir.empty() && !Config::createDirectoryRecursive(config_.data_dir)) {
        logger_->warn("Cannot create data directory " + config_.data_dir);
    }

    queue_ = std::make_unique<TaskQueue>(config_.data_dir, logger_, config_.storageRetryConfig());
    dead_letters_ = std::make_unique<DeadLetterQueue>(config_.data_dir, logger_,
                                                      config_.storageRetryConfig());
    registry_ = std::make_unique<AgentRegistry>();

    const std::chrono::milliseconds phase_timeout(config_.phase_timeout_ms);
    size_t bound = CommandAgent::registerAll(*registry_, config_.agent_commands, phase_timeout, logger_);

    driver_ = std::make_unique<PhaseDriver>(*registry_, phase_timeout, logger_,
                                            config_.circuitBreakerConfig());
    pool_ = std::make_unique<ExecutorPool>(*queue_, *driver_, config_, logger_,
                                           dead_letters_.get());
    ipc_server_ = std::make_unique<IPCServer>(config_.socket_path, logger_);

    logger_->info("Server initialized");
    logger_->debug("Config: socket_path=" + config_.socket_path +
                   ", data_dir=" + config_.data_dir +
                   ", max_concurrent=" + std::to_string(config_.max_concurrent) +
                   ", phase_timeout_ms=" + std::to_string(config_.phase_timeout_ms) +
                   ", agent capabilities=" + std::to_string(bound));
}

Server::~Server() {
    stop();
    if (g_server_instance == this) {
        g_server_instance = nullptr;
    }
}

bool Server::start() {
    if (running_.exchange(true)) {
        return true;  // Already running
    }

    logger_->info("Starting server...");
    shutdown_requested_ = false;

    // Set global instance for signal handling
    g_server_instance = this;
    setupSignalHandlers();

    try {
        queue_->initialize();
        logger_->info("Task queue loaded: " + std::to_string(queue_->size()) + " record(s)");
        dead_letters_->initialize();

        pool_->start();

        ipc_server_->start([this](MsgType type, const std::string& data) {
            return handleRequest(type, data);
        });
    } catch (const ChimeraException& e) {
        logger_->error(std::string("Server start failed: ") + e.what());
        pool_->stop();
        running_ = false;
        return false;
    }

    logger_->info("Server started successfully");
    return true;
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    logger_->info("Stopping server...");
    shutdown_requested_ = true;

    // Stop IPC server first (stop accepting new requests)
    ipc_server_->stop();
    pool_->stop();

    logger_->info("Server stopped");
}

bool Server::isRunning() const {
    return running_.load();
}

bool Server::run() {
    if (!start()) {
        return false;
    }

    // Wait for shutdown signal
    while (running_.load() && !shutdown_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    stop();
    return true;
}

bool Server::daemonize() {
    pid_t pid = fork();

    if (pid < 0) {
        return false;  // Fork failed
    }
    if (pid > 0) {
        _exit(0);  // Parent process
    }

    // Child process - become session leader
    if (setsid() < 0) {
        return false;
    }

    // Fork again to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) {
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }

    if (chdir("/") != 0) {
        return false;
    }

    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDOUT_FILENO);
        dup2(null_fd, STDERR_FILENO);
        if (null_fd > 2) {
            close(null_fd);
        }
    }

    return true;
}

std::string Server::handleRequest(MsgType type, const std::string& data) {
    switch (type) {
        case MsgType::ENQUEUE:
            return handleEnqueue(data);
        case MsgType::GET_TASK:
            return handleGetTask(data);
        case MsgType::LIST_TASKS:
            return handleListTasks(data);
        case MsgType::GET_METRICS:
            return handleGetMetrics();
        case MsgType::GET_HEALTH:
            return handleGetHealth();
        case MsgType::SHUTDOWN:
            return handleShutdown();
        case MsgType::LIST_DEAD_LETTERS:
            return handleListDeadLetters(data);
        default:
            throw ChimeraException(ErrorCode::IPC_PROTOCOL_ERROR,
                                   "Unexpected message type " + msgTypeToString(type));
    }
}

std::string Server::handleEnqueue(const std::string& data) {
    EnqueueRequest req = EnqueueRequest::fromJson(data);

    WorkflowTask task = queue_->enqueue(req.task_id, req.feature_description,
                                        req.target_url, req.priority);
    pool_->submitWorkflow(task);
    return task.toJson();
}

std::string Server::handleGetTask(const std::string& data) {
    TaskRequest req = TaskRequest::fromJson(data);
    return queue_->get(req.task_id).toJson();
}

std::string Server::handleListTasks(const std::string& data) {
    ListRequest req = ListRequest::fromJson(data);
    TaskListResponse resp;

    if (!req.status.empty()) {
        TaskStatus status;
        try {
            status = taskStatusFromString(req.status);
        } catch (const std::invalid_argument& e) {
            throw ChimeraException(ErrorCode::IPC_PROTOCOL_ERROR, e.what());
        }
        resp.tasks = queue_->list(status);
    } else {
        for (auto& task : queue_->list()) {
            if (req.include_finished || !task.isTerminal()) {
                resp.tasks.push_back(std::move(task));
            }
        }
    }

    return resp.toJson();
}

std::string Server::handleGetMetrics() {
    return pool_->getMetrics().toJson().dump();
}

std::string Server::handleGetHealth() {
    HealthReport report = health_.assess(pool_->getMetrics());
    if (!report.healthy()) {
        logger_->warn("Health " + healthStatusToString(report.status) + ": " +
                      std::to_string(report.alerts.size()) + " alert(s)");
    }

    nlohmann::json j = report.toJson();
    j["circuits"] = driver_->circuitMetrics();
    j["dead_letters"] = dead_letters_->count();
    return j.dump();
}

std::string Server::handleListDeadLetters(const std::string& data) {
    DeadLetterListRequest req = DeadLetterListRequest::fromJson(data);

    DeadLetterListResponse resp;
    resp.entries = dead_letters_->list(req.limit, req.offset);
    resp.total = dead_letters_->count();
    return resp.toJson();
}

std::string Server::handleShutdown() {
    logger_->info("Shutdown request received");

    nlohmann::json response;
    response["success"] = true;
    response["message"] = "Server shutting down";

    // Processed by run() after the response is sent
    shutdown_requested_ = true;

    return response.dump();
}

void Server::setupSignalHandlers() {
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    // Ignore SIGPIPE (broken pipe)
    signal(SIGPIPE, SIG_IGN);
}

} // namespace chimera
