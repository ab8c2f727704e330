/**
 * @file main.cpp
 * @brief chimera - workflow engine CLI entry point
 *
 * Commands:
 *   chimera server [--foreground] [--log <path>] [--max-concurrent N] [--agent role=path ...]
 *   chimera stop
 *   chimera submit <id> --feature <text> --url <url> [--priority N]
 *   chimera status <id>
 *   chimera list [all] [--status <status>]
 *   chimera metrics
 *   chimera health
 *   chimera dead-letters [--limit N] [--offset N]
 */

#include "chimera/config.h"
#include "chimera/errors.h"
#include "chimera/ipc_client.h"
#include "chimera/protocol.h"
#include "chimera/server.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace chimera {

// Version information
const char* VERSION = "1.0.0";

// ANSI color codes
namespace Color {
    inline bool isTerminal() {
        return isatty(fileno(stdout)) != 0;
    }

    inline std::string green() { return isTerminal() ? "\033[32m" : ""; }
    inline std::string yellow() { return isTerminal() ? "\033[33m" : ""; }
    inline std::string red() { return isTerminal() ? "\033[31m" : ""; }
    inline std::string cyan() { return isTerminal() ? "\033[36m" : ""; }
    inline std::string reset() { return isTerminal() ? "\033[0m" : ""; }
}

void printVersion() {
    std::cout << "chimera version " << VERSION << "\n"
              << "Durable multi-agent workflow engine\n";
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  server    Start the workflow daemon\n"
              << "  stop      Stop the running daemon\n"
              << "  submit    Enqueue a workflow\n"
              << "  status    Show one workflow record\n"
              << "  list      List workflows (list all: include finished)\n"
              << "  metrics   Show executor pool metrics\n"
              << "  health    Show health status, alerts and recommendations\n"
              << "  dead-letters  List workflows that exhausted their retries\n"
              << "\n"
              << "Server options:\n"
              << "  --foreground             Run in foreground (don't daemonize)\n"
              << "  --log <path>             Write logs to the specified directory\n"
              << "  --log-level <level>      debug, info, warn or error (default: info)\n"
              << "  --data-dir <path>        Directory for tasks.json\n"
              << "  --max-concurrent <n>     Workflows running at once (default: 3)\n"
              << "  --phase-timeout <ms>     Limit for one agent call (default: 300000)\n"
              << "  --max-retries <n>        Retries per phase (default: 3)\n"
              << "  --poll-interval <ms>     Admission poll interval (default: 1000)\n"
              << "  --agent <role>=<path>    Executable implementing an agent role\n"
              << "  --circuit-threshold <n>  Consecutive agent failures that open a circuit (default: 5)\n"
              << "\n"
              << "Submit options:\n"
              << "  --feature <text>         Feature description (required)\n"
              << "  --url <url>              Target URL (required)\n"
              << "  --priority <n>           Higher runs first (default: 0)\n"
              << "\n"
              << "Common options:\n"
              << "  --socket <path>          Daemon socket (default: /tmp/chimera_<user>.sock)\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " server --log ~/.chimera/logs --agent coder-agent=/opt/agents/coder\n"
              << "  " << program << " submit login-42 --feature \"Add login\" --url https://app.example\n"
              << "  " << program << " status login-42\n"
              << "  " << program << " list all\n"
              << "  " << program << " metrics\n"
              << "  " << program << " dead-letters --limit 10\n"
              << "  " << program << " stop\n";
}

namespace {

bool connectOrReport(IPCClient& client) {
    if (client.connect()) {
        return true;
    }
    std::cerr << "Error: Cannot connect to server: " << client.lastError() << "\n";
    std::cerr << "Start the server with: chimera server\n";
    return false;
}

std::string colorForStatus(TaskStatus status) {
    switch (status) {
        case TaskStatus::RUNNING:   return Color::green();
        case TaskStatus::QUEUED:    return Color::yellow();
        case TaskStatus::COMPLETED: return Color::cyan();
        case TaskStatus::FAILED:    return Color::red();
        default:                    return "";
    }
}

std::string colorForHealth(const std::string& status) {
    if (status == "healthy") return Color::green();
    if (status == "warning") return Color::yellow();
    return Color::red();
}

std::string formatDouble(double value, int precision = 1) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // anonymous namespace

// Server command
int handleServer(int argc, char* argv[]) {
    Config config = Config::fromArgs(argc, argv);
    bool foreground = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        }
    }

    // Check if server is already running
    IPCClient probe(config.socket_path);
    if (probe.connect()) {
        std::cerr << "Error: Server is already running\n";
        return 1;
    }

    std::cout << "Starting chimera server...\n";
    std::cout << "  Socket: " << config.socket_path << "\n";
    std::cout << "  Data dir: " << config.data_dir << "\n";
    if (config.enable_logging) {
        std::cout << "  Log dir: " << config.log_dir << "\n";
    }
    std::cout << "  Max concurrent: " << config.max_concurrent << "\n";
    std::cout << "  Agents: " << config.agent_commands.size() << " role(s) bound\n";

    try {
        Server server(config);

        if (!foreground) {
            std::cout << "Daemonizing...\n";
            std::cout.flush();
            if (!Server::daemonize()) {
                std::cerr << "Error: Failed to daemonize\n";
                return 1;
            }
        }

        if (!server.run()) {
            std::cerr << "Error: Server failed to start\n";
            return 1;
        }
    } catch (const ChimeraException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

// Stop command
int handleStop(int argc, char* argv[]) {
    Config config = Config::fromArgs(argc, argv);
    IPCClient client(config.socket_path);

    if (!client.connect()) {
        std::cerr << "Server is not running\n";
        return 1;
    }

    if (!client.shutdown()) {
        std::cerr << "Error: Failed to stop server: " << client.lastError() << "\n";
        return 1;
    }

    std::cout << "Server stopping (in-flight workflows are requeued)\n";
    return 0;
}

// Submit command
int handleSubmit(int argc, char* argv[]) {
    if (argc < 3 || argv[2][0] == '-') {
        std::cerr << "Error: Missing workflow id\n";
        std::cerr << "Usage: chimera submit <id> --feature <text> --url <url> [--priority N]\n";
        return 1;
    }

    EnqueueRequest req;
    req.task_id = argv[2];

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--feature" && i + 1 < argc) {
            req.feature_description = argv[++i];
        } else if (arg == "--url" && i + 1 < argc) {
            req.target_url = argv[++i];
        } else if ((arg == "--priority" || arg == "-p") && i + 1 < argc) {
            try {
                req.priority = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid priority: " << argv[i] << "\n";
                return 1;
            }
        }
    }

    if (req.feature_description.empty() || req.target_url.empty()) {
        std::cerr << "Error: --feature and --url are required\n";
        return 1;
    }

    Config config = Config::fromArgs(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectOrReport(client)) {
        return 1;
    }

    auto task = client.enqueue(req);
    if (!task.has_value()) {
        std::cerr << "Error: Failed to enqueue workflow: " << client.lastError() << "\n";
        return 1;
    }

    std::cout << "Workflow " << task->id << " enqueued\n";
    return 0;
}

// Status command
int handleStatus(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Error: Missing workflow id\n";
        std::cerr << "Usage: chimera status <id>\n";
        return 1;
    }

    Config config = Config::fromArgs(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectOrReport(client)) {
        return 1;
    }

    auto task = client.getTask(argv[2]);
    if (!task.has_value()) {
        if (client.lastErrorCode() == static_cast<int>(ErrorCode::TASK_NOT_FOUND)) {
            std::cerr << "Error: Workflow " << argv[2] << " not found\n";
        } else {
            std::cerr << "Error: " << client.lastError() << "\n";
        }
        return 1;
    }

    const WorkflowTask& t = *task;
    std::cout << "Workflow:   " << t.id << "\n"
              << "Status:     " << colorForStatus(t.status) << taskStatusToString(t.status)
              << Color::reset() << "\n"
              << "Phase:      " << phaseToString(t.current_phase) << "\n"
              << "Priority:   " << t.priority << "\n"
              << "Retries:    " << t.retry_count << "\n"
              << "Feature:    " << t.feature_description << "\n"
              << "Target URL: " << t.target_url << "\n"
              << "Created:    " << formatTimestamp(t.created_at) << "\n"
              << "Updated:    " << formatTimestamp(t.updated_at) << "\n";
    if (t.heartbeat_at.has_value()) {
        std::cout << "Heartbeat:  " << formatTimestamp(*t.heartbeat_at) << "\n";
    }
    std::cout << "Context:\n" << t.workflow_context.dump(2) << "\n";

    return 0;
}

// List command
int handleList(int argc, char* argv[]) {
    ListRequest req;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "all") {
            req.include_finished = true;
        } else if (arg == "--status" && i + 1 < argc) {
            req.status = argv[++i];
        }
    }

    Config config = Config::fromArgs(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectOrReport(client)) {
        return 1;
    }

    auto tasks = client.listTasks(req);
    if (!tasks.has_value()) {
        std::cerr << "Error: Failed to list workflows: " << client.lastError() << "\n";
        return 1;
    }

    std::cout << std::left
              << std::setw(24) << "ID"
              << std::setw(12) << "STATUS"
              << std::setw(22) << "PHASE"
              << std::setw(10) << "PRIORITY"
              << std::setw(9) << "RETRIES"
              << "FEATURE\n";
    std::cout << std::string(100, '-') << "\n";

    size_t counts[4] = {0, 0, 0, 0};
    for (const auto& task : *tasks) {
        counts[static_cast<int>(task.status)]++;
        std::cout << std::left
                  << std::setw(24) << task.id
                  << colorForStatus(task.status) << std::setw(12)
                  << taskStatusToString(task.status) << Color::reset()
                  << std::setw(22) << phaseToString(task.current_phase)
                  << std::setw(10) << task.priority
                  << std::setw(9) << task.retry_count
                  << task.feature_description << "\n";
    }

    std::cout << "\nTotal: "
              << Color::green() << counts[static_cast<int>(TaskStatus::RUNNING)] << " running"
              << Color::reset() << ", "
              << Color::yellow() << counts[static_cast<int>(TaskStatus::QUEUED)] << " queued"
              << Color::reset();
    if (req.include_finished) {
        std::cout << ", " << Color::cyan() << counts[static_cast<int>(TaskStatus::COMPLETED)]
                  << " completed" << Color::reset()
                  << ", " << Color::red() << counts[static_cast<int>(TaskStatus::FAILED)]
                  << " failed" << Color::reset();
    }
    std::cout << "\n";

    return 0;
}

// Metrics command
int handleMetrics(int argc, char* argv[]) {
    Config config = Config::fromArgs(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectOrReport(client)) {
        return 1;
    }

    auto metrics = client.getMetrics();
    if (!metrics.has_value()) {
        std::cerr << "Error: Failed to get metrics: " << client.lastError() << "\n";
        return 1;
    }

    const PoolMetrics& m = *metrics;
    std::cout << "Pool:        " << m.active_workflows << "/" << m.pool_size << " active, "
              << m.available_slots << " free ("
              << formatDouble(m.pool_utilization_pct) << "%, peak "
              << formatDouble(m.peak_utilization_pct) << "%)\n"
              << "Queue:       " << m.queue_depth << " waiting (" << m.queue_depth_trend << ")\n"
              << "Processed:   " << m.total_workflows_processed << " ("
              << m.total_workflows_succeeded << " succeeded, "
              << m.total_workflows_failed << " failed)\n"
              << "Success:     " << formatDouble(m.success_rate * 100.0) << "%\n"
              << "Duration:    avg " << formatDouble(m.avg_workflow_duration_ms, 0) << " ms, p50 "
              << formatDouble(m.p50_workflow_duration_ms, 0) << " ms, p95 "
              << formatDouble(m.p95_workflow_duration_ms, 0) << " ms, p99 "
              << formatDouble(m.p99_workflow_duration_ms, 0) << " ms ("
              << m.latency_trend << ")\n"
              << "Retries:     " << formatDouble(m.retry_success_rate * 100.0)
              << "% of retried workflows succeeded\n";

    if (!m.failure_rate_by_phase.empty()) {
        std::cout << "Failure rate by phase:\n";
        for (const auto& [phase, rate] : m.failure_rate_by_phase) {
            std::cout << "  " << std::left << std::setw(22) << phase
                      << formatDouble(rate * 100.0) << "%\n";
        }
    }

    return 0;
}

// Health command
int handleHealth(int argc, char* argv[]) {
    Config config = Config::fromArgs(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectOrReport(client)) {
        return 1;
    }

    auto report = client.getHealth();
    if (!report.has_value()) {
        std::cerr << "Error: Failed to get health: " << client.lastError() << "\n";
        return 1;
    }

    std::string status = report->value("status", "unknown");
    std::cout << "Status: " << colorForHealth(status) << status << Color::reset() << "\n";

    const auto& alerts = report->value("alerts", nlohmann::json::array());
    for (const auto& alert : alerts) {
        std::cout << "  [" << alert.value("severity", "") << "] "
                  << alert.value("metric", "") << ": "
                  << alert.value("message", "") << "\n";
    }

    const auto& recommendations = report->value("recommendations", nlohmann::json::array());
    if (!recommendations.empty()) {
        std::cout << "Recommendations:\n";
        for (const auto& rec : recommendations) {
            std::cout << "  " << rec.get<std::string>() << "\n";
        }
    }

    const auto& circuits = report->value("circuits", nlohmann::json::array());
    for (const auto& circuit : circuits) {
        std::string state = circuit.value("state", "");
        if (state == "closed") {
            continue;
        }
        std::cout << "  circuit " << circuit.value("name", "") << ": "
                  << Color::red() << state << Color::reset() << "\n";
    }

    size_t dead_letters = report->value("dead_letters", static_cast<size_t>(0));
    if (dead_letters > 0) {
        std::cout << "Dead letters: " << dead_letters
                  << " (see chimera dead-letters)\n";
    }

    // Non-zero exit lets scripts alert on degraded health
    return status == "healthy" ? 0 : 2;
}

// Dead letters command
int handleDeadLetters(int argc, char* argv[]) {
    DeadLetterListRequest req;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--limit" || arg == "--offset") && i + 1 < argc) {
            try {
                long value = std::stol(argv[++i]);
                if (value < 0) {
                    throw std::out_of_range(arg);
                }
                (arg == "--limit" ? req.limit : req.offset) = static_cast<size_t>(value);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid " << arg << ": " << argv[i] << "\n";
                return 1;
            }
        }
    }

    Config config = Config::fromArgs(argc, argv);
    IPCClient client(config.socket_path);
    if (!connectOrReport(client)) {
        return 1;
    }

    auto response = client.listDeadLetters(req);
    if (!response.has_value()) {
        std::cerr << "Error: Failed to list dead letters: " << client.lastError() << "\n";
        return 1;
    }

    std::cout << std::left
              << std::setw(24) << "ID"
              << std::setw(22) << "PHASE"
              << std::setw(9) << "RETRIES"
              << std::setw(22) << "FAILED AT"
              << "REASON\n";
    std::cout << std::string(100, '-') << "\n";

    for (const auto& entry : response->entries) {
        std::cout << std::left
                  << std::setw(24) << entry.task_id
                  << std::setw(22) << entry.last_error_phase
                  << std::setw(9) << entry.retry_count
                  << std::setw(22) << formatTimestamp(entry.failed_at)
                  << Color::red() << entry.failure_reason << Color::reset() << "\n";
    }

    std::cout << "\nShowing " << response->entries.size() << " of " << response->total
              << " dead-lettered workflow(s)\n";
    return 0;
}

int run(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "server") {
        return handleServer(argc, argv);
    } else if (command == "stop") {
        return handleStop(argc, argv);
    } else if (command == "submit") {
        return handleSubmit(argc, argv);
    } else if (command == "status") {
        return handleStatus(argc, argv);
    } else if (command == "list") {
        return handleList(argc, argv);
    } else if (command == "metrics") {
        return handleMetrics(argc, argv);
    } else if (command == "health") {
        return handleHealth(argc, argv);
    } else if (command == "dead-letters") {
        return handleDeadLetters(argc, argv);
    } else if (command == "-h" || command == "--help") {
        printUsage(argv[0]);
        return 0;
    } else if (command == "-v" || command == "--version") {
        printVersion();
        return 0;
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;
    }
}

} // namespace chimera

int main(int argc, char* argv[]) {
    return chimera::run(argc, argv);
}
