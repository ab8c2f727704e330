/**
 * @file server.h
 * @brief Server class that integrates all chimera components
 *
 * The daemon that owns the task queue, agent registry, phase driver and
 * executor pool, and answers CLI requests over IPC.
 */

#ifndef CHIMERA_SERVER_H
#define CHIMERA_SERVER_H

#include "chimera/agent_registry.h"
#include "chimera/config.h"
#include "chimera/dead_letter_queue.h"
#include "chimera/executor_pool.h"
#include "chimera/health.h"
#include "chimera/ipc_server.h"
#include "chimera/logger.h"
#include "chimera/phase_driver.h"
#include "chimera/protocol.h"
#include "chimera/task_queue.h"

#include <atomic>
#include <memory>
#include <string>

namespace chimera {

/**
 * @brief Main daemon for chimera
 *
 * Integrates all components:
 * - TaskQueue for durable workflow records
 * - DeadLetterQueue for workflows that exhausted their retries
 * - AgentRegistry filled from Config::agent_commands
 * - PhaseDriver and ExecutorPool for execution
 * - HealthMonitor over pool metrics
 * - IPCServer for client communication
 *
 * Handles IPC requests:
 * - ENQUEUE: Enqueue a workflow and hint the pool
 * - GET_TASK / LIST_TASKS: Inspect records
 * - GET_METRICS / GET_HEALTH: Pool metrics, health report and circuit states
 * - LIST_DEAD_LETTERS: Page through dead letters
 * - SHUTDOWN: Graceful shutdown
 */
class Server {
public:
    /**
     * @brief Construct a Server with configuration
     * @throws ChimeraException(CONFIG_INVALID) on invalid configuration or agent commands
     */
    explicit Server(const Config& config);

    /**
     * @brief Destructor - stops the server if running
     */
    ~Server();

    // Disable copy
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Start the server
     *
     * Loads the task and dead letter queues, starts the executor pool
     * (which recovers stale tasks) and starts the IPC server.
     *
     * @return true if server started successfully
     */
    bool start();

    /**
     * @brief Stop the server
     *
     * Stops the IPC server, then the executor pool. In-flight workflows
     * are requeued at their current phase.
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Ask run() to return; safe to call from a signal handler
     */
    void requestShutdown() { shutdown_requested_ = true; }

    /**
     * @brief Run the server in the foreground
     *
     * Blocks until a signal or SHUTDOWN request arrives.
     * @return false if the server could not be started
     */
    bool run();

    /**
     * @brief Daemonize the server
     *
     * Forks and runs in the background. The parent process exits.
     *
     * @return true if daemonization was successful (in child process)
     */
    static bool daemonize();

    const Config& getConfig() const { return config_; }

    TaskQueue& getTaskQueue() { return *queue_; }

    DeadLetterQueue& getDeadLetterQueue() { return *dead_letters_; }

    const PhaseDriver& getPhaseDriver() const { return *driver_; }

    /// Registry used by the phase driver; extend before start()
    AgentRegistry& getAgentRegistry() { return *registry_; }

    ExecutorPool& getExecutorPool() { return *pool_; }

    /**
     * @brief Handle an IPC request
     * @param type Message type
     * @param data Request payload (JSON)
     * @return Response payload (JSON)
     * @throws ChimeraException mapped to an ERROR response by IPCServer
     */
    std::string handleRequest(MsgType type, const std::string& data);

private:
    std::string handleEnqueue(const std::string& data);
    std::string handleGetTask(const std::string& data);
    std::string handleListTasks(const std::string& data);
    std::string handleGetMetrics();
    std::string handleGetHealth();
    std::string handleShutdown();
    std::string handleListDeadLetters(const std::string& data);

    /**
     * @brief Set up signal handlers
     */
    void setupSignalHandlers();

    /// Server configuration
    Config config_;

    std::shared_ptr<Logger> logger_;

    std::unique_ptr<TaskQueue> queue_;
    std::unique_ptr<DeadLetterQueue> dead_letters_;
    std::unique_ptr<AgentRegistry> registry_;
    std::unique_ptr<PhaseDriver> driver_;
    std::unique_ptr<ExecutorPool> pool_;
    HealthMonitor health_;
    std::unique_ptr<IPCServer> ipc_server_;

    /// Running flag
    std::atomic<bool> running_{false};

    /// Shutdown requested flag
    std::atomic<bool> shutdown_requested_{false};
};

/**
 * @brief Global server instance for signal handling
 */
extern Server* g_server_instance;

} // namespace chimera

#endif // CHIMERA_SERVER_H
