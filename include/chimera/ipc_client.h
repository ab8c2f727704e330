/**
 * @file ipc_client.h
 * @brief Unix Domain Socket client for IPC communication
 *
 * Connects to the chimera daemon and sends requests for workflow
 * submission, inspection, metrics and shutdown.
 */

#ifndef CHIMERA_IPC_CLIENT_H
#define CHIMERA_IPC_CLIENT_H

#include "chimera/metrics.h"
#include "chimera/protocol.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace chimera {

/**
 * @brief Unix Domain Socket client for communicating with the daemon
 *
 * Every request method returns std::nullopt (or false) on failure and
 * leaves the reason in lastError(); when the daemon answered with an
 * ERROR frame, lastErrorCode() holds its ErrorCode.
 *
 * Usage:
 * @code
 * IPCClient client("/tmp/chimera.sock");
 * if (client.connect()) {
 *     auto task = client.enqueue(request);
 *     if (task) {
 *         std::cout << "Enqueued: " << task->id << std::endl;
 *     }
 *     client.disconnect();
 * }
 * @endcode
 */
class IPCClient {
public:
    explicit IPCClient(const std::string& socket_path);

    /**
     * @brief Destructor - disconnects if connected
     */
    ~IPCClient();

    // Non-copyable
    IPCClient(const IPCClient&) = delete;
    IPCClient& operator=(const IPCClient&) = delete;

    // Movable
    IPCClient(IPCClient&& other) noexcept;
    IPCClient& operator=(IPCClient&& other) noexcept;

    /**
     * @brief Connect to the daemon
     * @return true if connection succeeded, false otherwise
     */
    bool connect();

    /**
     * @brief Close the connection; safe to call when not connected
     */
    void disconnect();

    bool isConnected() const { return fd_ >= 0; }

    /// Stored record of the new workflow
    std::optional<WorkflowTask> enqueue(const EnqueueRequest& req);

    std::optional<WorkflowTask> getTask(const std::string& task_id);

    std::optional<std::vector<WorkflowTask>> listTasks(const ListRequest& req = ListRequest());

    std::optional<PoolMetrics> getMetrics();

    /// Health report as sent by the daemon (HealthReport::toJson() plus circuits)
    std::optional<nlohmann::json> getHealth();

    std::optional<DeadLetterListResponse> listDeadLetters(
        const DeadLetterListRequest& req = DeadLetterListRequest());

    /**
     * @brief Request daemon shutdown
     * @return true if the daemon acknowledged
     */
    bool shutdown();

    const std::string& socketPath() const { return socket_path_; }

    /**
     * @brief Get the last error message
     * @return The last error message, empty if no error
     */
    const std::string& lastError() const { return last_error_; }

    /// ErrorCode of the last ERROR response, 0 otherwise
    int lastErrorCode() const { return last_error_code_; }

private:
    /**
     * @brief Send a request and return the OK payload
     *
     * Sets lastError()/lastErrorCode() and returns nullopt on transport
     * failure or an ERROR response.
     */
    std::optional<std::string> request(MsgType type, const std::string& payload);

    std::string socket_path_;
    int fd_ = -1;
    std::string last_error_;
    int last_error_code_ = 0;
};

} // namespace chimera

#endif // CHIMERA_IPC_CLIENT_H
