/**
 * @file ipc_server.h
 * @brief Unix Domain Socket server for IPC communication
 *
 * Listens on a Unix Domain Socket and hands each decoded request to a
 * handler supplied by the daemon. Each connection is served on its own
 * thread.
 */

#ifndef CHIMERA_IPC_SERVER_H
#define CHIMERA_IPC_SERVER_H

#include "chimera/logger.h"
#include "chimera/protocol.h"

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chimera {

/**
 * @brief Unix Domain Socket server for handling IPC requests
 *
 * Usage:
 * @code
 * IPCServer server("/tmp/chimera.sock");
 * server.start([](MsgType type, const std::string& payload) {
 *     return response_json;
 * });
 * // ... later
 * server.stop();
 * @endcode
 *
 * A handler that throws ChimeraException produces an ERROR frame
 * carrying the exception's code and message.
 */
class IPCServer {
public:
    /**
     * @brief Request handler function type
     * @param type The message type
     * @param payload The JSON payload string
     * @return JSON response string sent back with type OK
     */
    using RequestHandler = std::function<std::string(MsgType, const std::string&)>;

    /**
     * @brief Construct an IPC server
     * @param socket_path Path to the Unix Domain Socket
     * @param logger Log sink (null = disabled)
     */
    explicit IPCServer(const std::string& socket_path,
                       std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Destructor - stops the server if running
     */
    ~IPCServer();

    // Non-copyable
    IPCServer(const IPCServer&) = delete;
    IPCServer& operator=(const IPCServer&) = delete;

    /**
     * @brief Bind the socket and start accepting in a background thread
     * @param handler Function to handle incoming requests
     * @throws ChimeraException(IPC_CONNECTION_FAILED) if the socket cannot be bound
     */
    void start(RequestHandler handler);

    /**
     * @brief Stop accepting, wait for open connections and remove the socket file
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    const std::string& socketPath() const { return socket_path_; }

private:
    struct Client {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    /**
     * @brief Main accept loop running in background thread
     */
    void acceptLoop();

    /**
     * @brief Serve requests on one connection until it closes
     */
    void handleClient(int client_fd, Client* client);

    /**
     * @brief Run the handler and map exceptions to an ErrorResponse
     */
    std::string dispatch(MsgType type, const std::string& payload, MsgType& response_type);

    /// Join client threads that have finished
    void reapClients();

    std::string socket_path_;
    std::shared_ptr<Logger> logger_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    RequestHandler handler_;

    // Client threads, joined as they finish and on stop()
    std::mutex clients_mutex_;
    std::list<Client> clients_;
};

} // namespace chimera

#endif // CHIMERA_IPC_SERVER_H
