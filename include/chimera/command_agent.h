/**
 * @file command_agent.h
 * @brief Agent capabilities backed by an external executable
 *
 * Runs the configured executable as a child process for each call:
 *
 *   <executable> <action>    params JSON on stdin, result JSON on stdout
 *
 * Handles process creation, I/O, timeout and process-group termination.
 */

#ifndef CHIMERA_COMMAND_AGENT_H
#define CHIMERA_COMMAND_AGENT_H

#include "chimera/agent_registry.h"
#include "chimera/logger.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace chimera {

/**
 * @brief Outcome of one child process run
 */
struct ProcessResult {
    int exit_code = -1;         ///< Exit code, 128+signal if signaled
    bool signaled = false;      ///< true if process was terminated by signal
    int signal_number = 0;      ///< Signal number if signaled
    bool timed_out = false;     ///< true if killed for exceeding the timeout
    std::string stdout_data;
    std::string stderr_data;
};

/**
 * @brief Executes one agent role as a child process per call
 *
 * The child runs in its own process group so that everything it spawns
 * is killed together on timeout. Environment variables passed to the
 * child: CHIMERA_ROLE, CHIMERA_ACTION.
 */
class CommandAgent : public std::enable_shared_from_this<CommandAgent> {
public:
    /**
     * @brief Construct a CommandAgent
     * @param role Agent role name, exported as CHIMERA_ROLE
     * @param executable Path of the program implementing the role
     * @param timeout Kill the child after this long
     * @param logger Log sink (null = disabled)
     */
    CommandAgent(const std::string& role,
                 const std::string& executable,
                 std::chrono::milliseconds timeout,
                 std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Run the executable for one action and parse its result
     * @return Parsed stdout (a JSON object)
     * @throws PhaseTimeoutError if the child exceeded the timeout
     * @throws AgentError on spawn failure, non-zero exit or unparsable output
     */
    nlohmann::json call(const std::string& action, const nlohmann::json& params) const;

    /**
     * @brief Capability running call(action, params) on its own thread
     *
     * The capability keeps this agent alive while a call is in flight.
     */
    AgentCapability capability(const std::string& action);

    /**
     * @brief Run a child process to completion or timeout
     * @param args argv of the child, args[0] is the program path
     * @param input Bytes written to the child's stdin
     * @param env Extra environment variables
     * @param timeout Kill the process group after this long
     */
    static ProcessResult runProcess(const std::vector<std::string>& args,
                                    const std::string& input,
                                    const std::map<std::string, std::string>& env,
                                    std::chrono::milliseconds timeout);

    /**
     * @brief Terminate a process group
     * @param pid Process group leader
     * @param force If true, use SIGKILL; otherwise use SIGTERM
     * @return true if signal was sent successfully
     */
    static bool terminate(pid_t pid, bool force = false);

    /**
     * @brief Register every pipeline action of each configured role
     *
     * Roles that the pipeline does not use are logged and skipped.
     *
     * @param registry Registry to fill
     * @param commands Role name -> executable path
     * @return Number of capabilities registered
     */
    static size_t registerAll(AgentRegistry& registry,
                              const std::map<std::string, std::string>& commands,
                              std::chrono::milliseconds timeout,
                              std::shared_ptr<Logger> logger = nullptr);

    const std::string& role() const { return role_; }
    const std::string& executable() const { return executable_; }

private:
    std::string role_;
    std::string executable_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<Logger> logger_;
};

} // namespace chimera

#endif // CHIMERA_COMMAND_AGENT_H
