/**
 * @file command_agent.cpp
 * @brief Implementation of CommandAgent
 *
 * Handles process creation and management for external agent calls.
 */

#include "chimera/command_agent.h"
#include "chimera/errors.h"
#include "chimera/phase_driver.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace chimera {

namespace {

// Upper bound on stderr kept for error messages
constexpr size_t MAX_STDERR_IN_ERROR = 512;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

/// Append readable bytes from fd to out; closes fd on EOF or error
void drain(int& fd, std::string& out) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        closeFd(fd);
        return;
    }
}

/// Build "NAME=value" entries: the current environment overridden by extra
std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& extra) {
    std::vector<std::string> entries;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        std::string name = entry.substr(0, entry.find('='));
        if (extra.count(name) == 0) {
            entries.push_back(entry);
        }
    }
    for (const auto& [name, value] : extra) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

void fillExitStatus(int wstatus, ProcessResult& result) {
    if (WIFEXITED(wstatus)) {
        result.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        result.signaled = true;
        result.signal_number = WTERMSIG(wstatus);
        result.exit_code = 128 + result.signal_number;
    }
}

} // anonymous namespace

CommandAgent::CommandAgent(const std::string& role,
                           const std::string& executable,
                           std::chrono::milliseconds timeout,
                           std::shared_ptr<Logger> logger)
    : role_(role)
    , executable_(executable)
    , timeout_(timeout)
    , logger_(logger ? std::move(logger) : Logger::null()) {
}

ProcessResult CommandAgent::runProcess(const std::vector<std::string>& args,
                                       const std::string& input,
                                       const std::map<std::string, std::string>& env,
                                       std::chrono::milliseconds timeout) {
    if (args.empty()) {
        throw AgentError("No program to run");
    }

    // stdin is a socket so writes can use MSG_NOSIGNAL if the child exits early
    int in_fds[2] = {-1, -1};
    int out_fds[2] = {-1, -1};
    int err_fds[2] = {-1, -1};

    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, in_fds) != 0) {
        throw AgentError(std::string("socketpair failed: ") + strerror(errno));
    }
    if (pipe2(out_fds, O_CLOEXEC) != 0 || pipe2(err_fds, O_CLOEXEC) != 0) {
        std::string msg = std::string("pipe failed: ") + strerror(errno);
        for (int* fd : {&in_fds[0], &in_fds[1], &out_fds[0], &out_fds[1], &err_fds[0], &err_fds[1]}) {
            closeFd(*fd);
        }
        throw AgentError(msg);
    }

    // Everything the child needs is prepared before fork
    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_entries = buildEnvironment(env);
    std::vector<char*> envp;
    for (auto& entry : env_entries) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        std::string msg = std::string("fork failed: ") + strerror(errno);
        for (int* fd : {&in_fds[0], &in_fds[1], &out_fds[0], &out_fds[1], &err_fds[0], &err_fds[1]}) {
            closeFd(*fd);
        }
        throw AgentError(msg);
    }

    if (pid == 0) {
        // Child process

        // New process group so the whole tree can be killed on timeout
        setpgid(0, 0);

        dup2(in_fds[1], STDIN_FILENO);
        dup2(out_fds[1], STDOUT_FILENO);
        dup2(err_fds[1], STDERR_FILENO);

        execve(argv[0], argv.data(), envp.data());

        // If execve returns, it failed
        _exit(126);
    }

    // Parent process
    // Also call setpgid in parent to avoid race condition
    setpgid(pid, pid);

    closeFd(in_fds[1]);
    closeFd(out_fds[1]);
    closeFd(err_fds[1]);

    int in_fd = in_fds[0];
    int out_fd = out_fds[0];
    int err_fd = err_fds[0];
    setNonBlocking(in_fd);
    setNonBlocking(out_fd);
    setNonBlocking(err_fd);

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t written = 0;

    if (input.empty()) {
        shutdown(in_fd, SHUT_WR);
        closeFd(in_fd);
    }

    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[3];
        int nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) {
            in_idx = nfds;
            fds[nfds++] = {in_fd, POLLOUT, 0};
        }
        if (out_fd >= 0) {
            out_idx = nfds;
            fds[nfds++] = {out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            err_idx = nfds;
            fds[nfds++] = {err_fd, POLLIN, 0};
        }

        int ret = poll(fds, static_cast<nfds_t>(nfds),
                       static_cast<int>(std::min<long long>(remaining.count(), 100)));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.stderr_data += std::string("poll failed: ") + strerror(errno);
            break;
        }
        if (ret == 0) {
            continue;
        }

        if (in_idx >= 0 && fds[in_idx].revents != 0) {
            ssize_t n = send(in_fd, input.data() + written, input.size() - written, MSG_NOSIGNAL);
            if (n > 0) {
                written += static_cast<size_t>(n);
            }
            bool failed = n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
            if (written == input.size() || failed) {
                shutdown(in_fd, SHUT_WR);
                closeFd(in_fd);
            }
        }
        if (out_idx >= 0 && fds[out_idx].revents != 0) {
            drain(out_fd, result.stdout_data);
        }
        if (err_idx >= 0 && fds[err_idx].revents != 0) {
            drain(err_fd, result.stderr_data);
        }
    }

    closeFd(in_fd);

    if (out_fd >= 0 || err_fd >= 0) {
        // Timed out or poll failed while output was still open
        terminate(pid, true);
    }

    // Reap, still bounded by the deadline
    int wstatus = 0;
    while (true) {
        pid_t reaped = waitpid(pid, &wstatus, result.timed_out ? 0 : WNOHANG);
        if (reaped == pid) {
            fillExitStatus(wstatus, result);
            break;
        }
        if (reaped < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            terminate(pid, true);
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    closeFd(out_fd);
    closeFd(err_fd);

    return result;
}

bool CommandAgent::terminate(pid_t pid, bool force) {
    int sig = force ? SIGKILL : SIGTERM;

    // Kill the entire process group by using negative PID
    int result = kill(-pid, sig);

    if (result != 0) {
        // The child may not have created its own group yet
        result = kill(pid, sig);
    }

    return result == 0;
}

nlohmann::json CommandAgent::call(const std::string& action, const nlohmann::json& params) const {
    const std::string name = role_ + "/" + action;
    logger_->info("Agent " + name + " | exec: " + executable_);

    ProcessResult result = runProcess(
        {executable_, action}, params.dump(),
        {{"CHIMERA_ROLE", role_}, {"CHIMERA_ACTION", action}}, timeout_);

    if (result.timed_out) {
        logger_->warn("Agent " + name + " killed after " + std::to_string(timeout_.count()) + " ms");
        throw PhaseTimeoutError(name + " killed after " + std::to_string(timeout_.count()) + " ms");
    }

    if (result.exit_code != 0) {
        std::string msg = name + " exited with code " + std::to_string(result.exit_code);
        if (!result.stderr_data.empty()) {
            msg += ": " + result.stderr_data.substr(0, MAX_STDERR_IN_ERROR);
        }
        logger_->warn("Agent " + msg);
        throw AgentError(msg);
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(result.stdout_data);
    } catch (const nlohmann::json::exception& e) {
        throw AgentError(name + " produced invalid JSON: " + e.what());
    }

    if (!parsed.is_object()) {
        throw AgentError(name + " did not produce a JSON object");
    }

    logger_->debug("Agent " + name + " returned " + parsed.dump());
    return parsed;
}

AgentCapability CommandAgent::capability(const std::string& action) {
    std::shared_ptr<CommandAgent> self = shared_from_this();
    return [self, action](const nlohmann::json& params) {
        return AgentRegistry::launch([self, action, params]() {
            return self->call(action, params);
        });
    };
}

size_t CommandAgent::registerAll(AgentRegistry& registry,
                                 const std::map<std::string, std::string>& commands,
                                 std::chrono::milliseconds timeout,
                                 std::shared_ptr<Logger> logger) {
    if (!logger) {
        logger = Logger::null();
    }

    const ChimeraPhase phases[] = {
        ChimeraPhase::E2E_TEST_GENERATION,
        ChimeraPhase::CODE_IMPLEMENTATION,
        ChimeraPhase::REVIEW,
        ChimeraPhase::STAGING_DEPLOYMENT,
        ChimeraPhase::E2E_VALIDATION,
    };

    size_t registered = 0;
    for (const auto& [role, executable] : commands) {
        if (access(executable.c_str(), X_OK) != 0) {
            throw ChimeraException(ErrorCode::CONFIG_INVALID,
                                   "Agent executable for " + role + " is not executable: " +
                                   executable);
        }

        auto agent = std::make_shared<CommandAgent>(role, executable, timeout, logger);
        size_t before = registered;

        for (ChimeraPhase phase : phases) {
            const PhaseHandler* handler = PhaseDriver::handlerFor(phase);
            if (handler != nullptr && role == handler->role) {
                registry.registerCapability(role, handler->action, agent->capability(handler->action));
                ++registered;
            }
        }

        if (registered == before) {
            logger->warn("Ignoring command for unknown agent role: " + role);
        } else {
            logger->info("Agent role " + role + " bound to " + executable);
        }
    }

    return registered;
}

} // namespace chimera
