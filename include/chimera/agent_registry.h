/**
 * @file agent_registry.h
 * @brief Lookup from agent role and action to an asynchronous capability
 *
 * Roles used by the pipeline: e2e-tester-agent, coder-agent,
 * guardian-agent, deployment-agent.
 */

#ifndef CHIMERA_AGENT_REGISTRY_H
#define CHIMERA_AGENT_REGISTRY_H

#include <nlohmann/json.hpp>

#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chimera {

/// Role names known to the pipeline
namespace roles {
constexpr const char* E2E_TESTER = "e2e-tester-agent";
constexpr const char* CODER = "coder-agent";
constexpr const char* GUARDIAN = "guardian-agent";
constexpr const char* DEPLOYMENT = "deployment-agent";
} // namespace roles

/**
 * @brief One agent action: params in, eventually a result record out
 *
 * The returned future either yields a JSON object with at least a
 * "status" field or carries the exception that made the call fail.
 * Futures from std::async block in their destructor and defeat the
 * phase timeout; use AgentRegistry::launch instead.
 */
using AgentCapability =
    std::function<std::future<nlohmann::json>(const nlohmann::json& params)>;

/**
 * @brief Registry of agent capabilities keyed by (role, action)
 *
 * Constructed once at process start and passed by reference to the
 * phase driver. Thread-safe.
 */
class AgentRegistry {
public:
    AgentRegistry() = default;

    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

    /**
     * @brief Bind a capability, replacing any previous binding
     * @throws ChimeraException(CONFIG_INVALID) if role/action is empty or capability is null
     */
    void registerCapability(const std::string& role,
                            const std::string& action,
                            AgentCapability capability);

    /**
     * @brief Bind a synchronous function; each call runs on its own thread
     */
    void registerFunction(const std::string& role,
                          const std::string& action,
                          std::function<nlohmann::json(const nlohmann::json&)> fn);

    /// Copy of the bound capability, nullopt if absent
    std::optional<AgentCapability> find(const std::string& role,
                                        const std::string& action) const;

    bool has(const std::string& role, const std::string& action) const;

    /// Distinct role names, sorted
    std::vector<std::string> roles() const;

    /// Actions bound for a role, sorted
    std::vector<std::string> actions(const std::string& role) const;

    size_t size() const;

    /**
     * @brief Run fn on a detached thread
     *
     * The returned future does not block in its destructor, so a caller
     * that stops waiting after a timeout can simply drop it. Exceptions
     * thrown by fn are delivered through the future.
     */
    static std::future<nlohmann::json> launch(std::function<nlohmann::json()> fn);

private:
    using Key = std::pair<std::string, std::string>;

    std::map<Key, AgentCapability> capabilities_;
    mutable std::mutex mutex_;
};

} // namespace chimera

#endif // CHIMERA_AGENT_REGISTRY_H
