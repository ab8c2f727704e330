/**
 * @file agent_registry.cpp
 * @brief Implementation of AgentRegistry
 */

#include "chimera/agent_registry.h"
#include "chimera/errors.h"

#include <exception>
#include <memory>
#include <set>
#include <thread>

namespace chimera {

void AgentRegistry::registerCapability(const std::string& role,
                                       const std::string& action,
                                       AgentCapability capability) {
    if (role.empty() || action.empty()) {
        throw ChimeraException(ErrorCode::CONFIG_INVALID,
                               "Agent role and action must not be empty");
    }
    if (!capability) {
        throw ChimeraException(ErrorCode::CONFIG_INVALID,
                               "Null capability for " + role + "/" + action);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    capabilities_[Key(role, action)] = std::move(capability);
}

void AgentRegistry::registerFunction(const std::string& role,
                                     const std::string& action,
                                     std::function<nlohmann::json(const nlohmann::json&)> fn) {
    if (!fn) {
        throw ChimeraException(ErrorCode::CONFIG_INVALID,
                               "Null function for " + role + "/" + action);
    }
    registerCapability(role, action, [fn](const nlohmann::json& params) {
        return launch([fn, params]() { return fn(params); });
    });
}

std::optional<AgentCapability> AgentRegistry::find(const std::string& role,
                                                   const std::string& action) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = capabilities_.find(Key(role, action));
    if (it == capabilities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AgentRegistry::has(const std::string& role, const std::string& action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_.count(Key(role, action)) > 0;
}

std::vector<std::string> AgentRegistry::roles() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> unique;
    for (const auto& [key, capability] : capabilities_) {
        unique.insert(key.first);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

std::vector<std::string> AgentRegistry::actions(const std::string& role) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    for (const auto& [key, capability] : capabilities_) {
        if (key.first == role) {
            result.push_back(key.second);
        }
    }
    return result;
}

size_t AgentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_.size();
}

std::future<nlohmann::json> AgentRegistry::launch(std::function<nlohmann::json()> fn) {
    auto promise = std::make_shared<std::promise<nlohmann::json>>();
    std::future<nlohmann::json> future = promise->get_future();

    std::thread([promise, fn = std::move(fn)]() {
        try {
            promise->set_value(fn());
        } catch (...) {
            // Delivered to whoever still holds the future
            promise->set_exception(std::current_exception());
        }
    }).detach();

    return future;
}

} // namespace chimera
