/**
 * @file phase_driver.h
 * @brief Executes one pipeline phase of a workflow per call
 *
 * Each non-terminal phase maps to one agent capability through a static
 * table of PhaseHandler entries. The driver holds no per-task state: what
 * to do next is derived from the persisted current_phase and
 * workflow_context alone. Calls to each agent role pass through that
 * role's CircuitBreaker.
 */

#ifndef CHIMERA_PHASE_DRIVER_H
#define CHIMERA_PHASE_DRIVER_H

#include "chimera/agent_registry.h"
#include "chimera/circuit_breaker.h"
#include "chimera/logger.h"
#include "chimera/workflow_task.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace chimera {

/**
 * @brief Result of a single phase step
 */
struct PhaseOutcome {
    enum class Kind {
        ADVANCE,            ///< Move to next_phase and keep going
        COMPLETE,           ///< Pipeline finished, next_phase is COMPLETE
        BUSINESS_FAILURE,   ///< Agent said no; go to FAILED, never retried
        TRANSIENT_FAILURE   ///< Call failed; retry the same phase
    };

    Kind kind = Kind::TRANSIENT_FAILURE;

    /// Target phase; the current phase again for TRANSIENT_FAILURE
    ChimeraPhase next_phase = ChimeraPhase::FAILED;

    /// Keys to add to workflow_context
    nlohmann::json context_patch = nlohmann::json::object();

    /// Failure description, empty on success
    std::string error;

    bool isFailure() const {
        return kind == Kind::BUSINESS_FAILURE || kind == Kind::TRANSIENT_FAILURE;
    }

    static PhaseOutcome advance(ChimeraPhase next, nlohmann::json patch);
    static PhaseOutcome complete(nlohmann::json patch);
    static PhaseOutcome businessFailure(const std::string& error, nlohmann::json patch);
    static PhaseOutcome transientFailure(ChimeraPhase phase, const std::string& error);
};

std::string outcomeKindToString(PhaseOutcome::Kind kind);

/**
 * @brief How one phase talks to its agent
 *
 * build_params may throw AgentError when the context lacks an input
 * produced by an earlier phase.
 */
struct PhaseHandler {
    const char* role;
    const char* action;
    std::function<nlohmann::json(const WorkflowTask&)> build_params;
    std::function<PhaseOutcome(const WorkflowTask&, const nlohmann::json& result)> interpret;
};

/**
 * @brief Drives a workflow one phase at a time
 *
 * step() never throws for agent-side problems: a missing capability,
 * open circuit, exception, timeout or malformed result is reported as
 * TRANSIENT_FAILURE.
 */
class PhaseDriver {
public:
    /**
     * @brief Construct a PhaseDriver
     * @param registry Agent capabilities; must outlive the driver
     * @param phase_timeout Upper bound on one agent call
     * @param logger Log sink (null = disabled)
     * @param circuit Settings for the per-role circuit breakers
     * @throws ChimeraException(CONFIG_INVALID) if circuit is invalid
     */
    PhaseDriver(const AgentRegistry& registry,
                std::chrono::milliseconds phase_timeout,
                std::shared_ptr<Logger> logger = nullptr,
                CircuitBreakerConfig circuit = CircuitBreakerConfig());

    /**
     * @brief Execute the task's current phase once
     * @param task Snapshot of the workflow record
     * @return What the caller should persist next
     * @throws InvalidTransitionError if the task is already at a terminal phase
     */
    PhaseOutcome step(const WorkflowTask& task) const;

    std::chrono::milliseconds phaseTimeout() const { return phase_timeout_; }

    /**
     * @brief Handler table entry for a phase
     * @return nullptr for COMPLETE and FAILED
     */
    static const PhaseHandler* handlerFor(ChimeraPhase phase);

    /// CLOSED for a role that has not been called yet
    CircuitState circuitState(const std::string& role) const;

    /// One CircuitBreaker::metrics() object per called role, sorted by role
    nlohmann::json circuitMetrics() const;

private:
    /// Breaker for role, created on first use
    CircuitBreaker& breakerFor(const std::string& role) const;

    PhaseOutcome callFailed(CircuitBreaker& breaker,
                            ChimeraPhase phase,
                            const std::string& error) const;

    const AgentRegistry& registry_;
    std::chrono::milliseconds phase_timeout_;
    std::shared_ptr<Logger> logger_;
    CircuitBreakerConfig circuit_config_;

    mutable std::mutex breakers_mutex_;
    mutable std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
};

} // namespace chimera

#endif // CHIMERA_PHASE_DRIVER_H
