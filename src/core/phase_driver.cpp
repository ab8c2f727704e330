/**
 * @file phase_driver.cpp
 * @brief Phase handler table and PhaseDriver implementation
 */

#include "chimera/phase_driver.h"
#include "chimera/errors.h"

#include <future>
#include <map>
#include <optional>

namespace chimera {

PhaseOutcome PhaseOutcome::advance(ChimeraPhase next, nlohmann::json patch) {
    PhaseOutcome outcome;
    outcome.kind = Kind::ADVANCE;
    outcome.next_phase = next;
    outcome.context_patch = std::move(patch);
    return outcome;
}

PhaseOutcome PhaseOutcome::complete(nlohmann::json patch) {
    PhaseOutcome outcome;
    outcome.kind = Kind::COMPLETE;
    outcome.next_phase = ChimeraPhase::COMPLETE;
    outcome.context_patch = std::move(patch);
    return outcome;
}

PhaseOutcome PhaseOutcome::businessFailure(const std::string& error, nlohmann::json patch) {
    PhaseOutcome outcome;
    outcome.kind = Kind::BUSINESS_FAILURE;
    outcome.next_phase = ChimeraPhase::FAILED;
    outcome.context_patch = std::move(patch);
    outcome.error = error;
    return outcome;
}

PhaseOutcome PhaseOutcome::transientFailure(ChimeraPhase phase, const std::string& error) {
    PhaseOutcome outcome;
    outcome.kind = Kind::TRANSIENT_FAILURE;
    outcome.next_phase = phase;
    outcome.error = error;
    return outcome;
}

std::string outcomeKindToString(PhaseOutcome::Kind kind) {
    switch (kind) {
        case PhaseOutcome::Kind::ADVANCE:           return "advance";
        case PhaseOutcome::Kind::COMPLETE:          return "complete";
        case PhaseOutcome::Kind::BUSINESS_FAILURE:  return "business_failure";
        case PhaseOutcome::Kind::TRANSIENT_FAILURE: return "transient_failure";
        default:                                    return "unknown";
    }
}

namespace {

std::string contextString(const WorkflowTask& task, const char* key) {
    auto it = task.workflow_context.find(key);
    if (it == task.workflow_context.end() || !it->is_string()) {
        throw AgentError(task.id + ": workflow context has no " + key);
    }
    return it->get<std::string>();
}

std::optional<std::string> resultString(const nlohmann::json& result, const char* key) {
    auto it = result.find(key);
    if (it == result.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

/// Transient failure unless result["status"] == expected
std::optional<PhaseOutcome> checkStatus(const WorkflowTask& task,
                                        const nlohmann::json& result,
                                        const std::string& expected) {
    auto status = resultString(result, "status");
    if (status && *status == expected) {
        return std::nullopt;
    }

    std::string error = "agent returned status '" + status.value_or("") + "'";
    if (auto detail = resultString(result, "error")) {
        error += ": " + *detail;
    }
    return PhaseOutcome::transientFailure(task.current_phase, error);
}

PhaseOutcome missingField(const WorkflowTask& task, const char* key) {
    return PhaseOutcome::transientFailure(task.current_phase,
                                          std::string("agent result has no ") + key);
}

// ---------- E2E_TEST_GENERATION ----------

nlohmann::json generateTestParams(const WorkflowTask& task) {
    return {{"feature", task.feature_description}, {"url", task.target_url}};
}

PhaseOutcome interpretGenerateTest(const WorkflowTask& task, const nlohmann::json& result) {
    if (auto failure = checkStatus(task, result, "success")) {
        return *failure;
    }
    auto test_path = resultString(result, "test_path");
    if (!test_path) {
        return missingField(task, "test_path");
    }
    return PhaseOutcome::advance(ChimeraPhase::CODE_IMPLEMENTATION, {{"test_path", *test_path}});
}

// ---------- CODE_IMPLEMENTATION ----------

nlohmann::json implementFeatureParams(const WorkflowTask& task) {
    return {{"test_path", contextString(task, "test_path")},
            {"feature", task.feature_description}};
}

PhaseOutcome interpretImplementFeature(const WorkflowTask& task, const nlohmann::json& result) {
    if (auto failure = checkStatus(task, result, "success")) {
        return *failure;
    }
    auto pr_id = resultString(result, "pr_id");
    if (!pr_id) {
        return missingField(task, "pr_id");
    }
    auto commit_sha = resultString(result, "commit_sha");
    if (!commit_sha) {
        return missingField(task, "commit_sha");
    }
    return PhaseOutcome::advance(ChimeraPhase::REVIEW,
                                 {{"pr_id", *pr_id}, {"commit_sha", *commit_sha}});
}

// ---------- REVIEW ----------

nlohmann::json reviewParams(const WorkflowTask& task) {
    return {{"pr_id", contextString(task, "pr_id")}};
}

PhaseOutcome interpretReview(const WorkflowTask& task, const nlohmann::json& result) {
    auto decision = resultString(result, "decision");
    if (!decision) {
        return missingField(task, "decision");
    }

    nlohmann::json patch = {{"review_decision", *decision}};
    if (auto summary = resultString(result, "summary")) {
        patch["review_summary"] = *summary;
    }

    if (*decision != "approved") {
        return PhaseOutcome::businessFailure("review " + *decision, patch);
    }
    return PhaseOutcome::advance(ChimeraPhase::STAGING_DEPLOYMENT, patch);
}

// ---------- STAGING_DEPLOYMENT ----------

nlohmann::json deployParams(const WorkflowTask& task) {
    return {{"commit_sha", contextString(task, "commit_sha")}};
}

PhaseOutcome interpretDeploy(const WorkflowTask& task, const nlohmann::json& result) {
    if (auto failure = checkStatus(task, result, "success")) {
        return *failure;
    }
    auto staging_url = resultString(result, "staging_url");
    if (!staging_url) {
        return missingField(task, "staging_url");
    }

    nlohmann::json patch = {{"staging_url", *staging_url}};
    if (auto deployment_id = resultString(result, "deployment_id")) {
        patch["deployment_id"] = *deployment_id;
    }
    return PhaseOutcome::advance(ChimeraPhase::E2E_VALIDATION, patch);
}

// ---------- E2E_VALIDATION ----------

nlohmann::json validationParams(const WorkflowTask& task) {
    return {{"test_path", contextString(task, "test_path")},
            {"url", contextString(task, "staging_url")}};
}

PhaseOutcome interpretValidation(const WorkflowTask& task, const nlohmann::json& result) {
    auto status = resultString(result, "status");
    if (!status) {
        return missingField(task, "status");
    }

    nlohmann::json patch = {{"validation_status", *status}};
    for (const char* key : {"tests_passed", "tests_failed"}) {
        if (result.contains(key)) {
            patch[key] = result.at(key);
        }
    }

    if (*status != "passed") {
        return PhaseOutcome::businessFailure("validation " + *status, patch);
    }
    return PhaseOutcome::complete(patch);
}

const std::map<ChimeraPhase, PhaseHandler>& handlerTable() {
    static const std::map<ChimeraPhase, PhaseHandler> table = {
        {ChimeraPhase::E2E_TEST_GENERATION,
         {roles::E2E_TESTER, "generate_test", generateTestParams, interpretGenerateTest}},
        {ChimeraPhase::CODE_IMPLEMENTATION,
         {roles::CODER, "implement_feature", implementFeatureParams, interpretImplementFeature}},
        {ChimeraPhase::REVIEW,
         {roles::GUARDIAN, "review_pr", reviewParams, interpretReview}},
        {ChimeraPhase::STAGING_DEPLOYMENT,
         {roles::DEPLOYMENT, "deploy_to_staging", deployParams, interpretDeploy}},
        {ChimeraPhase::E2E_VALIDATION,
         {roles::E2E_TESTER, "execute_test", validationParams, interpretValidation}},
    };
    return table;
}

} // anonymous namespace

const PhaseHandler* PhaseDriver::handlerFor(ChimeraPhase phase) {
    const auto& table = handlerTable();
    auto it = table.find(phase);
    if (it == table.end()) {
        return nullptr;
    }
    return &it->second;
}

PhaseDriver::PhaseDriver(const AgentRegistry& registry,
                         std::chrono::milliseconds phase_timeout,
                         std::shared_ptr<Logger> logger,
                         CircuitBreakerConfig circuit)
    : registry_(registry)
    , phase_timeout_(phase_timeout)
    , logger_(logger ? std::move(logger) : Logger::null())
    , circuit_config_(circuit) {
    circuit_config_.validate();
}

PhaseOutcome PhaseDriver::step(const WorkflowTask& task) const {
    const ChimeraPhase phase = task.current_phase;
    const PhaseHandler* handler = handlerFor(phase);
    if (handler == nullptr) {
        throw InvalidTransitionError(task.id + ": no step from terminal phase " +
                                     phaseToString(phase));
    }

    const std::string capability_name = std::string(handler->role) + "/" + handler->action;

    auto capability = registry_.find(handler->role, handler->action);
    if (!capability) {
        return PhaseOutcome::transientFailure(phase, "no capability registered for " +
                                                     capability_name);
    }

    nlohmann::json params;
    try {
        params = handler->build_params(task);
    } catch (const ChimeraException& e) {
        return PhaseOutcome::transientFailure(phase, e.message());
    }

    CircuitBreaker& breaker = breakerFor(handler->role);
    if (!breaker.allowRequest()) {
        return PhaseOutcome::transientFailure(
            phase, "circuit open for " + std::string(handler->role) + ", retry in " +
                   std::to_string(breaker.retryAfter().count()) + " ms");
    }

    logger_->debug("Task " + task.id + " calling " + capability_name);

    std::future<nlohmann::json> pending;
    try {
        pending = (*capability)(params);
    } catch (const std::exception& e) {
        return callFailed(breaker, phase, capability_name + " failed: " + e.what());
    }

    if (!pending.valid()) {
        return callFailed(breaker, phase, capability_name + " returned no result");
    }

    if (pending.wait_for(phase_timeout_) != std::future_status::ready) {
        logger_->warn("Task " + task.id + " " + capability_name + " timed out after " +
                      std::to_string(phase_timeout_.count()) + " ms");
        return callFailed(breaker, phase,
                          capability_name + " timed out after " +
                          std::to_string(phase_timeout_.count()) + " ms");
    }

    nlohmann::json result;
    try {
        result = pending.get();
    } catch (const std::exception& e) {
        return callFailed(breaker, phase, capability_name + " failed: " + e.what());
    }

    if (!result.is_object()) {
        return callFailed(breaker, phase, capability_name + " returned a non-object result");
    }

    PhaseOutcome outcome = handler->interpret(task, result);

    // A rejection is still a working agent; an unusable reply is not
    if (outcome.kind == PhaseOutcome::Kind::TRANSIENT_FAILURE) {
        outcome = callFailed(breaker, phase, outcome.error);
    } else {
        breaker.recordSuccess();
    }

    logger_->debug("Task " + task.id + " " + phaseToString(phase) + ": " +
                   outcomeKindToString(outcome.kind) +
                   (outcome.error.empty() ? "" : " (" + outcome.error + ")"));
    return outcome;
}

CircuitState PhaseDriver::circuitState(const std::string& role) const {
    std::lock_guard<std::mutex> lock(breakers_mutex_);
    auto it = breakers_.find(role);
    if (it == breakers_.end()) {
        return CircuitState::CLOSED;
    }
    return it->second->state();
}

nlohmann::json PhaseDriver::circuitMetrics() const {
    std::lock_guard<std::mutex> lock(breakers_mutex_);
    nlohmann::json circuits = nlohmann::json::array();
    for (const auto& [role, breaker] : breakers_) {
        circuits.push_back(breaker->metrics());
    }
    return circuits;
}

CircuitBreaker& PhaseDriver::breakerFor(const std::string& role) const {
    std::lock_guard<std::mutex> lock(breakers_mutex_);
    auto& slot = breakers_[role];
    if (!slot) {
        slot = std::make_unique<CircuitBreaker>(role, circuit_config_);
    }
    return *slot;
}

PhaseOutcome PhaseDriver::callFailed(CircuitBreaker& breaker,
                                     ChimeraPhase phase,
                                     const std::string& error) const {
    bool was_open = breaker.state() == CircuitState::OPEN;
    breaker.recordFailure();
    if (!was_open && breaker.state() == CircuitState::OPEN) {
        logger_->warn("Circuit for " + breaker.name() + " opened for " +
                      std::to_string(circuit_config_.recovery_timeout_ms) + " ms");
    }
    return PhaseOutcome::transientFailure(phase, error);
}

} // namespace chimera
