/**
 * @file workflow_task.cpp
 * @brief WorkflowTask JSON serialization and phase helpers
 *
 * Uses nlohmann/json library for JSON handling.
 */

#include "chimera/workflow_task.h"
#include "chimera/errors.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chimera {

std::string phaseToString(ChimeraPhase phase) {
    switch (phase) {
        case ChimeraPhase::E2E_TEST_GENERATION: return "E2E_TEST_GENERATION";
        case ChimeraPhase::CODE_IMPLEMENTATION: return "CODE_IMPLEMENTATION";
        case ChimeraPhase::REVIEW:              return "REVIEW";
        case ChimeraPhase::STAGING_DEPLOYMENT:  return "STAGING_DEPLOYMENT";
        case ChimeraPhase::E2E_VALIDATION:      return "E2E_VALIDATION";
        case ChimeraPhase::COMPLETE:            return "COMPLETE";
        case ChimeraPhase::FAILED:              return "FAILED";
        default:                                return "UNKNOWN";
    }
}

ChimeraPhase phaseFromString(const std::string& str) {
    if (str == "E2E_TEST_GENERATION") return ChimeraPhase::E2E_TEST_GENERATION;
    if (str == "CODE_IMPLEMENTATION") return ChimeraPhase::CODE_IMPLEMENTATION;
    if (str == "REVIEW")              return ChimeraPhase::REVIEW;
    if (str == "STAGING_DEPLOYMENT")  return ChimeraPhase::STAGING_DEPLOYMENT;
    if (str == "E2E_VALIDATION")      return ChimeraPhase::E2E_VALIDATION;
    if (str == "COMPLETE")            return ChimeraPhase::COMPLETE;
    if (str == "FAILED")              return ChimeraPhase::FAILED;
    throw std::invalid_argument("Unknown phase: " + str);
}

std::optional<ChimeraPhase> nextPhase(ChimeraPhase phase) {
    switch (phase) {
        case ChimeraPhase::E2E_TEST_GENERATION: return ChimeraPhase::CODE_IMPLEMENTATION;
        case ChimeraPhase::CODE_IMPLEMENTATION: return ChimeraPhase::REVIEW;
        case ChimeraPhase::REVIEW:              return ChimeraPhase::STAGING_DEPLOYMENT;
        case ChimeraPhase::STAGING_DEPLOYMENT:  return ChimeraPhase::E2E_VALIDATION;
        case ChimeraPhase::E2E_VALIDATION:      return ChimeraPhase::COMPLETE;
        default:                                return std::nullopt;
    }
}

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        // Pre-epoch values round toward zero in to_time_t
        ms += std::chrono::milliseconds(1000);
        time_t_val -= 1;
    }

    std::tm tm_val;
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::chrono::system_clock::time_point parseTimestamp(const std::string& str) {
    std::tm tm_val = {};
    std::istringstream iss(str);
    iss >> std::get_time(&tm_val, "%Y-%m-%dT%H:%M:%S");

    if (iss.fail()) {
        throw std::runtime_error("Failed to parse time string: " + str);
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string frac;
        while (std::isdigit(iss.peek())) {
            frac.push_back(static_cast<char>(iss.get()));
        }
        frac = (frac + "000").substr(0, 3);
        millis = std::stoi(frac);
    }

    time_t time_t_val = timegm(&tm_val);
    return std::chrono::system_clock::from_time_t(time_t_val) +
           std::chrono::milliseconds(millis);
}

nlohmann::json WorkflowTask::toJsonValue() const {
    nlohmann::json j;

    // Identification and inputs
    j["id"] = id;
    j["feature_description"] = feature_description;
    j["target_url"] = target_url;
    j["priority"] = priority;
    j["sequence"] = sequence;

    // Progress
    j["status"] = taskStatusToString(status);
    j["current_phase"] = phaseToString(current_phase);
    j["workflow_context"] = workflow_context;
    j["retry_count"] = retry_count;

    // Timestamps
    j["created_at"] = formatTimestamp(created_at);
    j["updated_at"] = formatTimestamp(updated_at);
    if (heartbeat_at.has_value()) {
        j["heartbeat_at"] = formatTimestamp(heartbeat_at.value());
    } else {
        j["heartbeat_at"] = nullptr;
    }

    return j;
}

std::string WorkflowTask::toJson() const {
    return toJsonValue().dump();
}

WorkflowTask WorkflowTask::fromJsonValue(const nlohmann::json& j) {
    try {
        WorkflowTask task;

        task.id = j.at("id").get<std::string>();
        task.feature_description = j.at("feature_description").get<std::string>();
        task.target_url = j.at("target_url").get<std::string>();
        task.priority = j.at("priority").get<int>();
        task.sequence = j.value("sequence", static_cast<uint64_t>(0));

        task.status = taskStatusFromString(j.at("status").get<std::string>());
        task.current_phase = phaseFromString(j.at("current_phase").get<std::string>());
        task.workflow_context = j.value("workflow_context", nlohmann::json::object());
        if (!task.workflow_context.is_object()) {
            throw ChimeraException(ErrorCode::FILE_PARSE_ERROR,
                                   "workflow_context must be an object");
        }
        task.retry_count = j.value("retry_count", 0);

        task.created_at = parseTimestamp(j.at("created_at").get<std::string>());
        task.updated_at = parseTimestamp(j.at("updated_at").get<std::string>());
        if (j.contains("heartbeat_at") && !j.at("heartbeat_at").is_null()) {
            task.heartbeat_at = parseTimestamp(j.at("heartbeat_at").get<std::string>());
        }

        return task;

    } catch (const nlohmann::json::exception& e) {
        throw ChimeraException(ErrorCode::FILE_PARSE_ERROR,
                               std::string("JSON parse error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ChimeraException(ErrorCode::FILE_PARSE_ERROR, e.what());
    } catch (const ChimeraException&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw ChimeraException(ErrorCode::FILE_PARSE_ERROR, e.what());
    }
}

WorkflowTask WorkflowTask::fromJson(const std::string& json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        throw ChimeraException(ErrorCode::FILE_PARSE_ERROR,
                               std::string("JSON parse error: ") + e.what());
    }
    return fromJsonValue(j);
}

bool WorkflowTask::operator==(const WorkflowTask& other) const {
    if (id != other.id) return false;
    if (feature_description != other.feature_description) return false;
    if (target_url != other.target_url) return false;
    if (priority != other.priority) return false;
    if (sequence != other.sequence) return false;

    if (status != other.status) return false;
    if (current_phase != other.current_phase) return false;
    if (workflow_context != other.workflow_context) return false;
    if (retry_count != other.retry_count) return false;

    // Millisecond precision due to serialization
    auto toMillis = [](const std::chrono::system_clock::time_point& tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count();
    };

    if (toMillis(created_at) != toMillis(other.created_at)) return false;
    if (toMillis(updated_at) != toMillis(other.updated_at)) return false;

    if (heartbeat_at.has_value() != other.heartbeat_at.has_value()) return false;
    if (heartbeat_at.has_value() &&
        toMillis(heartbeat_at.value()) != toMillis(other.heartbeat_at.value())) {
        return false;
    }

    return true;
}

} // namespace chimera
