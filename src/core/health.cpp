/**
 * @file health.cpp
 * @brief Implementation of HealthMonitor
 */

#include "chimera/health.h"
#include "chimera/errors.h"

#include <algorithm>
#include <cstdio>

namespace chimera {

namespace {

std::string formatNumber(double value, int precision = 1) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

std::string formatPercent(double ratio) {
    return formatNumber(ratio * 100.0) + "%";
}

void requireOrdered(bool ok, const std::string& what) {
    if (!ok) {
        throw ChimeraException(ErrorCode::CONFIG_INVALID, what);
    }
}

bool hasAlertFor(const std::vector<Alert>& alerts, const std::string& metric) {
    return std::any_of(alerts.begin(), alerts.end(),
                       [&metric](const Alert& a) { return a.metric == metric; });
}

} // anonymous namespace

std::string healthStatusToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY:  return "healthy";
        case HealthStatus::WARNING:  return "warning";
        case HealthStatus::CRITICAL: return "critical";
        default:                     return "unknown";
    }
}

void HealthThresholds::validate() const {
    requireOrdered(utilization_warning_pct >= 0.0 && utilization_critical_pct <= 100.0,
                   "utilization thresholds must be within 0-100");
    requireOrdered(utilization_warning_pct < utilization_critical_pct,
                   "utilization warning must be below critical");

    requireOrdered(success_rate_critical >= 0.0 && success_rate_warning <= 1.0,
                   "success rate thresholds must be within 0-1");
    requireOrdered(success_rate_warning > success_rate_critical,
                   "success rate warning must be above critical");

    requireOrdered(p95_latency_warning_ms > 0.0 &&
                   p95_latency_warning_ms < p95_latency_critical_ms,
                   "p95 latency warning must be positive and below critical");

    requireOrdered(queue_depth_warning < queue_depth_critical,
                   "queue depth warning must be below critical");

    requireOrdered(phase_failure_rate_warning >= 0.0 && phase_failure_rate_critical <= 1.0,
                   "phase failure rate thresholds must be within 0-1");
    requireOrdered(phase_failure_rate_warning < phase_failure_rate_critical,
                   "phase failure rate warning must be below critical");
}

nlohmann::json Alert::toJson() const {
    nlohmann::json j;
    j["severity"] = healthStatusToString(severity);
    j["metric"] = metric;
    j["current_value"] = current_value;
    j["threshold"] = threshold;
    j["message"] = message;
    j["recommendation"] = recommendation;
    return j;
}

nlohmann::json HealthReport::toJson() const {
    nlohmann::json j;
    j["status"] = healthStatusToString(status);

    nlohmann::json alerts_json = nlohmann::json::array();
    for (const auto& alert : alerts) {
        alerts_json.push_back(alert.toJson());
    }
    j["alerts"] = alerts_json;
    j["recommendations"] = recommendations;
    j["metrics_summary"] = metrics_summary;
    return j;
}

HealthMonitor::HealthMonitor(HealthThresholds thresholds)
    : thresholds_(thresholds) {
    thresholds_.validate();
}

HealthReport HealthMonitor::assess(const PoolMetrics& m) const {
    HealthReport report;

    checkUtilization(m, report.alerts);
    checkSuccessRate(m, report.alerts);
    checkLatency(m, report.alerts);
    checkQueueDepth(m, report.alerts);
    checkPhaseFailures(m, report.alerts);

    for (const auto& alert : report.alerts) {
        report.status = std::max(report.status, alert.severity);
    }

    // Critical recommendations first, then warnings
    for (HealthStatus severity : {HealthStatus::CRITICAL, HealthStatus::WARNING}) {
        for (const auto& alert : report.alerts) {
            if (alert.severity == severity && !alert.recommendation.empty()) {
                std::string tag = severity == HealthStatus::CRITICAL ? "[CRITICAL] " : "[WARNING] ";
                report.recommendations.push_back(tag + alert.recommendation);
            }
        }
    }

    if (m.latency_trend == "degrading" && !hasAlertFor(report.alerts, "p95_workflow_duration_ms")) {
        report.recommendations.push_back(
            "[INFO] Latency trending upward - consider profiling workflows");
    }
    if (m.queue_depth_trend == "increasing" && !hasAlertFor(report.alerts, "queue_depth") &&
        !hasAlertFor(report.alerts, "pool_utilization_pct")) {
        report.recommendations.push_back(
            "[INFO] Queue depth trending upward - watch pool capacity");
    }

    report.metrics_summary = {
        {"pool_utilization_pct", m.pool_utilization_pct},
        {"success_rate", m.success_rate},
        {"p95_workflow_duration_ms", m.p95_workflow_duration_ms},
        {"queue_depth", m.queue_depth},
        {"total_workflows_processed", m.total_workflows_processed},
    };

    return report;
}

void HealthMonitor::checkUtilization(const PoolMetrics& m, std::vector<Alert>& alerts) const {
    double value = m.pool_utilization_pct;

    if (value >= thresholds_.utilization_critical_pct) {
        alerts.push_back({HealthStatus::CRITICAL, "pool_utilization_pct", value,
                          thresholds_.utilization_critical_pct,
                          "Pool utilization at " + formatNumber(value) + "%",
                          "Increase max_concurrent or reduce the submission rate"});
    } else if (value >= thresholds_.utilization_warning_pct) {
        alerts.push_back({HealthStatus::WARNING, "pool_utilization_pct", value,
                          thresholds_.utilization_warning_pct,
                          "Pool utilization at " + formatNumber(value) + "%",
                          "Consider raising max_concurrent"});
    }
}

void HealthMonitor::checkSuccessRate(const PoolMetrics& m, std::vector<Alert>& alerts) const {
    // No verdict before the first terminal workflow
    if (m.total_workflows_processed == 0) {
        return;
    }

    double value = m.success_rate;

    if (value <= thresholds_.success_rate_critical) {
        alerts.push_back({HealthStatus::CRITICAL, "success_rate", value,
                          thresholds_.success_rate_critical,
                          "Success rate dropped to " + formatPercent(value),
                          "Inspect failed workflows and agent logs"});
    } else if (value <= thresholds_.success_rate_warning) {
        alerts.push_back({HealthStatus::WARNING, "success_rate", value,
                          thresholds_.success_rate_warning,
                          "Success rate at " + formatPercent(value),
                          "Review recent failures by phase"});
    }
}

void HealthMonitor::checkLatency(const PoolMetrics& m, std::vector<Alert>& alerts) const {
    double value = m.p95_workflow_duration_ms;

    if (value >= thresholds_.p95_latency_critical_ms) {
        alerts.push_back({HealthStatus::CRITICAL, "p95_workflow_duration_ms", value,
                          thresholds_.p95_latency_critical_ms,
                          "P95 workflow duration " + formatNumber(value / 1000.0) + "s",
                          "Check for slow or hanging agents"});
    } else if (value >= thresholds_.p95_latency_warning_ms) {
        alerts.push_back({HealthStatus::WARNING, "p95_workflow_duration_ms", value,
                          thresholds_.p95_latency_warning_ms,
                          "P95 workflow duration " + formatNumber(value / 1000.0) + "s",
                          "Profile the slowest phases"});
    }
}

void HealthMonitor::checkQueueDepth(const PoolMetrics& m, std::vector<Alert>& alerts) const {
    double value = static_cast<double>(m.queue_depth);

    if (m.queue_depth >= thresholds_.queue_depth_critical) {
        alerts.push_back({HealthStatus::CRITICAL, "queue_depth", value,
                          static_cast<double>(thresholds_.queue_depth_critical),
                          std::to_string(m.queue_depth) + " workflows waiting",
                          "Scale the pool or throttle submissions"});
    } else if (m.queue_depth >= thresholds_.queue_depth_warning &&
               m.queue_depth_trend == "increasing") {
        alerts.push_back({HealthStatus::WARNING, "queue_depth", value,
                          static_cast<double>(thresholds_.queue_depth_warning),
                          std::to_string(m.queue_depth) + " workflows waiting and growing",
                          "Monitor the backlog; consider raising max_concurrent"});
    }
}

void HealthMonitor::checkPhaseFailures(const PoolMetrics& m, std::vector<Alert>& alerts) const {
    for (const auto& [phase, rate] : m.failure_rate_by_phase) {
        if (rate >= thresholds_.phase_failure_rate_critical) {
            alerts.push_back({HealthStatus::CRITICAL, "failure_rate." + phase, rate,
                              thresholds_.phase_failure_rate_critical,
                              phase + " fails " + formatPercent(rate) + " of the time",
                              "Investigate the agent serving " + phase});
        } else if (rate >= thresholds_.phase_failure_rate_warning) {
            alerts.push_back({HealthStatus::WARNING, "failure_rate." + phase, rate,
                              thresholds_.phase_failure_rate_warning,
                              phase + " fails " + formatPercent(rate) + " of the time",
                              "Review recent " + phase + " errors"});
        }
    }
}

} // namespace chimera
