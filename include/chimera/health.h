/**
 * @file health.h
 * @brief Threshold checks over PoolMetrics
 *
 * Produces a HealthReport with one Alert per breached threshold and a
 * list of operator recommendations, most severe first.
 */

#ifndef CHIMERA_HEALTH_H
#define CHIMERA_HEALTH_H

#include "chimera/metrics.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace chimera {

/**
 * @brief Overall pool health
 */
enum class HealthStatus {
    HEALTHY,
    WARNING,
    CRITICAL
};

std::string healthStatusToString(HealthStatus status);

/**
 * @brief Alert thresholds
 *
 * Utilization is in percent, rates are ratios. Success rate alerts when
 * it drops to or below a threshold; every other metric alerts when it
 * reaches or exceeds one.
 */
struct HealthThresholds {
    double utilization_warning_pct = 80.0;
    double utilization_critical_pct = 95.0;

    double success_rate_warning = 0.90;
    double success_rate_critical = 0.75;

    double p95_latency_warning_ms = 60000.0;
    double p95_latency_critical_ms = 120000.0;

    /// The warning level only fires while the queue is growing
    size_t queue_depth_warning = 10;
    size_t queue_depth_critical = 25;

    double phase_failure_rate_warning = 0.10;
    double phase_failure_rate_critical = 0.25;

    /**
     * @brief Check ranges and warning/critical ordering
     * @throws ChimeraException(CONFIG_INVALID)
     */
    void validate() const;
};

/**
 * @brief One breached threshold
 */
struct Alert {
    HealthStatus severity = HealthStatus::WARNING;
    std::string metric;
    double current_value = 0.0;
    double threshold = 0.0;
    std::string message;
    std::string recommendation;

    nlohmann::json toJson() const;
};

/**
 * @brief Outcome of one assessment
 */
struct HealthReport {
    HealthStatus status = HealthStatus::HEALTHY;
    std::vector<Alert> alerts;
    std::vector<std::string> recommendations;

    /// Headline figures the report was computed from
    nlohmann::json metrics_summary = nlohmann::json::object();

    bool healthy() const { return status == HealthStatus::HEALTHY; }

    nlohmann::json toJson() const;
};

/**
 * @brief Stateless evaluator of PoolMetrics against HealthThresholds
 */
class HealthMonitor {
public:
    /// @throws ChimeraException(CONFIG_INVALID) if thresholds are inconsistent
    explicit HealthMonitor(HealthThresholds thresholds = HealthThresholds());

    HealthReport assess(const PoolMetrics& metrics) const;

    const HealthThresholds& thresholds() const { return thresholds_; }

private:
    HealthThresholds thresholds_;

    void checkUtilization(const PoolMetrics& m, std::vector<Alert>& alerts) const;
    void checkSuccessRate(const PoolMetrics& m, std::vector<Alert>& alerts) const;
    void checkLatency(const PoolMetrics& m, std::vector<Alert>& alerts) const;
    void checkQueueDepth(const PoolMetrics& m, std::vector<Alert>& alerts) const;
    void checkPhaseFailures(const PoolMetrics& m, std::vector<Alert>& alerts) const;
};

} // namespace chimera

#endif // CHIMERA_HEALTH_H
