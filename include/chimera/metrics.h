/**
 * @file metrics.h
 * @brief Executor pool metrics: counters, latency percentiles, trends
 *
 * Naming: fields ending in _rate are ratios in [0, 1]; fields ending in
 * _pct are percentages in [0, 100].
 */

#ifndef CHIMERA_METRICS_H
#define CHIMERA_METRICS_H

#include "chimera/workflow_task.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace chimera {

/**
 * @brief Point-in-time snapshot of the executor pool
 */
struct PoolMetrics {
    // Gauges
    int pool_size = 0;
    int active_workflows = 0;
    int available_slots = 0;
    double pool_utilization_pct = 0.0;
    double peak_utilization_pct = 0.0;
    size_t queue_depth = 0;

    /// "increasing", "stable" or "decreasing"
    std::string queue_depth_trend = "stable";

    // Cumulative counters
    uint64_t total_workflows_processed = 0;
    uint64_t total_workflows_succeeded = 0;
    uint64_t total_workflows_failed = 0;

    /// succeeded / processed, 0 when nothing was processed
    double success_rate = 0.0;

    /// Running mean over all completed workflows
    double avg_workflow_duration_ms = 0.0;

    // Over the sliding window
    double p50_workflow_duration_ms = 0.0;
    double p95_workflow_duration_ms = 0.0;
    double p99_workflow_duration_ms = 0.0;

    /// "improving", "stable" or "degrading"
    std::string latency_trend = "stable";

    /// Phase name -> failures at that phase / workflows that reached it
    std::map<std::string, double> failure_rate_by_phase;

    /// Share of workflows that needed retries and still succeeded
    double retry_success_rate = 0.0;

    nlohmann::json toJson() const;
    static PoolMetrics fromJson(const nlohmann::json& j);
};

/**
 * @brief Thread-safe collector behind ExecutorPool::getMetrics()
 */
class MetricsCollector {
public:
    /**
     * @brief Construct a collector
     * @param window_size Recent workflows kept for percentiles and trends
     */
    explicit MetricsCollector(size_t window_size = 100);

    /**
     * @brief Record a workflow that reached a terminal status
     * @param task_id Workflow id
     * @param duration_ms Terminal time minus admission time
     * @param success true for COMPLETED
     * @param last_phase Phase that failed, or E2E_VALIDATION on success
     * @param retries Phase retries the workflow went through
     */
    void recordWorkflow(const std::string& task_id,
                        double duration_ms,
                        bool success,
                        ChimeraPhase last_phase,
                        int retries);

    void recordQueueDepth(size_t depth);

    void updatePeakUtilization(double utilization_pct);

    /**
     * @brief Build a snapshot and fold the gauges into peak and queue history
     */
    PoolMetrics snapshot(int pool_size, int active_workflows, size_t queue_depth);

    uint64_t totalProcessed() const;

    size_t windowSize() const { return window_size_; }

private:
    struct WorkflowSample {
        std::string task_id;
        double duration_ms;
        bool success;
        ChimeraPhase last_phase;
        int retries;
    };

    // Queue depth samples kept for trend detection
    static constexpr size_t QUEUE_HISTORY_SIZE = 20;

    size_t window_size_;
    std::deque<WorkflowSample> history_;
    std::deque<size_t> queue_depth_history_;
    double peak_utilization_pct_ = 0.0;

    uint64_t total_processed_ = 0;
    uint64_t total_succeeded_ = 0;
    uint64_t total_failed_ = 0;
    double total_duration_ms_ = 0.0;
    uint64_t total_retried_ = 0;
    uint64_t total_retried_succeeded_ = 0;

    mutable std::mutex mutex_;

    // Caller holds mutex_ for the helpers below
    std::string queueTrend() const;
    std::string latencyTrend() const;
    std::map<std::string, double> failureRateByPhase() const;
};

} // namespace chimera

#endif // CHIMERA_METRICS_H
