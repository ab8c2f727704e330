/**
 * @file metrics.cpp
 * @brief Implementation of MetricsCollector and PoolMetrics serialization
 */

#include "chimera/metrics.h"
#include "chimera/errors.h"

#include <algorithm>
#include <numeric>
#include <vector>

namespace chimera {

namespace {

// Relative change between window halves that counts as a trend
constexpr double QUEUE_TREND_THRESHOLD = 0.2;
constexpr double LATENCY_TREND_THRESHOLD = 0.15;

// Minimum samples before a trend is reported
constexpr size_t QUEUE_TREND_MIN_SAMPLES = 5;
constexpr size_t LATENCY_TREND_MIN_SAMPLES = 10;

template <typename It, typename Fn>
double meanOf(It begin, It end, Fn value) {
    double sum = 0.0;
    size_t n = 0;
    for (It it = begin; it != end; ++it, ++n) {
        sum += value(*it);
    }
    return n == 0 ? 0.0 : sum / static_cast<double>(n);
}

/// Compare the mean of the newer half to the older half
int halfTrend(double older, double recent, double threshold) {
    if (recent > older * (1.0 + threshold)) return 1;
    if (recent < older * (1.0 - threshold)) return -1;
    return 0;
}

} // anonymous namespace

nlohmann::json PoolMetrics::toJson() const {
    nlohmann::json j;

    j["pool_size"] = pool_size;
    j["active_workflows"] = active_workflows;
    j["available_slots"] = available_slots;
    j["pool_utilization_pct"] = pool_utilization_pct;
    j["peak_utilization_pct"] = peak_utilization_pct;
    j["queue_depth"] = queue_depth;
    j["queue_depth_trend"] = queue_depth_trend;

    j["total_workflows_processed"] = total_workflows_processed;
    j["total_workflows_succeeded"] = total_workflows_succeeded;
    j["total_workflows_failed"] = total_workflows_failed;
    j["success_rate"] = success_rate;
    j["avg_workflow_duration_ms"] = avg_workflow_duration_ms;

    j["p50_workflow_duration_ms"] = p50_workflow_duration_ms;
    j["p95_workflow_duration_ms"] = p95_workflow_duration_ms;
    j["p99_workflow_duration_ms"] = p99_workflow_duration_ms;
    j["latency_trend"] = latency_trend;
    j["failure_rate_by_phase"] = failure_rate_by_phase;
    j["retry_success_rate"] = retry_success_rate;

    return j;
}

PoolMetrics PoolMetrics::fromJson(const nlohmann::json& j) {
    try {
        PoolMetrics m;

        m.pool_size = j.at("pool_size").get<int>();
        m.active_workflows = j.at("active_workflows").get<int>();
        m.available_slots = j.at("available_slots").get<int>();
        m.pool_utilization_pct = j.value("pool_utilization_pct", 0.0);
        m.peak_utilization_pct = j.value("peak_utilization_pct", 0.0);
        m.queue_depth = j.value("queue_depth", static_cast<size_t>(0));
        m.queue_depth_trend = j.value("queue_depth_trend", std::string("stable"));

        m.total_workflows_processed = j.at("total_workflows_processed").get<uint64_t>();
        m.total_workflows_succeeded = j.at("total_workflows_succeeded").get<uint64_t>();
        m.total_workflows_failed = j.at("total_workflows_failed").get<uint64_t>();
        m.success_rate = j.at("success_rate").get<double>();
        m.avg_workflow_duration_ms = j.at("avg_workflow_duration_ms").get<double>();

        m.p50_workflow_duration_ms = j.value("p50_workflow_duration_ms", 0.0);
        m.p95_workflow_duration_ms = j.value("p95_workflow_duration_ms", 0.0);
        m.p99_workflow_duration_ms = j.value("p99_workflow_duration_ms", 0.0);
        m.latency_trend = j.value("latency_trend", std::string("stable"));
        if (j.contains("failure_rate_by_phase")) {
            m.failure_rate_by_phase =
                j.at("failure_rate_by_phase").get<std::map<std::string, double>>();
        }
        m.retry_success_rate = j.value("retry_success_rate", 0.0);

        return m;

    } catch (const nlohmann::json::exception& e) {
        throw ChimeraException(ErrorCode::IPC_PROTOCOL_ERROR,
                               std::string("Invalid metrics JSON: ") + e.what());
    }
}

MetricsCollector::MetricsCollector(size_t window_size)
    : window_size_(window_size == 0 ? 1 : window_size) {
}

void MetricsCollector::recordWorkflow(const std::string& task_id,
                                      double duration_ms,
                                      bool success,
                                      ChimeraPhase last_phase,
                                      int retries) {
    std::lock_guard<std::mutex> lock(mutex_);

    history_.push_back({task_id, duration_ms, success, last_phase, retries});
    while (history_.size() > window_size_) {
        history_.pop_front();
    }

    total_processed_ += 1;
    if (success) {
        total_succeeded_ += 1;
    } else {
        total_failed_ += 1;
    }
    total_duration_ms_ += duration_ms;

    if (retries > 0) {
        total_retried_ += 1;
        if (success) {
            total_retried_succeeded_ += 1;
        }
    }
}

void MetricsCollector::recordQueueDepth(size_t depth) {
    std::lock_guard<std::mutex> lock(mutex_);

    queue_depth_history_.push_back(depth);
    while (queue_depth_history_.size() > QUEUE_HISTORY_SIZE) {
        queue_depth_history_.pop_front();
    }
}

void MetricsCollector::updatePeakUtilization(double utilization_pct) {
    std::lock_guard<std::mutex> lock(mutex_);
    peak_utilization_pct_ = std::max(peak_utilization_pct_, utilization_pct);
}

uint64_t MetricsCollector::totalProcessed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_processed_;
}

PoolMetrics MetricsCollector::snapshot(int pool_size, int active_workflows, size_t queue_depth) {
    double utilization = pool_size > 0
        ? static_cast<double>(active_workflows) / pool_size * 100.0
        : 0.0;

    updatePeakUtilization(utilization);
    recordQueueDepth(queue_depth);

    std::lock_guard<std::mutex> lock(mutex_);

    PoolMetrics m;
    m.pool_size = pool_size;
    m.active_workflows = active_workflows;
    m.available_slots = pool_size - active_workflows;
    m.pool_utilization_pct = utilization;
    m.peak_utilization_pct = peak_utilization_pct_;
    m.queue_depth = queue_depth;
    m.queue_depth_trend = queueTrend();

    m.total_workflows_processed = total_processed_;
    m.total_workflows_succeeded = total_succeeded_;
    m.total_workflows_failed = total_failed_;
    if (total_processed_ > 0) {
        m.success_rate = static_cast<double>(total_succeeded_) / total_processed_;
        m.avg_workflow_duration_ms = total_duration_ms_ / total_processed_;
    }

    if (!history_.empty()) {
        std::vector<double> sorted;
        sorted.reserve(history_.size());
        for (const auto& sample : history_) {
            sorted.push_back(sample.duration_ms);
        }
        std::sort(sorted.begin(), sorted.end());

        size_t n = sorted.size();
        m.p50_workflow_duration_ms = (n % 2 == 1)
            ? sorted[n / 2]
            : (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
        m.p95_workflow_duration_ms = sorted[std::min(n - 1, static_cast<size_t>(n * 0.95))];
        m.p99_workflow_duration_ms = sorted[std::min(n - 1, static_cast<size_t>(n * 0.99))];
    }

    m.latency_trend = latencyTrend();
    m.failure_rate_by_phase = failureRateByPhase();

    if (total_retried_ > 0) {
        m.retry_success_rate = static_cast<double>(total_retried_succeeded_) / total_retried_;
    }

    return m;
}

std::string MetricsCollector::queueTrend() const {
    if (queue_depth_history_.size() < QUEUE_TREND_MIN_SAMPLES) {
        return "stable";
    }

    auto mid = queue_depth_history_.begin() + queue_depth_history_.size() / 2;
    auto depth = [](size_t d) { return static_cast<double>(d); };
    double older = meanOf(queue_depth_history_.begin(), mid, depth);
    double recent = meanOf(mid, queue_depth_history_.end(), depth);

    switch (halfTrend(older, recent, QUEUE_TREND_THRESHOLD)) {
        case 1:  return "increasing";
        case -1: return "decreasing";
        default: return "stable";
    }
}

std::string MetricsCollector::latencyTrend() const {
    if (history_.size() < LATENCY_TREND_MIN_SAMPLES) {
        return "stable";
    }

    auto mid = history_.begin() + history_.size() / 2;
    auto duration = [](const WorkflowSample& s) { return s.duration_ms; };
    double older = meanOf(history_.begin(), mid, duration);
    double recent = meanOf(mid, history_.end(), duration);

    switch (halfTrend(older, recent, LATENCY_TREND_THRESHOLD)) {
        case 1:  return "degrading";
        case -1: return "improving";
        default: return "stable";
    }
}

std::map<std::string, double> MetricsCollector::failureRateByPhase() const {
    std::map<ChimeraPhase, int> reached;
    std::map<ChimeraPhase, int> failed;

    for (const auto& sample : history_) {
        // Every phase up to and including the last one was attempted
        for (int p = phaseOrdinal(ChimeraPhase::E2E_TEST_GENERATION);
             p <= phaseOrdinal(ChimeraPhase::E2E_VALIDATION) &&
             p <= phaseOrdinal(sample.last_phase);
             ++p) {
            reached[static_cast<ChimeraPhase>(p)] += 1;
        }
        if (!sample.success) {
            failed[sample.last_phase] += 1;
        }
    }

    std::map<std::string, double> rates;
    for (const auto& [phase, count] : reached) {
        auto it = failed.find(phase);
        int failures = it == failed.end() ? 0 : it->second;
        rates[phaseToString(phase)] = static_cast<double>(failures) / count;
    }
    return rates;
}

} // namespace chimera
