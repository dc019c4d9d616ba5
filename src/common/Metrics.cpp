#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace pulse::metrics {
namespace {

constexpr std::size_t kMaxLatencySamples = 4096;

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex] + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry() : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(const std::string& routeKey)
    : registry_(Registry::instance()), routeKey_(routeKey), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
        std::chrono::steady_clock::now() - start_);
    registry_.recordLatency(routeKey_, elapsed.count());
}

void Registry::incrementRequest(const std::string& routeKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureRouteMetricsLocked(routeKey).totalRequests.fetch_add(1U, std::memory_order_relaxed);
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it != counters_.end() ? it->second : 0U;
}

std::optional<double> Registry::gauge(const std::string& gaugeKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = gauges_.find(gaugeKey);
    if (it == gauges_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [routeKey, metricsPtr] : routeMetrics_) {
        RouteSnapshot routeSnapshot;
        routeSnapshot.totalRequests = metricsPtr->totalRequests.load(std::memory_order_relaxed);

        auto latencies = metricsPtr->latenciesMs;
        if (!latencies.empty()) {
            std::sort(latencies.begin(), latencies.end());
            routeSnapshot.p95Ms = computeQuantile(latencies, 0.95);
            routeSnapshot.p99Ms = computeQuantile(latencies, 0.99);
        }
        snapshot.routes.emplace(routeKey, std::move(routeSnapshot));
    }

    for (const auto& [key, value] : counters_) {
        snapshot.counters.emplace(key, value);
    }
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(key, gauge);
    }

    return snapshot;
}

Registry::RouteMetrics& Registry::ensureRouteMetricsLocked(const std::string& routeKey) {
    auto [it, inserted] = routeMetrics_.try_emplace(routeKey, nullptr);
    if (inserted) {
        it->second = std::make_unique<RouteMetrics>();
    }
    return *it->second;
}

void Registry::recordLatency(const std::string& routeKey, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& samples = ensureRouteMetricsLocked(routeKey).latenciesMs;
    if (samples.size() >= kMaxLatencySamples) {
        samples.erase(samples.begin());
    }
    samples.push_back(latencyMs);
}

}  // namespace pulse::metrics
