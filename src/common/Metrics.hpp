#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pulse::metrics {

// Process-wide counters and gauges. Keys are dotted names such as
// "writer.m1.flushes_total"; the map is exported verbatim by GET /stats.
class Registry {
public:
    struct RouteSnapshot {
        std::uint64_t totalRequests{0};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::map<std::string, RouteSnapshot> routes;
        std::map<std::string, std::uint64_t> counters;
        std::map<std::string, GaugeSnapshot> gauges;
    };

    // Records the lifetime of a request against its route key.
    class ScopedTimer {
    public:
        explicit ScopedTimer(const std::string& routeKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        Registry& registry_;
        std::string routeKey_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementRequest(const std::string& routeKey);
    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);

    std::uint64_t counter(const std::string& counterKey) const;
    std::optional<double> gauge(const std::string& gaugeKey) const;

    Snapshot snapshot() const;

private:
    struct RouteMetrics {
        std::atomic<std::uint64_t> totalRequests{0};
        std::vector<double> latenciesMs;
    };

    Registry();

    RouteMetrics& ensureRouteMetricsLocked(const std::string& routeKey);
    void recordLatency(const std::string& routeKey, double latencyMs);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<RouteMetrics>> routeMetrics_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeSnapshot> gauges_;
};

}  // namespace pulse::metrics
