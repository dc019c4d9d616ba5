#include "api/Controllers.hpp"

#include <chrono>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "common/Metrics.hpp"
#include "http/HttpJson.hpp"
#include "storage/ManifestJson.hpp"
#include "storage/StateReader.hpp"

namespace pulse::api {

Response healthz() {
    Response response;
    boost::json::object payload;
    payload["status"] = "ok";
    http::write_json(response, payload);
    return response;
}

Response stats() {
    const auto snapshot = metrics::Registry::instance().snapshot();
    const auto uptimeSeconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(snapshot.capturedAt - snapshot.startTime).count();

    boost::json::object routes;
    for (const auto& [route, metrics] : snapshot.routes) {
        boost::json::object entry;
        entry["requests"] = metrics.totalRequests;
        if (metrics.p95Ms.has_value()) {
            entry["p95_ms"] = *metrics.p95Ms;
        }
        if (metrics.p99Ms.has_value()) {
            entry["p99_ms"] = *metrics.p99Ms;
        }
        routes[route] = std::move(entry);
    }

    boost::json::object counters;
    for (const auto& [key, value] : snapshot.counters) {
        counters[key] = value;
    }

    boost::json::object gauges;
    for (const auto& [key, gauge] : snapshot.gauges) {
        gauges[key] = gauge.value;
    }

    boost::json::object payload;
    payload["uptime_seconds"] = uptimeSeconds;
    payload["routes"] = std::move(routes);
    payload["counters"] = std::move(counters);
    payload["gauges"] = std::move(gauges);

    Response response;
    http::write_json(response, payload);
    return response;
}

Response manifest(const storage::IStateReader& state) {
    return Response{200,
                    http::status_reason(200),
                    storage::serializeManifest(state.manifestSnapshot()),
                    "application/json; charset=utf-8",
                    {}};
}

Response latest(const storage::IStateReader& state) {
    auto segment = state.latestSegment();
    if (!segment) {
        return Response{204, http::status_reason(204), {}, {}, {}};
    }
    return Response{200, http::status_reason(200), std::move(*segment), "application/x-ndjson", {}};
}

}  // namespace pulse::api
