#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include "api/Router.hpp"
#include "storage/StateReader.hpp"

using pulse::api::Request;
using pulse::api::Router;

namespace {

class FakeState : public pulse::storage::IStateReader {
public:
    pulse::domain::Manifest manifestSnapshot() const override {
        if (fail) {
            throw std::runtime_error("state unavailable");
        }
        return manifest;
    }

    std::optional<std::string> latestSegment() const override { return latest; }

    pulse::domain::Manifest manifest;
    std::optional<std::string> latest;
    bool fail{false};
};

Request get(const std::string& target) {
    Request request;
    request.method = "GET";
    request.target = target;
    const auto queryPos = target.find('?');
    request.path = target.substr(0, queryPos);
    if (queryPos != std::string::npos) {
        request.query = target.substr(queryPos + 1);
    }
    return request;
}

}  // namespace

int main() {
    FakeState state;
    state.manifest.streamId = "m1";
    state.manifest.intervalMs = 65;
    state.manifest.updatedAtMs = 1234;
    Router router(state);

    {
        const auto response = router.handle(get("/state/latest"));
        if (response.statusCode != 204 || !response.body.empty()) {
            std::cerr << "Latest before any flush should be 204, got " << response.statusCode << "\n";
            return 1;
        }
    }

    {
        const auto response = router.handle(get("/state/manifest"));
        if (response.statusCode != 200 || response.contentType.find("application/json") != 0) {
            std::cerr << "Manifest route should answer JSON\n";
            return 1;
        }
        const auto value = boost::json::parse(response.body);
        const auto& object = value.as_object();
        if (object.at("streamId").as_string() != "m1" || !object.at("latestSegmentPath").is_null()
            || object.at("sequence").as_int64() != 0 || object.at("updatedAtMs").as_int64() != 1234) {
            std::cerr << "Unexpected manifest body " << response.body << "\n";
            return 1;
        }
    }

    {
        state.latest = std::string("{\"timestampMs\":1}\n");
        state.manifest.sequence = 1;
        state.manifest.latestSegmentPath = std::string("m1/19700101/00/000001.log");
        const auto latest = router.handle(get("/state/latest?ignored=1"));
        if (latest.statusCode != 200 || latest.contentType != "application/x-ndjson" || latest.body != *state.latest) {
            std::cerr << "Latest should return the cached segment as ndjson\n";
            return 1;
        }
        const auto manifest = boost::json::parse(router.handle(get("/state/manifest")).body).as_object();
        if (manifest.at("latestSegmentPath").as_string() != "m1/19700101/00/000001.log") {
            std::cerr << "Manifest should expose the latest segment path\n";
            return 1;
        }
    }

    {
        const auto health = router.handle(get("/healthz"));
        if (health.statusCode != 200 || boost::json::parse(health.body).as_object().at("status").as_string() != "ok") {
            std::cerr << "Health check failed\n";
            return 1;
        }
    }

    {
        const auto missing = router.handle(get("/nope"));
        if (missing.statusCode != 404 || missing.body != R"({"error":"not_found"})") {
            std::cerr << "Unknown routes should return not_found\n";
            return 1;
        }
        Request post = get("/state/manifest");
        post.method = "POST";
        if (router.handle(post).statusCode != 404) {
            std::cerr << "Only GET is routed\n";
            return 1;
        }
    }

    {
        state.fail = true;
        const auto failed = router.handle(get("/state/manifest"));
        if (failed.statusCode != 500 || failed.body != R"({"error":"internal_error"})") {
            std::cerr << "Handler failures should map to internal_error\n";
            return 1;
        }
        state.fail = false;
    }

    {
        const auto stats = router.handle(get("/stats"));
        const auto object = boost::json::parse(stats.body).as_object();
        const auto& routes = object.at("routes").as_object();
        if (stats.statusCode != 200 || !object.contains("uptime_seconds") || !object.contains("counters")
            || !object.contains("gauges") || !routes.contains("GET /state/manifest")
            || routes.at("GET /state/manifest").as_object().at("requests").as_int64() < 3) {
            std::cerr << "Stats should report route counters: " << stats.body << "\n";
            return 1;
        }
    }

    return 0;
}
