#include "api/Router.hpp"

#include <exception>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "http/json_error.hpp"

namespace pulse::api {

namespace {

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

}  // namespace

Router::Router(const storage::IStateReader& state) {
    routes_.emplace(makeKey("GET", "/healthz"), [](const Request&) { return healthz(); });
    routes_.emplace(makeKey("GET", "/stats"), [](const Request&) { return stats(); });
    routes_.emplace(makeKey("GET", "/state/manifest"), [&state](const Request&) { return manifest(state); });
    routes_.emplace(makeKey("GET", "/state/latest"), [&state](const Request&) { return latest(state); });
}

Response Router::handle(const Request& request) const {
    const auto key = makeKey(request.method, request.path);
    const auto it = routes_.find(key);
    if (it == routes_.end()) {
        Response response;
        http::json_error(response, 404, "not_found");
        return response;
    }

    metrics::Registry::instance().incrementRequest(key);
    metrics::Registry::ScopedTimer timer(key);
    try {
        return it->second(request);
    } catch (const std::exception& ex) {
        LOG_ERR("request failed route=" << key << " error=" << ex.what());
        Response response;
        http::json_error(response, 500, "internal_error");
        return response;
    }
}

}  // namespace pulse::api
