#include "http/json_error.hpp"

#include <boost/json/object.hpp>

#include "http/HttpJson.hpp"

namespace pulse::http {

void json_error(pulse::api::Response& response, int statusCode, std::string_view errorCode) {
    boost::json::object payload;
    payload["error"] = boost::json::string_view(errorCode.data(), errorCode.size());

    response.body = serialize_json(payload);
    response.statusCode = statusCode;
    response.statusText = status_reason(statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

}  // namespace pulse::http
