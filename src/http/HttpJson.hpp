#pragma once

#include <string>

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace pulse::http {

std::string status_reason(int statusCode);

std::string serialize_json(const boost::json::value& value);

// Serializes the value into a 200 JSON response.
void write_json(pulse::api::Response& response, const boost::json::value& value);

}  // namespace pulse::http
