#pragma once

#include <string_view>

#include "api/Controllers.hpp"

namespace pulse::http {

// Fills the response with {"error":"<errorCode>"} and the given status.
void json_error(pulse::api::Response& response, int statusCode, std::string_view errorCode);

}  // namespace pulse::http
