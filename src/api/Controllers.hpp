#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pulse::storage {
class IStateReader;
}

namespace pulse::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
};

struct Response {
    int statusCode{200};
    std::string statusText;
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

Response healthz();

Response stats();

Response manifest(const storage::IStateReader& state);

// 204 until the first segment has been flushed.
Response latest(const storage::IStateReader& state);

}  // namespace pulse::api
