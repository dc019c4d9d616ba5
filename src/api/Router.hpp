#pragma once

#include <functional>
#include <map>
#include <string>

#include "api/Controllers.hpp"

namespace pulse::storage {
class IStateReader;
}

namespace pulse::api {

class Router {
public:
    explicit Router(const storage::IStateReader& state);

    // Never throws; handler failures become 500 responses.
    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;

    std::map<std::string, Handler> routes_;
};

}  // namespace pulse::api
