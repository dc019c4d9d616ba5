#pragma once

#include <optional>
#include <string>

#include "domain/Models.hpp"

namespace pulse::storage {

// Read side of the persisted stream state, consumed by the HTTP surface.
class IStateReader {
public:
    virtual ~IStateReader() = default;

    virtual domain::Manifest manifestSnapshot() const = 0;

    // Contents of the most recently flushed segment, empty before the first flush.
    virtual std::optional<std::string> latestSegment() const = 0;
};

}  // namespace pulse::storage
