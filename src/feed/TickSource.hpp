#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "common/Config.hpp"
#include "domain/Models.hpp"

namespace pulse::feed {

// Lazy candle producer. An empty optional from next() means the source is
// exhausted; that is a clean end of stream, never an error. Consumers may stop
// calling next() at any point.
class TickSource {
public:
    virtual ~TickSource() = default;

    virtual std::optional<domain::Candle> next() = 0;

    // Delay the consumer should observe between two items.
    virtual std::chrono::milliseconds pacing() const noexcept = 0;

    virtual const char* name() const noexcept = 0;
};

struct TickSourceOptions {
    common::TickSourceMode mode{common::TickSourceMode::Synthetic};
    std::uint32_t intervalMs{65};
    std::optional<std::uint32_t> seed{};
    std::optional<std::int64_t> startTimestampMs{};
    std::string replayPath;
};

// Throws ConfigError when replay mode has no readable path.
std::unique_ptr<TickSource> makeTickSource(const TickSourceOptions& options);

std::int64_t wallClockMs();

}  // namespace pulse::feed
