#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "common/Log.hpp"

namespace pulse::common {

enum class TickSourceMode {
    Synthetic,
    Replay,
};

enum class PersistenceMode {
    Disabled,
    Local,
};

struct Config {
    std::string streamId;
    std::uint32_t intervalMs = 65;
    std::uint16_t port = 8787;
    std::size_t threads = 1;
    pulse::log::Level logLevel = pulse::log::Level::Info;

    TickSourceMode tickSource = TickSourceMode::Synthetic;
    std::string replayPath;
    std::optional<std::uint32_t> seed{};
    std::size_t batchSize = 3;

    PersistenceMode persistenceMode = PersistenceMode::Local;
    std::string localRoot = "data/local-pulse";
    std::uint32_t flushIntervalMs = 1000;
    std::size_t segmentTargetBytes = 64 * 1024;
    std::size_t maxPendingCandles = 100000;

    bool httpCorsEnable = true;
    std::string httpCorsOrigin = "*";

    // Defaults, then environment, then command line. Throws ConfigError.
    static Config fromArgs(int argc, char** argv);
};

const char* toString(TickSourceMode mode) noexcept;
const char* toString(PersistenceMode mode) noexcept;

}  // namespace pulse::common
