#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

#include "feed/TickSource.hpp"

namespace pulse::feed {

// Replays "timestamp,open,high,low,close,volume" rows from a file, one line
// per call to next(). Finite.
class ReplayTickSource final : public TickSource {
public:
    struct Options {
        std::string path;
        std::uint32_t intervalMs{65};
        // Timestamp assumed before the first row; wall clock when empty.
        std::optional<std::int64_t> initialTimestampMs{};
    };

    // Throws ConfigError when the file cannot be opened.
    explicit ReplayTickSource(const Options& options);

    std::optional<domain::Candle> next() override;
    std::chrono::milliseconds pacing() const noexcept override;
    const char* name() const noexcept override { return "replay"; }

    std::size_t linesRead() const noexcept { return linesRead_; }
    std::size_t linesSkipped() const noexcept { return linesSkipped_; }

private:
    std::optional<domain::Candle> parseLine_(const std::string& line);

    Options options_;
    std::ifstream input_;
    std::int64_t lastTimestampMs_;
    std::size_t linesRead_{0};
    std::size_t linesSkipped_{0};
};

}  // namespace pulse::feed
