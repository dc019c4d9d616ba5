#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "feed/TickSource.hpp"

namespace pulse::feed {

// Mulberry32: 32-bit state, uniform doubles in [0, 1).
class Mulberry32 {
public:
    explicit Mulberry32(std::uint32_t seed) noexcept : state_(seed) {}

    double next() noexcept {
        state_ += 0x6D2B79F5U;
        std::uint32_t t = state_;
        t = (t ^ (t >> 15)) * (t | 1U);
        t ^= t + (t ^ (t >> 7)) * (t | 61U);
        return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
    }

private:
    std::uint32_t state_;
};

// Bounded random walk; infinite. Two sources built with the same seed and
// start timestamp produce identical sequences.
class SyntheticTickSource final : public TickSource {
public:
    struct Options {
        std::uint32_t intervalMs{65};
        std::uint32_t seed{0};
        std::int64_t startTimestampMs{0};
        double startPrice{100.0};
        double volatility{0.8};
    };

    explicit SyntheticTickSource(const Options& options);

    std::optional<domain::Candle> next() override;
    std::chrono::milliseconds pacing() const noexcept override;
    const char* name() const noexcept override { return "synthetic"; }

private:
    Options options_;
    Mulberry32 rng_;
    std::int64_t lastTimestampMs_;
    double lastClose_;
};

}  // namespace pulse::feed
