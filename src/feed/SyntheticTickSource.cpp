#include "feed/SyntheticTickSource.hpp"

#include <algorithm>

namespace pulse::feed {
namespace {

constexpr double kMinPrice = 1.0;
constexpr double kBaseVolume = 10000.0;
constexpr double kVolumeSpread = 5000.0;

}  // namespace

SyntheticTickSource::SyntheticTickSource(const Options& options)
    : options_(options),
      rng_(options.seed),
      lastTimestampMs_(options.startTimestampMs),
      lastClose_(options.startPrice) {}

std::optional<domain::Candle> SyntheticTickSource::next() {
    lastTimestampMs_ += options_.intervalMs;

    const double volatility = options_.volatility;
    const double drift = (rng_.next() - 0.5) * volatility;

    domain::Candle candle;
    candle.timestampMs = lastTimestampMs_;
    candle.open = lastClose_;
    candle.close = std::max(kMinPrice, candle.open + drift);
    candle.high = std::max(candle.open, candle.close) + rng_.next() * (volatility / 2.0);
    candle.low = std::min(candle.open, candle.close) - rng_.next() * (volatility / 2.0);
    candle.volume = kBaseVolume + rng_.next() * kVolumeSpread;

    lastClose_ = candle.close;
    return candle;
}

std::chrono::milliseconds SyntheticTickSource::pacing() const noexcept {
    return std::chrono::milliseconds(options_.intervalMs);
}

}  // namespace pulse::feed
