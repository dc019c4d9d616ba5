#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pulse::domain {

struct Candle {
    std::int64_t timestampMs{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};

    bool operator==(const Candle& other) const noexcept {
        return timestampMs == other.timestampMs && open == other.open && high == other.high
            && low == other.low && close == other.close && volume == other.volume;
    }
    bool operator!=(const Candle& other) const noexcept { return !(*this == other); }
};

inline constexpr std::uint16_t kDefaultBatchVersion = 1;

struct BatchMetadata {
    std::uint16_t version{kDefaultBatchVersion};
    std::uint32_t intervalMs{0};
    double baseTimestampMs{0.0};
    double sentAtMs{0.0};
    std::uint32_t sequence{0};
};

// Fields left empty are resolved by the encoder.
struct PartialBatchMetadata {
    std::optional<std::uint16_t> version{};
    std::optional<std::uint32_t> intervalMs{};
    std::optional<double> baseTimestampMs{};
    std::optional<double> sentAtMs{};
    std::optional<std::uint32_t> sequence{};
};

struct DecodedBatch {
    BatchMetadata metadata;
    std::vector<Candle> candles;
};

// A sequenced group of candles as produced by the batcher.
struct Batch {
    std::uint32_t sequence{0};
    std::vector<Candle> candles;
};

struct Manifest {
    std::string streamId;
    std::optional<std::string> latestSegmentPath{};
    std::uint32_t sequence{0};
    std::uint32_t intervalMs{0};
    std::int64_t updatedAtMs{0};

    bool operator==(const Manifest& other) const noexcept {
        return streamId == other.streamId && latestSegmentPath == other.latestSegmentPath
            && sequence == other.sequence && intervalMs == other.intervalMs
            && updatedAtMs == other.updatedAtMs;
    }
    bool operator!=(const Manifest& other) const noexcept { return !(*this == other); }
};

}  // namespace pulse::domain
