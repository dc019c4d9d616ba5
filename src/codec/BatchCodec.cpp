#include "codec/BatchCodec.hpp"

#include <chrono>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>

#include <boost/endian/conversion.hpp>

#include "common/Errors.hpp"

namespace pulse::codec {
namespace {

namespace endian = boost::endian;

std::uint32_t floatBits(float value) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

float floatFromBits(std::uint32_t bits) {
    float value = 0.0F;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::uint64_t doubleBits(double value) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

double doubleFromBits(std::uint64_t bits) {
    double value = 0.0;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

double wallClockMs() {
    return static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

std::uint32_t inferIntervalMs(const std::vector<domain::Candle>& candles) {
    if (candles.size() < 2U) {
        return kFallbackIntervalMs;
    }
    const auto span = static_cast<double>(candles.back().timestampMs - candles.front().timestampMs);
    const auto mean = std::llround(span / static_cast<double>(candles.size() - 1U));
    if (mean < 0 || mean > std::numeric_limits<std::uint32_t>::max()) {
        throw CodecError("inferred interval out of range: " + std::to_string(mean));
    }
    return static_cast<std::uint32_t>(mean);
}

void writeRecord(std::uint8_t* out, std::int32_t deltaMs, const domain::Candle& candle) {
    endian::store_little_s32(out, deltaMs);
    endian::store_little_u32(out + 4, floatBits(static_cast<float>(candle.open)));
    endian::store_little_u32(out + 8, floatBits(static_cast<float>(candle.high)));
    endian::store_little_u32(out + 12, floatBits(static_cast<float>(candle.low)));
    endian::store_little_u32(out + 16, floatBits(static_cast<float>(candle.close)));
    endian::store_little_u32(out + 20, floatBits(static_cast<float>(candle.volume)));
}

}  // namespace

domain::BatchMetadata resolveMetadata(const domain::PartialBatchMetadata& metadata,
                                      const std::vector<domain::Candle>& candles) {
    if (candles.empty()) {
        throw CodecError("empty batch");
    }

    domain::BatchMetadata resolved;
    resolved.version = metadata.version.value_or(domain::kDefaultBatchVersion);
    resolved.intervalMs = metadata.intervalMs ? *metadata.intervalMs : inferIntervalMs(candles);
    resolved.baseTimestampMs = metadata.baseTimestampMs.value_or(static_cast<double>(candles.front().timestampMs));
    resolved.sentAtMs = metadata.sentAtMs ? *metadata.sentAtMs : wallClockMs();
    resolved.sequence = metadata.sequence.value_or(0U);
    return resolved;
}

Buffer encodeBatch(const domain::PartialBatchMetadata& metadata, const std::vector<domain::Candle>& candles) {
    if (candles.empty()) {
        throw CodecError("empty batch");
    }
    if (candles.size() > std::numeric_limits<std::uint16_t>::max()) {
        throw CodecError("batch of " + std::to_string(candles.size()) + " candles exceeds the u16 count field");
    }

    const auto resolved = resolveMetadata(metadata, candles);

    Buffer buffer(batchByteLength(candles.size()), 0U);
    auto* out = buffer.data();

    endian::store_little_u16(out, resolved.version);
    endian::store_little_u16(out + 2, static_cast<std::uint16_t>(candles.size()));
    endian::store_little_u32(out + 4, resolved.intervalMs);
    endian::store_little_u64(out + 8, doubleBits(resolved.baseTimestampMs));
    endian::store_little_u64(out + 16, doubleBits(resolved.sentAtMs));
    endian::store_little_u32(out + 24, resolved.sequence);
    endian::store_little_u32(out + 28, 0U);

    auto* record = out + kHeaderBytes;
    std::int64_t previous = candles.front().timestampMs;
    for (std::size_t i = 0; i < candles.size(); ++i) {
        const auto& candle = candles[i];
        const std::int64_t delta = i == 0 ? 0 : candle.timestampMs - previous;
        if (delta < 0) {
            throw CodecError("timestamps out of order at index " + std::to_string(i));
        }
        if (delta > std::numeric_limits<std::int32_t>::max()) {
            throw CodecError("timestamp delta does not fit in 32 bits at index " + std::to_string(i));
        }
        writeRecord(record, static_cast<std::int32_t>(delta), candle);
        record += kRecordBytes;
        previous = candle.timestampMs;
    }

    return buffer;
}

domain::DecodedBatch decodeBatch(const std::uint8_t* data, std::size_t size) {
    if (data == nullptr || size < kHeaderBytes) {
        throw CodecError("buffer too small to contain a batch header (" + std::to_string(size) + " bytes)");
    }

    domain::DecodedBatch decoded;
    auto& metadata = decoded.metadata;
    metadata.version = endian::load_little_u16(data);
    const std::uint16_t candleCount = endian::load_little_u16(data + 2);
    metadata.intervalMs = endian::load_little_u32(data + 4);
    metadata.baseTimestampMs = doubleFromBits(endian::load_little_u64(data + 8));
    metadata.sentAtMs = doubleFromBits(endian::load_little_u64(data + 16));
    metadata.sequence = endian::load_little_u32(data + 24);

    const auto expected = batchByteLength(candleCount);
    if (size != expected) {
        throw CodecError("length mismatch: expected " + std::to_string(expected) + " bytes, received "
                         + std::to_string(size));
    }

    decoded.candles.reserve(candleCount);
    const auto* record = data + kHeaderBytes;
    double timestamp = metadata.baseTimestampMs;
    for (std::uint16_t i = 0; i < candleCount; ++i) {
        const std::int32_t delta = endian::load_little_s32(record);
        if (i > 0) {
            timestamp += static_cast<double>(delta);
        }

        domain::Candle candle;
        candle.timestampMs = std::llround(timestamp);
        candle.open = floatFromBits(endian::load_little_u32(record + 4));
        candle.high = floatFromBits(endian::load_little_u32(record + 8));
        candle.low = floatFromBits(endian::load_little_u32(record + 12));
        candle.close = floatFromBits(endian::load_little_u32(record + 16));
        candle.volume = floatFromBits(endian::load_little_u32(record + 20));
        decoded.candles.push_back(candle);
        record += kRecordBytes;
    }

    return decoded;
}

domain::DecodedBatch decodeBatch(const Buffer& buffer) { return decodeBatch(buffer.data(), buffer.size()); }

}  // namespace pulse::codec
