#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "domain/Models.hpp"

namespace pulse::codec {

// Wire layout, little-endian throughout:
//
//   header (32 bytes)
//     0  u16 version
//     2  u16 candle count
//     4  u32 interval ms
//     8  f64 base timestamp ms
//    16  f64 sent-at ms
//    24  u32 sequence
//    28  u32 reserved (0)
//   record (24 bytes each)
//     0  i32 delta ms from the previous timestamp (0 for the first record)
//     4  f32 open, high, low, close, volume
inline constexpr std::size_t kHeaderBytes = 32;
inline constexpr std::size_t kRecordBytes = 24;
inline constexpr std::uint32_t kFallbackIntervalMs = 65;

using Buffer = std::vector<std::uint8_t>;

constexpr std::size_t batchByteLength(std::size_t candleCount) noexcept {
    return kHeaderBytes + candleCount * kRecordBytes;
}

// Resolves the metadata the encoder would write for this batch. Throws CodecError.
domain::BatchMetadata resolveMetadata(const domain::PartialBatchMetadata& metadata,
                                      const std::vector<domain::Candle>& candles);

// Throws CodecError on an empty batch, more than 65535 candles, decreasing
// timestamps or a delta that does not fit in 32 bits.
Buffer encodeBatch(const domain::PartialBatchMetadata& metadata, const std::vector<domain::Candle>& candles);

// Throws CodecError when the buffer length disagrees with the declared count.
domain::DecodedBatch decodeBatch(const std::uint8_t* data, std::size_t size);
domain::DecodedBatch decodeBatch(const Buffer& buffer);

}  // namespace pulse::codec
