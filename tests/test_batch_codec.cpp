#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "codec/BatchCodec.hpp"
#include "common/Errors.hpp"

using pulse::codec::decodeBatch;
using pulse::codec::encodeBatch;
using pulse::domain::Candle;
using pulse::domain::PartialBatchMetadata;

namespace {

bool expectCodecError(const std::string& label, const std::string& fragment, void (*body)()) {
    try {
        body();
    } catch (const pulse::CodecError& ex) {
        if (std::string(ex.what()).find(fragment) == std::string::npos) {
            std::cerr << label << ": unexpected message '" << ex.what() << "'\n";
            return false;
        }
        return true;
    }
    std::cerr << label << ": expected CodecError\n";
    return false;
}

std::vector<Candle> sampleCandles() {
    return {
        Candle{1000, 100.0, 105.0, 99.0, 104.0, 12500.0},
        Candle{1065, 104.0, 106.0, 101.0, 103.0, 10250.0},
        Candle{1130, 103.0, 108.0, 102.0, 107.0, 9750.0},
    };
}

}  // namespace

int main() {
    // Three candles with sequence 42 produce a 104-byte frame that decodes back exactly.
    {
        const auto candles = sampleCandles();
        PartialBatchMetadata metadata;
        metadata.sequence = 42;
        metadata.intervalMs = 65;
        metadata.sentAtMs = 5000.0;

        const auto buffer = encodeBatch(metadata, candles);
        if (buffer.size() != 104U || pulse::codec::batchByteLength(3) != 104U) {
            std::cerr << "Expected a 104-byte buffer but got " << buffer.size() << "\n";
            return 1;
        }
        if (buffer[0] != 1U || buffer[1] != 0U || buffer[2] != 3U || buffer[3] != 0U) {
            std::cerr << "Header must start with version 1 and count 3 in little-endian\n";
            return 1;
        }
        if (buffer[24] != 42U || buffer[28] != 0U || buffer[31] != 0U) {
            std::cerr << "Sequence or reserved bytes are wrong\n";
            return 1;
        }

        const auto decoded = decodeBatch(buffer);
        if (decoded.metadata.sequence != 42U || decoded.metadata.intervalMs != 65U
            || decoded.metadata.baseTimestampMs != 1000.0 || decoded.metadata.sentAtMs != 5000.0
            || decoded.metadata.version != 1U) {
            std::cerr << "Decoded metadata does not match the encoded values\n";
            return 1;
        }
        if (decoded.candles != candles) {
            std::cerr << "Decoded candles differ from the originals\n";
            return 1;
        }
    }

    // Defaults: base timestamp from the first candle, interval from the mean delta.
    {
        std::vector<Candle> candles{
            Candle{2000, 1, 1, 1, 1, 1},
            Candle{2010, 1, 1, 1, 1, 1},
            Candle{2031, 1, 1, 1, 1, 1},
        };
        const auto resolved = pulse::codec::resolveMetadata(PartialBatchMetadata{}, candles);
        if (resolved.intervalMs != 16U || resolved.baseTimestampMs != 2000.0 || resolved.sequence != 0U
            || resolved.version != pulse::domain::kDefaultBatchVersion || resolved.sentAtMs <= 0.0) {
            std::cerr << "Unexpected resolved defaults interval=" << resolved.intervalMs << "\n";
            return 1;
        }

        const auto single = pulse::codec::resolveMetadata(PartialBatchMetadata{}, {Candle{5, 1, 1, 1, 1, 1}});
        if (single.intervalMs != pulse::codec::kFallbackIntervalMs) {
            std::cerr << "A single candle must fall back to a 65 ms interval\n";
            return 1;
        }
    }

    // Deltas reconstruct absolute timestamps without drift over a long batch.
    {
        const std::int64_t t0 = 1'700'000'000'123LL;
        std::vector<Candle> candles;
        for (int i = 0; i < 1000; ++i) {
            candles.push_back(Candle{t0 + i * 65LL, 1.5, 2.5, 0.5, 2.0, 10.0});
        }
        const auto decoded = decodeBatch(encodeBatch(PartialBatchMetadata{}, candles));
        if (decoded.candles.size() != candles.size()) {
            std::cerr << "Decoded candle count mismatch\n";
            return 1;
        }
        for (std::size_t i = 0; i < candles.size(); ++i) {
            if (decoded.candles[i].timestampMs != candles[i].timestampMs) {
                std::cerr << "Timestamp drift at index " << i << "\n";
                return 1;
            }
        }
        if (decoded.metadata.intervalMs != 65U) {
            std::cerr << "Expected the inferred interval to be 65 ms\n";
            return 1;
        }
    }

    // Prices are carried as f32.
    {
        const std::vector<Candle> candles{Candle{0, 0.1, 0.2, 0.05, 0.15, 123456.789}};
        const auto decoded = decodeBatch(encodeBatch(PartialBatchMetadata{}, candles));
        if (decoded.candles[0].open != static_cast<double>(static_cast<float>(0.1))
            || decoded.candles[0].volume != static_cast<double>(static_cast<float>(123456.789))) {
            std::cerr << "Expected f32 rounding of price and volume\n";
            return 1;
        }
    }

    if (!expectCodecError("empty batch", "empty batch", [] { encodeBatch(PartialBatchMetadata{}, {}); })) {
        return 1;
    }

    if (!expectCodecError("out of order", "out of order", [] {
            encodeBatch(PartialBatchMetadata{}, {Candle{100, 1, 1, 1, 1, 1}, Candle{50, 1, 1, 1, 1, 1}});
        })) {
        return 1;
    }

    if (!expectCodecError("delta overflow", "32 bits", [] {
            encodeBatch(PartialBatchMetadata{}, {Candle{0, 1, 1, 1, 1, 1}, Candle{5'000'000'000LL, 1, 1, 1, 1, 1}});
        })) {
        return 1;
    }

    if (!expectCodecError("too many candles", "exceeds", [] {
            std::vector<Candle> candles(70000, Candle{0, 1, 1, 1, 1, 1});
            encodeBatch(PartialBatchMetadata{}, candles);
        })) {
        return 1;
    }

    if (!expectCodecError("short buffer", "too small", [] {
            const pulse::codec::Buffer buffer(16, 0U);
            decodeBatch(buffer);
        })) {
        return 1;
    }

    // A header declaring more candles than the buffer holds.
    if (!expectCodecError("length mismatch", "length mismatch", [] {
            auto buffer = encodeBatch(PartialBatchMetadata{}, sampleCandles());
            buffer.pop_back();
            decodeBatch(buffer);
        })) {
        return 1;
    }

    return 0;
}
