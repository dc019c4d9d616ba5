#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "domain/Models.hpp"
#include "storage/StateReader.hpp"

namespace pulse::storage {

// Buffers candles and rolls them into write-once newline-delimited JSON
// segments, keeping latest.log and manifest.json current for the stream.
class SegmentLogWriter : public IStateReader {
public:
    using Clock = std::function<std::int64_t()>;

    struct Options {
        std::string streamId;
        std::uint32_t intervalMs{65};
        common::PersistenceMode mode{common::PersistenceMode::Local};
        std::filesystem::path localRoot{"data/local-pulse"};
        std::size_t segmentTargetBytes{64 * 1024};
        std::uint32_t flushIntervalMs{1000};
        std::size_t maxPendingCandles{100000};
    };

    explicit SegmentLogWriter(Options options, Clock clock = {});

    SegmentLogWriter(const SegmentLogWriter&) = delete;
    SegmentLogWriter& operator=(const SegmentLogWriter&) = delete;

    // May flush on size or age. Throws PersistenceError if that flush fails.
    void ingest(const std::vector<domain::Candle>& candles);

    // Writes every pending candle as one segment, whatever the thresholds.
    // No-op on an empty buffer. force only tags the log line.
    // Throws PersistenceError; the slice and its sequence number are then spent.
    void flush(bool force = false);

    // Restores manifest, sequence and latest segment from disk. Never throws.
    void hydrateFromDisk();

    domain::Manifest manifestSnapshot() const override;
    std::optional<std::string> latestSegment() const override;

    std::uint32_t sequence() const;
    std::size_t pendingCandles() const;
    const Options& options() const noexcept { return options_; }

private:
    struct PendingLine {
        std::int64_t timestampMs{0};
        std::string text;
    };

    bool thresholdReachedLocked_(std::int64_t nowMs) const;
    void flushIfDue_();
    void takePendingLocked_(std::deque<PendingLine>& slice, std::int64_t nowMs);
    void persistSlice_(const std::deque<PendingLine>& slice, std::int64_t nowMs, const char* trigger);
    void writeSlice_(const std::deque<PendingLine>& slice,
                     std::uint32_t sequence,
                     std::int64_t nowMs,
                     const char* trigger);
    void resetState_(std::int64_t nowMs);
    std::string metricKey_(const char* name) const;

    Options options_;
    Clock clock_;
    // Metric keys are "writer.<streamId>.<name>".
    std::string metricPrefix_;

    std::mutex flushMutex_;

    mutable std::mutex bufferMutex_;
    std::deque<PendingLine> pending_;
    std::size_t pendingBytes_{0};
    std::int64_t lastFlushAtMs_{0};

    mutable std::mutex stateMutex_;
    domain::Manifest manifest_;
    std::uint32_t sequence_{0};
    std::optional<std::string> latestSegment_;
};

}  // namespace pulse::storage
