#include "storage/SegmentLogWriter.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "storage/ManifestJson.hpp"
#include "storage/SegmentLayout.hpp"

namespace pulse::storage {

namespace {

std::int64_t systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Writes to a sibling temp file and renames it over the target.
void writeFileAtomically(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw PersistenceError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw PersistenceError("cannot open " + tmp.string() + " for writing");
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmp, ec);
            throw PersistenceError("short write to " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        const auto message = ec.message();
        std::filesystem::remove(tmp, ec);
        throw PersistenceError("cannot rename " + tmp.string() + " to " + path.string() + ": " + message);
    }
}

std::optional<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool isSafeRelative(const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

}  // namespace

SegmentLogWriter::SegmentLogWriter(Options options, Clock clock)
    : options_(std::move(options)), clock_(clock ? std::move(clock) : Clock{systemNowMs}) {
    if (options_.streamId.empty()) {
        throw ConfigError("segment writer requires a stream id");
    }
    metricPrefix_ = "writer." + options_.streamId + ".";
    if (options_.segmentTargetBytes == 0U) {
        options_.segmentTargetBytes = 1;
    }
    const auto nowMs = clock_();
    lastFlushAtMs_ = nowMs;
    resetState_(nowMs);
}

void SegmentLogWriter::resetState_(std::int64_t nowMs) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    manifest_ = domain::Manifest{};
    manifest_.streamId = options_.streamId;
    manifest_.intervalMs = options_.intervalMs;
    manifest_.updatedAtMs = nowMs;
    sequence_ = 0;
    latestSegment_.reset();
}

void SegmentLogWriter::ingest(const std::vector<domain::Candle>& candles) {
    if (options_.mode == common::PersistenceMode::Disabled || candles.empty()) {
        return;
    }

    const auto nowMs = clock_();
    bool shouldFlush = false;
    std::size_t dropped = 0;
    std::size_t pendingCount = 0;
    {
        std::lock_guard<std::mutex> lock(bufferMutex_);
        for (const auto& candle : candles) {
            PendingLine line{candle.timestampMs, serializeCandleLine(candle)};
            pendingBytes_ += line.text.size() + 1U;
            pending_.push_back(std::move(line));
        }
        while (pending_.size() > options_.maxPendingCandles && !pending_.empty()) {
            pendingBytes_ -= pending_.front().text.size() + 1U;
            pending_.pop_front();
            ++dropped;
        }
        pendingCount = pending_.size();
        shouldFlush = thresholdReachedLocked_(nowMs);
    }

    auto& registry = metrics::Registry::instance();
    registry.setGauge(metricKey_("pending_candles"), static_cast<double>(pendingCount));
    if (dropped > 0U) {
        registry.incrementCounter(metricKey_("dropped_candles"), dropped);
        LOG_WARN("pending buffer full, dropped oldest candles stream=" << options_.streamId << " dropped=" << dropped
                                                                       << " limit=" << options_.maxPendingCandles);
    }

    if (shouldFlush) {
        flushIfDue_();
    }
}

bool SegmentLogWriter::thresholdReachedLocked_(std::int64_t nowMs) const {
    return pendingBytes_ >= options_.segmentTargetBytes
        || nowMs - lastFlushAtMs_ >= static_cast<std::int64_t>(options_.flushIntervalMs);
}

std::string SegmentLogWriter::metricKey_(const char* name) const {
    return metricPrefix_ + name;
}

void SegmentLogWriter::flush(bool force) {
    std::lock_guard<std::mutex> flushLock(flushMutex_);

    const auto nowMs = clock_();
    std::deque<PendingLine> slice;
    {
        std::lock_guard<std::mutex> lock(bufferMutex_);
        if (pending_.empty()) {
            return;
        }
        takePendingLocked_(slice, nowMs);
    }
    persistSlice_(slice, nowMs, force ? "forced" : "manual");
}

void SegmentLogWriter::flushIfDue_() {
    std::lock_guard<std::mutex> flushLock(flushMutex_);

    // Another thread may have flushed between ingest and here.
    const auto nowMs = clock_();
    std::deque<PendingLine> slice;
    {
        std::lock_guard<std::mutex> lock(bufferMutex_);
        if (pending_.empty() || !thresholdReachedLocked_(nowMs)) {
            return;
        }
        takePendingLocked_(slice, nowMs);
    }
    persistSlice_(slice, nowMs, "threshold");
}

void SegmentLogWriter::takePendingLocked_(std::deque<PendingLine>& slice, std::int64_t nowMs) {
    slice.swap(pending_);
    pendingBytes_ = 0;
    lastFlushAtMs_ = nowMs;
}

void SegmentLogWriter::persistSlice_(const std::deque<PendingLine>& slice, std::int64_t nowMs, const char* trigger) {
    metrics::Registry::instance().setGauge(metricKey_("pending_candles"), static_cast<double>(pendingCandles()));

    if (options_.mode == common::PersistenceMode::Disabled) {
        LOG_DEBUG("persistence disabled, discarded candles=" << slice.size());
        return;
    }

    // Spent even if the write below fails.
    std::uint32_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        sequence = ++sequence_;
    }

    try {
        writeSlice_(slice, sequence, nowMs, trigger);
    } catch (const PersistenceError& ex) {
        auto& registry = metrics::Registry::instance();
        registry.incrementCounter(metricKey_("lost_candles"), slice.size());
        registry.incrementCounter(metricKey_("flush_errors"));
        LOG_ERR("segment flush failed stream=" << options_.streamId << " sequence=" << sequence
                                               << " candles=" << slice.size() << " error=" << ex.what());
        throw;
    }
}

void SegmentLogWriter::writeSlice_(const std::deque<PendingLine>& slice,
                                   std::uint32_t sequence,
                                   std::int64_t nowMs,
                                   const char* trigger) {
    std::string content;
    for (const auto& line : slice) {
        content += line.text;
        content.push_back('\n');
    }

    const auto relative = segmentRelativePath(options_.streamId, slice.front().timestampMs, sequence);
    const auto& root = options_.localRoot;
    const auto segment = root / relative;

    writeFileAtomically(segment, content);

    auto next = manifestSnapshot();
    next.streamId = options_.streamId;
    next.latestSegmentPath = relative.generic_string();
    next.sequence = sequence;
    next.intervalMs = options_.intervalMs;
    next.updatedAtMs = nowMs;

    try {
        writeFileAtomically(latestPath(root, options_.streamId), content);
        writeFileAtomically(manifestPath(root, options_.streamId), serializeManifest(next) + "\n");
    } catch (const PersistenceError&) {
        // No manifest points at the segment; drop it.
        std::error_code ec;
        std::filesystem::remove(segment, ec);
        if (ec) {
            LOG_WARN("cannot remove unreferenced segment path=" << segment.string() << " error=" << ec.message());
        }
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        manifest_ = next;
        latestSegment_ = content;
    }

    auto& registry = metrics::Registry::instance();
    registry.incrementCounter(metricKey_("flushes_total"));
    registry.incrementCounter(metricKey_("flushed_candles"), slice.size());
    registry.incrementCounter(metricKey_("bytes_written"), content.size());
    registry.setGauge(metricKey_("sequence"), static_cast<double>(sequence));

    LOG_INFO("segment flushed stream=" << options_.streamId << " sequence=" << sequence
                                       << " candles=" << slice.size() << " bytes=" << content.size()
                                       << " trigger=" << trigger << " path=" << relative.generic_string());
}

void SegmentLogWriter::hydrateFromDisk() {
    if (options_.mode != common::PersistenceMode::Local) {
        return;
    }

    std::lock_guard<std::mutex> flushLock(flushMutex_);

    const auto path = manifestPath(options_.localRoot, options_.streamId);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_DEBUG("no manifest at " << path.string() << ", starting fresh");
        return;
    }

    const auto text = readFile(path);
    if (!text) {
        LOG_WARN("manifest unreadable, starting fresh path=" << path.string());
        resetState_(clock_());
        return;
    }

    domain::Manifest restored;
    try {
        restored = parseManifest(*text);
    } catch (const PersistenceError& ex) {
        LOG_WARN("manifest corrupt, starting fresh path=" << path.string() << " error=" << ex.what());
        resetState_(clock_());
        return;
    }

    if (restored.streamId != options_.streamId) {
        LOG_WARN("manifest stream mismatch, starting fresh expected=" << options_.streamId
                                                                      << " found=" << restored.streamId);
        resetState_(clock_());
        return;
    }

    std::optional<std::string> latest;
    if (restored.latestSegmentPath) {
        const std::filesystem::path relative(*restored.latestSegmentPath);
        if (!isSafeRelative(relative)) {
            LOG_WARN("manifest latestSegmentPath rejected path=" << *restored.latestSegmentPath);
        } else {
            latest = readFile(options_.localRoot / relative);
            if (!latest) {
                LOG_WARN("latest segment missing, cache left empty path=" << *restored.latestSegmentPath);
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        manifest_ = restored;
        sequence_ = restored.sequence;
        latestSegment_ = std::move(latest);
    }
    metrics::Registry::instance().setGauge(metricKey_("sequence"), static_cast<double>(restored.sequence));

    LOG_INFO("hydrated stream=" << restored.streamId << " sequence=" << restored.sequence
                                << " latest=" << restored.latestSegmentPath.value_or("none"));
}

domain::Manifest SegmentLogWriter::manifestSnapshot() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return manifest_;
}

std::optional<std::string> SegmentLogWriter::latestSegment() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return latestSegment_;
}

std::uint32_t SegmentLogWriter::sequence() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return sequence_;
}

std::size_t SegmentLogWriter::pendingCandles() const {
    std::lock_guard<std::mutex> lock(bufferMutex_);
    return pending_.size();
}

}  // namespace pulse::storage
