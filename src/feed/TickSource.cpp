#include "feed/TickSource.hpp"

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "feed/ReplayTickSource.hpp"
#include "feed/SyntheticTickSource.hpp"

namespace pulse::feed {

std::int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::unique_ptr<TickSource> makeTickSource(const TickSourceOptions& options) {
    if (options.mode == common::TickSourceMode::Replay) {
        if (options.replayPath.empty()) {
            throw ConfigError("replay tick source requires a path");
        }
        ReplayTickSource::Options replay;
        replay.path = options.replayPath;
        replay.intervalMs = options.intervalMs;
        replay.initialTimestampMs = options.startTimestampMs;
        return std::make_unique<ReplayTickSource>(replay);
    }

    SyntheticTickSource::Options synthetic;
    synthetic.intervalMs = options.intervalMs;
    synthetic.seed = options.seed.value_or(static_cast<std::uint32_t>(wallClockMs()));
    synthetic.startTimestampMs = options.startTimestampMs.value_or(wallClockMs());
    LOG_INFO("SyntheticTickSource: seed=" << synthetic.seed << " interval_ms=" << synthetic.intervalMs);
    return std::make_unique<SyntheticTickSource>(synthetic);
}

}  // namespace pulse::feed
