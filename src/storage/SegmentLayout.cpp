#include "storage/SegmentLayout.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace pulse::storage {

namespace {

std::tm utcCalendar(std::int64_t timestampMs) {
    std::int64_t seconds = timestampMs / 1000;
    if (timestampMs % 1000 < 0) {
        --seconds;
    }
    const auto raw = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&raw, &tm);
    return tm;
}

}  // namespace

std::filesystem::path segmentRelativePath(const std::string& streamId,
                                          std::int64_t timestampMs,
                                          std::uint32_t sequence) {
    const auto tm = utcCalendar(timestampMs);

    std::ostringstream date;
    date << std::setfill('0') << std::setw(4) << (tm.tm_year + 1900) << std::setw(2) << (tm.tm_mon + 1)
         << std::setw(2) << tm.tm_mday;

    std::ostringstream hour;
    hour << std::setfill('0') << std::setw(2) << tm.tm_hour;

    std::ostringstream file;
    file << std::setfill('0') << std::setw(6) << sequence << ".log";

    return std::filesystem::path(streamId) / date.str() / hour.str() / file.str();
}

std::filesystem::path segmentPath(const std::filesystem::path& root,
                                  const std::string& streamId,
                                  std::int64_t timestampMs,
                                  std::uint32_t sequence) {
    return root / segmentRelativePath(streamId, timestampMs, sequence);
}

std::filesystem::path latestPath(const std::filesystem::path& root, const std::string& streamId) {
    return root / streamId / "latest.log";
}

std::filesystem::path manifestPath(const std::filesystem::path& root, const std::string& streamId) {
    return root / streamId / "manifest.json";
}

}  // namespace pulse::storage
