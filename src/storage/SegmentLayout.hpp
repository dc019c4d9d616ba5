#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace pulse::storage {

// <streamId>/<YYYYMMDD>/<HH>/<seq6>.log, date and hour in UTC of timestampMs.
std::filesystem::path segmentRelativePath(const std::string& streamId,
                                          std::int64_t timestampMs,
                                          std::uint32_t sequence);

std::filesystem::path segmentPath(const std::filesystem::path& root,
                                  const std::string& streamId,
                                  std::int64_t timestampMs,
                                  std::uint32_t sequence);

std::filesystem::path latestPath(const std::filesystem::path& root, const std::string& streamId);

std::filesystem::path manifestPath(const std::filesystem::path& root, const std::string& streamId);

}  // namespace pulse::storage
