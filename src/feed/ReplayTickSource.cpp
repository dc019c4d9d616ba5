#include "feed/ReplayTickSource.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace pulse::feed {
namespace {

std::string trim(const std::string& input) {
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return input.substr(start, end - start);
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) {
        fields.push_back(trim(item));
    }
    return fields;
}

std::optional<std::int64_t> parseTimestamp(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* endPtr = nullptr;
    const double parsed = std::strtod(text.c_str(), &endPtr);
    if (endPtr == text.c_str() || *endPtr != '\0' || errno == ERANGE || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(std::llround(parsed));
}

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* endPtr = nullptr;
    const double parsed = std::strtod(text.c_str(), &endPtr);
    if (endPtr == text.c_str() || *endPtr != '\0' || errno == ERANGE || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

ReplayTickSource::ReplayTickSource(const Options& options)
    : options_(options),
      input_(options.path),
      lastTimestampMs_(options.initialTimestampMs.value_or(wallClockMs())) {
    if (!input_.is_open()) {
        throw ConfigError("cannot open replay file: " + options.path);
    }
    LOG_INFO("ReplayTickSource: opened path=" << options_.path << " interval_ms=" << options_.intervalMs);
}

std::optional<domain::Candle> ReplayTickSource::next() {
    std::string line;
    while (std::getline(input_, line)) {
        ++linesRead_;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }
        if (auto candle = parseLine_(line)) {
            lastTimestampMs_ = candle->timestampMs;
            return candle;
        }
        ++linesSkipped_;
    }

    LOG_INFO("ReplayTickSource: exhausted path=" << options_.path << " lines=" << linesRead_
                                                 << " skipped=" << linesSkipped_);
    return std::nullopt;
}

std::chrono::milliseconds ReplayTickSource::pacing() const noexcept {
    return std::chrono::milliseconds(options_.intervalMs);
}

std::optional<domain::Candle> ReplayTickSource::parseLine_(const std::string& line) {
    const auto fields = splitFields(line);
    if (fields.size() < 6U) {
        LOG_WARN("ReplayTickSource: skipping line=" << linesRead_ << " reason=field_count fields=" << fields.size());
        return std::nullopt;
    }

    const auto open = parseNumber(fields[1]);
    const auto high = parseNumber(fields[2]);
    const auto low = parseNumber(fields[3]);
    const auto close = parseNumber(fields[4]);
    const auto volume = parseNumber(fields[5]);
    if (!open || !high || !low || !close || !volume) {
        LOG_WARN("ReplayTickSource: skipping line=" << linesRead_ << " reason=unparsable_values");
        return std::nullopt;
    }

    domain::Candle candle;
    candle.timestampMs = parseTimestamp(fields[0]).value_or(lastTimestampMs_ + options_.intervalMs);
    candle.open = *open;
    candle.high = *high;
    candle.low = *low;
    candle.close = *close;
    candle.volume = *volume;
    return candle;
}

}  // namespace pulse::feed
