#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <string>
#include <system_error>

#include "common/Errors.hpp"

namespace pulse::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint16_t parsePort(const std::string& value) {
    try {
        const auto portValue = std::stoul(value);
        if (portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw ConfigError("invalid port: " + value);
    }
}

std::size_t parsePositive(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || parsed == 0U) {
            throw std::out_of_range("value must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw ConfigError("invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    const auto parsed = parsePositive(value, label);
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw ConfigError("invalid value for " + label + ": " + value);
    }
    return static_cast<std::uint32_t>(parsed);
}

std::uint32_t parseSeed(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("seed out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw ConfigError("invalid seed: " + value);
    }
}

TickSourceMode parseTickSource(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "synthetic" || normalized == "random") {
        return TickSourceMode::Synthetic;
    }
    if (normalized == "replay" || normalized == "csv") {
        return TickSourceMode::Replay;
    }
    throw ConfigError("invalid tick source: " + value);
}

PersistenceMode parsePersistence(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "disabled" || normalized == "off" || normalized == "none") {
        return PersistenceMode::Disabled;
    }
    if (normalized == "local") {
        return PersistenceMode::Local;
    }
    throw ConfigError("invalid persistence mode: " + value);
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw ConfigError("invalid boolean: " + value);
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

// Command line wins over the environment; empty when neither is set.
std::string setting(int argc, char** argv, const std::string& flag, const char* envName) {
    if (auto fromArgs = valueFromArgs(argc, argv, flag); !fromArgs.empty()) {
        return fromArgs;
    }
    if (envName != nullptr) {
        if (const char* fromEnv = std::getenv(envName)) {
            return fromEnv;
        }
    }
    return {};
}

}  // namespace

const char* toString(TickSourceMode mode) noexcept {
    return mode == TickSourceMode::Replay ? "replay" : "synthetic";
}

const char* toString(PersistenceMode mode) noexcept {
    return mode == PersistenceMode::Local ? "local" : "disabled";
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto value = setting(argc, argv, "--stream-id", "STREAM_ID"); !value.empty()) {
        config.streamId = trim(value);
    }
    if (auto value = setting(argc, argv, "--interval-ms", "INTERVAL_MS"); !value.empty()) {
        config.intervalMs = parseDurationMs(value, "interval-ms");
    }
    if (auto value = setting(argc, argv, "--port", "PORT"); !value.empty()) {
        config.port = parsePort(value);
    }
    if (auto value = setting(argc, argv, "--threads", nullptr); !value.empty()) {
        config.threads = parsePositive(value, "threads");
    }
    if (auto value = setting(argc, argv, "--log-level", "LOG_LEVEL"); !value.empty()) {
        config.logLevel = pulse::log::levelFromString(toLower(value));
    }
    if (auto value = setting(argc, argv, "--tick-source", "TICK_SOURCE"); !value.empty()) {
        config.tickSource = parseTickSource(value);
    }
    if (auto value = setting(argc, argv, "--replay-path", "REPLAY_PATH"); !value.empty()) {
        config.replayPath = trim(value);
    }
    if (auto value = setting(argc, argv, "--seed", "SEED"); !value.empty()) {
        config.seed = parseSeed(trim(value));
    }
    if (auto value = setting(argc, argv, "--batch-size", "BATCH_SIZE"); !value.empty()) {
        config.batchSize = parsePositive(value, "batch-size");
    }
    if (auto value = setting(argc, argv, "--persistence", "PERSISTENCE_MODE"); !value.empty()) {
        config.persistenceMode = parsePersistence(value);
    }
    if (auto value = setting(argc, argv, "--local-root", "LOCAL_PERSIST_ROOT"); !value.empty()) {
        config.localRoot = trim(value);
    }
    if (auto value = setting(argc, argv, "--flush-interval-ms", "FLUSH_INTERVAL_MS"); !value.empty()) {
        config.flushIntervalMs = parseDurationMs(value, "flush-interval-ms");
    }
    if (auto value = setting(argc, argv, "--segment-target-bytes", "SEGMENT_TARGET_BYTES"); !value.empty()) {
        config.segmentTargetBytes = parsePositive(value, "segment-target-bytes");
    }
    if (auto value = setting(argc, argv, "--max-pending-candles", "MAX_PENDING_CANDLES"); !value.empty()) {
        config.maxPendingCandles = parsePositive(value, "max-pending-candles");
    }
    if (auto value = setting(argc, argv, "--http.cors.enable", nullptr); !value.empty()) {
        config.httpCorsEnable = parseBool(value);
    }
    if (auto value = setting(argc, argv, "--http.cors.origin", nullptr); !value.empty()) {
        config.httpCorsOrigin = trim(value);
    }

    if (config.streamId.empty()) {
        throw ConfigError("a stream id is required (--stream-id or STREAM_ID)");
    }
    if (config.streamId.find('/') != std::string::npos || config.streamId.find("..") != std::string::npos) {
        throw ConfigError("stream id must not contain path separators: " + config.streamId);
    }
    if (config.tickSource == TickSourceMode::Replay && config.replayPath.empty()) {
        throw ConfigError("replay tick source requires --replay-path");
    }
    if (config.batchSize > 65535U) {
        throw ConfigError("batch-size exceeds the 65535 candle limit of the wire format");
    }

    if (config.persistenceMode == PersistenceMode::Local) {
        if (config.localRoot.empty()) {
            throw ConfigError("local persistence requires a storage root");
        }
        std::error_code ec;
        std::filesystem::create_directories(config.localRoot, ec);
        if (ec) {
            throw ConfigError("could not create storage root (" + config.localRoot + "): " + ec.message());
        }
    }

    return config;
}

}  // namespace pulse::common
