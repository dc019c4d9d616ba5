#include "storage/ManifestJson.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

#include "common/Errors.hpp"

namespace pulse::storage {

namespace {

std::int64_t readInteger(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr) {
        throw PersistenceError(std::string("manifest missing field ") + key);
    }
    if (value->is_int64()) {
        return value->as_int64();
    }
    if (value->is_uint64()) {
        const auto raw = value->as_uint64();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw PersistenceError(std::string("manifest field out of range: ") + key);
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value->is_double()) {
        const double raw = value->as_double();
        if (std::isfinite(raw) && std::floor(raw) == raw) {
            return static_cast<std::int64_t>(raw);
        }
    }
    throw PersistenceError(std::string("manifest field is not an integer: ") + key);
}

std::uint32_t readUnsigned32(const boost::json::object& object, const char* key) {
    const auto value = readInteger(object, key);
    if (value < 0 || value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        throw PersistenceError(std::string("manifest field out of range: ") + key);
    }
    return static_cast<std::uint32_t>(value);
}

}  // namespace

std::string serializeCandleLine(const domain::Candle& candle) {
    boost::json::object line;
    line["timestampMs"] = candle.timestampMs;
    line["open"] = candle.open;
    line["high"] = candle.high;
    line["low"] = candle.low;
    line["close"] = candle.close;
    line["volume"] = candle.volume;
    return boost::json::serialize(line);
}

std::string serializeManifest(const domain::Manifest& manifest) {
    boost::json::object object;
    object["streamId"] = manifest.streamId;
    if (manifest.latestSegmentPath) {
        object["latestSegmentPath"] = *manifest.latestSegmentPath;
    } else {
        object["latestSegmentPath"] = nullptr;
    }
    object["sequence"] = manifest.sequence;
    object["intervalMs"] = manifest.intervalMs;
    object["updatedAtMs"] = manifest.updatedAtMs;
    return boost::json::serialize(object);
}

domain::Manifest parseManifest(std::string_view text) {
    boost::json::error_code ec;
    const auto value = boost::json::parse(boost::json::string_view(text.data(), text.size()), ec);
    if (ec) {
        throw PersistenceError("manifest is not valid JSON: " + ec.message());
    }
    if (!value.is_object()) {
        throw PersistenceError("manifest is not a JSON object");
    }
    const auto& object = value.as_object();

    domain::Manifest manifest;

    const auto* streamId = object.if_contains("streamId");
    if (streamId == nullptr || !streamId->is_string() || streamId->as_string().empty()) {
        throw PersistenceError("manifest missing streamId");
    }
    manifest.streamId = std::string(streamId->as_string().data(), streamId->as_string().size());

    const auto* latest = object.if_contains("latestSegmentPath");
    if (latest != nullptr && !latest->is_null()) {
        if (!latest->is_string()) {
            throw PersistenceError("manifest latestSegmentPath is not a string");
        }
        manifest.latestSegmentPath = std::string(latest->as_string().data(), latest->as_string().size());
    }

    manifest.sequence = readUnsigned32(object, "sequence");
    manifest.intervalMs = readUnsigned32(object, "intervalMs");
    manifest.updatedAtMs = readInteger(object, "updatedAtMs");
    return manifest;
}

}  // namespace pulse::storage
