#pragma once

#include <stdexcept>
#include <string>

namespace pulse {

// Malformed or empty encode/decode input. Fatal to the call only.
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message) : std::runtime_error("codec: " + message) {}
};

// I/O failure while writing or reading persisted segment state.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error("persistence: " + message) {}
};

// Invalid or missing startup settings. The process does not start.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace pulse
