#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace pulse::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace pulse::log

#define PULSE_LOG_IMPL(level, expr)                                                        \
    do {                                                                                   \
        if (::pulse::log::shouldLog(level)) {                                              \
            std::ostringstream pulse_log_stream__;                                         \
            pulse_log_stream__ << expr;                                                    \
            ::pulse::log::log(level, pulse_log_stream__.str());                            \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) PULSE_LOG_IMPL(::pulse::log::Level::Debug, expr)
#define LOG_INFO(expr) PULSE_LOG_IMPL(::pulse::log::Level::Info, expr)
#define LOG_WARN(expr) PULSE_LOG_IMPL(::pulse::log::Level::Warn, expr)
#define LOG_ERR(expr) PULSE_LOG_IMPL(::pulse::log::Level::Error, expr)
