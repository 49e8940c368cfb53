#pragma once
/**
 * @file log.hpp
 * @brief Leveled diagnostics written to a stream (stderr by default)
 *
 */

#include <iostream>
#include <optional>
#include <ostream>
#include <string_view>

namespace cmdguard {

enum class LogLevel
{
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

auto to_string(LogLevel level) -> std::string_view;
auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/**
 * @brief Stream logger with a level threshold.
 *
 * Errors are always written. Other levels are written only once logging
 * is enabled and the message is at or above the threshold.
 */
class Logger
{
    std::ostream* out_;
    bool enabled_;
    LogLevel threshold_;

public:
    explicit Logger(std::ostream& out = std::cerr)
        : out_{&out}
        , enabled_{false}
        , threshold_{LogLevel::Error}
    {
    }

    auto configure(bool enabled, LogLevel threshold) -> void
    {
        enabled_ = enabled;
        threshold_ = threshold;
    }

    auto wants(LogLevel const level) const -> bool
    {
        return LogLevel::Error == level || (enabled_ && level <= threshold_);
    }

    /// Writes "<level> in <location>: <parts...>" followed by a newline.
    template <typename... Parts>
    auto log(LogLevel const level, std::string_view const location, Parts const&... parts) -> void
    {
        if (wants(level))
        {
            *out_ << to_string(level) << " in " << location << ": ";
            (*out_ << ... << parts) << std::endl;
        }
    }

    template <typename... Parts>
    auto error(std::string_view const location, Parts const&... parts) -> void
    {
        log(LogLevel::Error, location, parts...);
    }

    template <typename... Parts>
    auto warn(std::string_view const location, Parts const&... parts) -> void
    {
        log(LogLevel::Warn, location, parts...);
    }

    template <typename... Parts>
    auto info(std::string_view const location, Parts const&... parts) -> void
    {
        log(LogLevel::Info, location, parts...);
    }

    template <typename... Parts>
    auto debug(std::string_view const location, Parts const&... parts) -> void
    {
        log(LogLevel::Debug, location, parts...);
    }
};

} // namespace cmdguard
