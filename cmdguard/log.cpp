#include "log.hpp"

#include <optional>
#include <string_view>

namespace cmdguard {

auto to_string(LogLevel const level) -> std::string_view
{
    switch (level)
    {
    case LogLevel::Error: return "error";
    case LogLevel::Warn: return "warn";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
    }
    return "log";
}

auto parse_log_level(std::string_view const name) -> std::optional<LogLevel>
{
    if ("error" == name) return LogLevel::Error;
    if ("warn" == name) return LogLevel::Warn;
    if ("info" == name) return LogLevel::Info;
    if ("debug" == name) return LogLevel::Debug;
    return std::nullopt;
}

} // namespace cmdguard
