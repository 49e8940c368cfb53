#include "settings.hpp"

#include <toml.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cmdguard {

namespace {

using std::chrono::milliseconds;

/// Lookup of [section] key in a parsed document, with type errors reported by name.
class Document
{
    toml::value const& root_;
    std::string_view name_;

public:
    Document(toml::value const& root, std::string_view const name)
        : root_{root}
        , name_{name}
    {
    }

    [[noreturn]] auto type_error(char const* const section, char const* const key, char const* const expected) const -> void
    {
        std::ostringstream msg;
        msg << name_ << ": " << section;
        if (key) msg << "." << key;
        msg << " must be " << expected;
        throw std::runtime_error{msg.str()};
    }

    auto find(char const* const section, char const* const key) const -> toml::value const*
    {
        if (not root_.contains(section))
        {
            return nullptr;
        }

        auto const& table = root_.at(section);
        if (not table.is_table())
        {
            type_error(section, nullptr, "a table");
        }

        if (not table.contains(key))
        {
            return nullptr;
        }

        return &table.at(key);
    }

    auto integer(char const* const section, char const* const key, std::int64_t& out) const -> void
    {
        if (auto const v = find(section, key))
        {
            if (not v->is_integer()) type_error(section, key, "an integer");
            out = v->as_integer();
        }
    }

    auto duration(char const* const section, char const* const key, milliseconds& out) const -> void
    {
        auto count = std::int64_t{out.count()};
        integer(section, key, count);
        out = milliseconds{count};
    }

    auto count(char const* const section, char const* const key, int& out) const -> void
    {
        auto value = std::int64_t{out};
        integer(section, key, value);
        out = static_cast<int>(std::clamp<std::int64_t>(value, INT32_MIN, INT32_MAX));
    }

    auto boolean(char const* const section, char const* const key, bool& out) const -> void
    {
        if (auto const v = find(section, key))
        {
            if (not v->is_boolean()) type_error(section, key, "a boolean");
            out = v->as_boolean();
        }
    }

    auto string(char const* const section, char const* const key, std::string& out) const -> bool
    {
        if (auto const v = find(section, key))
        {
            if (not v->is_string()) type_error(section, key, "a string");
            out = v->as_string();
            return true;
        }
        return false;
    }

    auto strings(char const* const section, char const* const key, std::vector<std::string>& out) const -> bool
    {
        if (auto const v = find(section, key))
        {
            if (not v->is_array()) type_error(section, key, "an array of strings");
            std::vector<std::string> result;
            for (auto const& element : v->as_array())
            {
                if (not element.is_string()) type_error(section, key, "an array of strings");
                result.push_back(element.as_string());
            }
            out = std::move(result);
            return true;
        }
        return false;
    }
};

template <typename T>
auto clamp_setting(
    std::vector<std::string>& warnings,
    char const* const name,
    T& value,
    T const low,
    T const high
) -> void
{
    auto const clamped = std::clamp(value, low, high);
    if (clamped != value)
    {
        std::ostringstream msg;
        msg << name << " must be between " << low << " and " << high << ", using " << clamped;
        warnings.push_back(msg.str());
        value = clamped;
    }
}

auto clamp_duration(
    std::vector<std::string>& warnings,
    char const* const name,
    milliseconds& value,
    std::int64_t const low,
    std::int64_t const high
) -> void
{
    auto count = std::int64_t{value.count()};
    clamp_setting(warnings, name, count, low, high);
    value = milliseconds{count};
}

} // namespace

auto validate_settings(Settings& settings) -> std::vector<std::string>
{
    std::vector<std::string> warnings;
    clamp_duration(warnings, "execution.timeout_ms", settings.timeout, 5'000, 600'000);
    clamp_duration(warnings, "execution.kill_grace_ms", settings.kill_grace, 0, 60'000);
    clamp_setting(warnings, "retry.max_retries", settings.max_retries, 1, 10);
    clamp_duration(warnings, "retry.delay_ms", settings.retry_delay, 100, 30'000);
    clamp_duration(warnings, "retry.max_total_ms", settings.max_total_retry_time, 0, 3'600'000);
    clamp_setting(warnings, "circuit_breaker.threshold", settings.circuit_threshold, 1, 1'000);
    clamp_duration(warnings, "circuit_breaker.cooldown_ms", settings.circuit_cooldown, 0, 3'600'000);
    return warnings;
}

auto parse_settings(
    std::string_view const source,
    std::string_view const name,
    std::vector<std::string>& warnings
) -> Settings
{
    toml::value root;
    try
    {
        root = toml::parse_str(std::string{source}, toml::spec::v(1, 1, 0));
    }
    catch (toml::exception const& err)
    {
        throw std::runtime_error{std::string{name} + ": " + err.what()};
    }

    Document const doc{root, name};
    Settings settings;

    doc.duration("execution", "timeout_ms", settings.timeout);
    doc.duration("execution", "kill_grace_ms", settings.kill_grace);

    doc.count("retry", "max_retries", settings.max_retries);
    doc.duration("retry", "delay_ms", settings.retry_delay);
    doc.duration("retry", "max_total_ms", settings.max_total_retry_time);

    if (std::vector<std::string> patterns; doc.strings("retry", "retryable_patterns", patterns))
    {
        try
        {
            settings.retryable = RetryClassifier{std::move(patterns)};
        }
        catch (std::regex_error const& err)
        {
            throw std::runtime_error{std::string{name} + ": retry.retryable_patterns: " + err.what()};
        }
    }

    doc.count("circuit_breaker", "threshold", settings.circuit_threshold);
    doc.duration("circuit_breaker", "cooldown_ms", settings.circuit_cooldown);

    doc.boolean("logging", "enabled", settings.logging_enabled);
    if (std::string level; doc.string("logging", "level", level))
    {
        if (auto const parsed = parse_log_level(level))
        {
            settings.log_level = *parsed;
        }
        else
        {
            warnings.push_back("logging.level must be one of error, warn, info, debug, using error");
            settings.log_level = LogLevel::Error;
        }
    }

    auto clamped = validate_settings(settings);
    warnings.insert(warnings.end(), clamped.begin(), clamped.end());

    return settings;
}

auto load_settings(std::string const& path, std::vector<std::string>& warnings) -> Settings
{
    std::ifstream file{path};
    if (not file)
    {
        throw std::runtime_error{path + ": unable to open settings file"};
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_settings(contents.str(), path, warnings);
}

auto configure_logger(Logger& log, Settings const& settings) -> void
{
    log.configure(settings.logging_enabled, settings.log_level);
}

} // namespace cmdguard
