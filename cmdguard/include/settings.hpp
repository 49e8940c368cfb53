#pragma once
/**
 * @file settings.hpp
 * @brief Execution, retry and logging configuration
 *
 * Settings are plain values read when a call starts. Changing them
 * between calls affects the next call only.
 *
 * ## TOML layout
 *
 * ```toml
 * [execution]
 * timeout_ms = 30000
 * kill_grace_ms = 5000
 *
 * [retry]
 * max_retries = 3
 * delay_ms = 1000
 * max_total_ms = 300000
 * retryable_patterns = ["network", "connection"]
 *
 * [circuit_breaker]
 * threshold = 5
 * cooldown_ms = 60000
 *
 * [logging]
 * enabled = false
 * level = "error"
 * ```
 */

#include "classify.hpp"
#include "log.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

struct Settings
{
    /// Applied when a Command carries no timeout of its own.
    std::chrono::milliseconds timeout {30'000};

    /// Delay between the termination request and the forced kill.
    std::chrono::milliseconds kill_grace {5'000};

    /// Upper bound on spawn attempts per retried call.
    int max_retries {3};

    /// Base of the exponential backoff: delay, 2*delay, 4*delay...
    std::chrono::milliseconds retry_delay {1'000};

    /// Upper bound on total backoff sleep per retried call.
    std::chrono::milliseconds max_total_retry_time {300'000};

    int circuit_threshold {5};
    std::chrono::milliseconds circuit_cooldown {60'000};

    RetryClassifier retryable;

    bool logging_enabled {false};
    LogLevel log_level {LogLevel::Error};
};

/**
 * @brief Clamp out-of-range values into their supported ranges.
 *
 * @param settings settings to adjust in place
 * @return one message per adjusted value
 */
auto validate_settings(Settings& settings) -> std::vector<std::string>;

/**
 * @brief Parse TOML settings text over the defaults.
 *
 * Missing keys keep their default values. Out-of-range values are clamped
 * and reported through warnings.
 *
 * @param source TOML document
 * @param name document name used in error messages
 * @param warnings receives validation messages
 * @return parsed settings
 * @throws std::runtime_error on syntax errors, wrong value types or bad patterns
 */
auto parse_settings(std::string_view source, std::string_view name, std::vector<std::string>& warnings) -> Settings;

/**
 * @brief Load TOML settings from a file.
 *
 * @param path file to read
 * @param warnings receives validation messages
 * @return parsed settings
 * @throws std::runtime_error when the file cannot be read or parsed
 */
auto load_settings(std::string const& path, std::vector<std::string>& warnings) -> Settings;

/// Applies the logging fields of settings to a logger.
auto configure_logger(Logger& log, Settings const& settings) -> void;

} // namespace cmdguard
