/**
 * @file configuration.hpp
 * @brief Command-line configuration of the cmdguard tool
 *
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct configuration
{
    /// -c: settings file, otherwise the per-user default when present
    std::optional<std::string> settings_file;
    /// -t: timeout override in milliseconds
    std::optional<std::chrono::milliseconds> timeout;
    /// -r: attempt limit override
    std::optional<int> max_retries;
    /// -d
    std::optional<std::string> working_directory;
    /// -e KEY=VALUE, repeatable
    std::map<std::string, std::string> environment;
    /// -i: stdin payload file, "-" for our own stdin
    std::optional<std::string> input_file;
    /// -v
    bool verbose;

    std::string program;
    std::vector<std::string> arguments;
};

/**
 * @brief Process command-line arguments.
 *
 * On error this function prints usage and terminates the process.
 *
 * @param argc Number of arguments
 * @param argv Pointer to arguments
 * @return configuration Populated configuration value.
 */
configuration load_configuration(int argc, char **argv);

/**
 * @brief Settings file to load, if any.
 *
 * Returns the -c path when given. Otherwise returns
 * $XDG_CONFIG_HOME/cmdguard/settings.toml or ~/.config/cmdguard/settings.toml
 * when that file exists.
 */
auto settings_path(configuration const& cfg) -> std::optional<std::string>;
