#include "configuration.hpp"

#include <charconv> // from_chars
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <unistd.h>

[[noreturn]] static void usage(void)
{
    std::cerr <<
    "usage: cmdguard\n"
    "         [-c settings.toml]\n"
    "         [-t timeout_ms]\n"
    "         [-r max_retries]\n"
    "         [-d working_directory]\n"
    "         [-e KEY=VALUE]...\n"
    "         [-i input_file|-]\n"
    "         [-v]\n"
    "         [-h]\n"
    "         [--] program [arguments...]\n";
    exit(EXIT_FAILURE);
}

template <typename T>
static bool parse_number(char const* const str, T& out)
{
    auto const end = str + strlen(str);
    auto const [ptr, ec] = std::from_chars(str, end, out);
    return ec == std::errc{} && ptr == end;
}

configuration load_configuration(int argc, char** argv)
{
    configuration cfg {};

    bool show_usage = false;

    // leading + stops at the first non-option so the program's own flags pass through
    char const* const flags = "+:c:d:e:hi:r:t:v";
    int opt;
    while ((opt = getopt(argc, argv, flags)) != -1) {
        switch (opt) {
        default: abort();
        case '?': std::cerr << "Unknown flag: " << char(optopt) << std::endl; usage();
        case ':': std::cerr << "Missing flag argument: " << char(optopt) << std::endl; usage();
        case 'h': usage();
        case 'c': cfg.settings_file     = optarg; break;
        case 'd': cfg.working_directory = optarg; break;
        case 'i': cfg.input_file        = optarg; break;
        case 'v': cfg.verbose           = true; break;
        case 'e': {
            std::string_view const binding {optarg};
            auto const eq = binding.find('=');
            if (eq == std::string_view::npos || eq == 0) {
                std::cerr << "Environment override must be KEY=VALUE (-e).\n";
                show_usage = true;
            } else {
                cfg.environment.insert_or_assign(std::string{binding.substr(0, eq)}, std::string{binding.substr(eq + 1)});
            }
            break;
        }
        case 'r': {
            int retries;
            if (parse_number(optarg, retries)) {
                cfg.max_retries = retries;
            } else {
                std::cerr << "Max retries must be an integer (-r).\n";
                show_usage = true;
            }
            break;
        }
        case 't': {
            long long ms;
            if (parse_number(optarg, ms) && ms > 0) {
                cfg.timeout = std::chrono::milliseconds{ms};
            } else {
                std::cerr << "Timeout must be a positive number of milliseconds (-t).\n";
                show_usage = true;
            }
            break;
        }
        }
    }

    argv += optind;
    argc -= optind;

    if (0 == argc) {
        std::cerr << "Program to run is required.\n";
        show_usage = true;
    } else {
        cfg.program = argv[0];
        cfg.arguments.assign(argv + 1, argv + argc);
    }

    if (show_usage) {
        usage();
    }

    return cfg;
}

auto settings_path(configuration const& cfg) -> std::optional<std::string>
{
    if (cfg.settings_file) {
        return cfg.settings_file;
    }

    std::filesystem::path base;
    if (auto const xdg = getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (auto const home = getenv("HOME"); home && *home) {
        base = std::filesystem::path{home} / ".config";
    } else {
        return std::nullopt;
    }

    auto const path = base / "cmdguard" / "settings.toml";
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
        return path.string();
    }
    return std::nullopt;
}
