#include "configuration.hpp"

#include <command.hpp>
#include <executor.hpp>
#include <log.hpp>
#include <retry.hpp>
#include <settings.hpp>

#include <boost/asio.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

auto read_input(std::string const& file) -> std::string
{
    std::ostringstream contents;
    if ("-" == file)
    {
        contents << std::cin.rdbuf();
    }
    else
    {
        std::ifstream in{file, std::ios::binary};
        if (not in)
        {
            throw std::runtime_error{file + ": unable to open input file"};
        }
        contents << in.rdbuf();
    }
    return contents.str();
}

auto load(configuration const& cfg, cmdguard::Logger& log) -> cmdguard::Settings
{
    cmdguard::Settings settings;
    if (auto const path = settings_path(cfg))
    {
        std::vector<std::string> warnings;
        settings = cmdguard::load_settings(*path, warnings);
        for (auto const& warning : warnings)
        {
            log.warn("settings", warning);
        }
    }

    if (cfg.timeout)
    {
        settings.timeout = *cfg.timeout;
    }
    if (cfg.max_retries)
    {
        settings.max_retries = *cfg.max_retries;
    }
    for (auto const& warning : cmdguard::validate_settings(settings))
    {
        log.warn("settings", warning);
    }
    return settings;
}

} // namespace

auto main(int argc, char* argv[]) -> int
{
    auto const cfg = load_configuration(argc, argv);

    cmdguard::Logger log;
    cmdguard::Settings settings;
    cmdguard::Command command {
        .program = cfg.program,
        .arguments = cfg.arguments,
        .input = {},
        .timeout = {},
        .working_directory = cfg.working_directory,
        .environment = cfg.environment,
    };

    try
    {
        settings = load(cfg, log);
        if (cfg.input_file)
        {
            command.input = read_input(*cfg.input_file);
        }
    }
    catch (std::runtime_error const& err)
    {
        log.error("startup", err.what());
        return EXIT_FAILURE;
    }

    cmdguard::configure_logger(log, settings);
    if (cfg.verbose)
    {
        log.configure(true, cmdguard::LogLevel::Debug);
    }

    boost::asio::io_context io_context;
    boost::asio::signal_set signals{io_context, SIGINT, SIGTERM};
    boost::asio::cancellation_signal cancel;

    signals.async_wait([&cancel, &log](boost::system::error_code const err, int const signum) {
        if (not err)
        {
            log.info("signal", "received signal ", signum, ", aborting");
            cancel.emit(boost::asio::cancellation_type::terminal);
        }
    });

    cmdguard::CommandExecutor executor{io_context.get_executor(), settings, log};
    cmdguard::RetryCoordinator coordinator{executor, settings, log};

    int status = EXIT_FAILURE;

    boost::asio::co_spawn(
        io_context,
        coordinator.execute(std::move(command)),
        boost::asio::bind_cancellation_slot(
            cancel.slot(),
            [&status, &signals](std::exception_ptr const error, cmdguard::Outcome const outcome) {
                signals.cancel();
                if (error)
                {
                    std::rethrow_exception(error);
                }

                if (outcome.succeeded)
                {
                    if (not outcome.output.empty())
                    {
                        std::cout << outcome.output << std::endl;
                    }
                    status = EXIT_SUCCESS;
                }
                else
                {
                    std::cerr << outcome.error << std::endl;
                    status = outcome.exit_code > 0 ? outcome.exit_code : EXIT_FAILURE;
                }
            }
        )
    );

    io_context.run();
    return status;
}
