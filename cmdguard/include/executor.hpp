#pragma once
/**
 * @file executor.hpp
 * @brief Supervised asynchronous execution of one external command
 *
 * Each call spawns one child process with piped stdio and races three
 * events against each other:
 *
 * - the process exiting (after both output streams reach EOF),
 * - the timeout expiring,
 * - the completion handler's cancellation slot firing.
 *
 * The first event decides the Outcome and later events are ignored. If
 * the process is still running at that point it is asked to exit and is
 * killed once the grace window passes. The completion handler does not
 * wait for that teardown.
 *
 * Spawn failures, including a program missing from PATH, complete with a
 * failed Outcome; the operation itself never fails.
 *
 * The first call sets SIGPIPE to SIG_IGN for the whole process so that
 * stdin writes to a child that stopped reading fail with EPIPE.
 */

#include "command.hpp"
#include "log.hpp"
#include "settings.hpp"

#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>

#include <utility>

namespace cmdguard {

class CommandExecutor
{
public:
    using executor_type = boost::asio::any_io_executor;

    /**
     * @param executor executor running the process I/O and timers
     * @param settings read at the start of every call
     * @param log diagnostics sink
     */
    CommandExecutor(executor_type executor, Settings const& settings, Logger& log)
        : executor_{std::move(executor)}
        , settings_{settings}
        , log_{log}
    {
    }

    auto get_executor() const -> executor_type const&
    {
        return executor_;
    }

    /**
     * @brief Run a command to completion.
     *
     * @param command command to run; arguments are sanitized first
     * @param token completion token for `void(Outcome)`
     * @return behavior determined by completion token type
     */
    template <boost::asio::completion_token_for<ExecSig> CompletionToken>
    auto async_execute(Command command, CompletionToken&& token)
    {
        return boost::asio::async_initiate<CompletionToken, ExecSig>(
            [this](boost::asio::any_completion_handler<ExecSig> handler, Command command) {
                initiate(std::move(handler), std::move(command));
            },
            token,
            std::move(command)
        );
    }

private:
    executor_type executor_;
    Settings const& settings_;
    Logger& log_;

    auto initiate(boost::asio::any_completion_handler<ExecSig> handler, Command command) -> void;
};

} // namespace cmdguard
