#pragma once
/**
 * @file command.hpp
 * @brief Request and result types of a supervised command execution
 *
 */

#include "exec_error.hpp"

#include <boost/system/error_code.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cmdguard {

/// @brief One invocation of an external program.
struct Command
{
    /// Executable name or path. Names without a directory are found on PATH.
    std::string program;

    /// Arguments, sanitized before they reach the process.
    std::vector<std::string> arguments;

    /// Bytes written to the process's stdin before it is closed.
    std::optional<std::string> input;

    /// Overrides the configured timeout for this command.
    std::optional<std::chrono::milliseconds> timeout;

    std::optional<std::string> working_directory;

    /// Variables overlaid on the inherited environment.
    std::map<std::string, std::string> environment;
};

/// @brief Terminal result of one attempt or of a whole retried call.
///
/// Exactly one of output and error is meaningful, selected by succeeded.
struct Outcome
{
    bool succeeded = false;

    /// Trimmed standard output of a successful process.
    std::string output;

    /// Human-readable failure description.
    std::string error;

    /// Process exit code, or -1 when the process never exited normally.
    int exit_code = -1;

    /// Failure classification; empty on success.
    boost::system::error_code reason;

    static auto success(std::string output, int exit_code = 0) -> Outcome
    {
        return Outcome{
            .succeeded = true,
            .output = std::move(output),
            .error = {},
            .exit_code = exit_code,
            .reason = {},
        };
    }

    static auto failure(ExecErrc reason, std::string error, int exit_code = -1) -> Outcome
    {
        return Outcome{
            .succeeded = false,
            .output = {},
            .error = std::move(error),
            .exit_code = exit_code,
            .reason = make_error_code(reason),
        };
    }
};

/// Completion signature of command execution operations.
using ExecSig = void(Outcome);

} // namespace cmdguard
