#include "executor.hpp"

#include "exec_error.hpp"
#include "sanitize.hpp"

#include <boost/asio.hpp>
#include <boost/asio/append.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <sys/wait.h>

namespace cmdguard {

namespace {

namespace process = boost::process::v2;

auto trim(std::string_view const text) -> std::string
{
    auto const spaces = " \t\n\v\f\r";
    auto const first = text.find_first_not_of(spaces);
    if (first == std::string_view::npos)
    {
        return {};
    }
    auto const last = text.find_last_not_of(spaces);
    return std::string{text.substr(first, last - first + 1)};
}

/// Inherited environment overlaid with the caller's overrides, as KEY=VALUE strings.
auto merged_environment(std::map<std::string, std::string> const& overrides) -> std::vector<std::string>
{
    std::map<std::string, std::string> env;
    for (auto const& entry : process::environment::current())
    {
        env.emplace(entry.key().string(), entry.value().string());
    }

    for (auto const& [key, value] : overrides)
    {
        env.insert_or_assign(key, value);
    }

    std::vector<std::string> result;
    result.reserve(env.size());
    for (auto const& [key, value] : env)
    {
        result.push_back(key + "=" + value);
    }
    return result;
}

/// Writes to a child that closed its stdin must fail with EPIPE instead of
/// raising SIGPIPE in this process.
auto ignore_sigpipe() -> void
{
    [[maybe_unused]] static auto const previous = ::signal(SIGPIPE, SIG_IGN);
}

auto command_line(std::string_view const program, std::vector<std::string> const& args) -> std::string
{
    std::ostringstream out;
    out << program;
    for (auto const& arg : args)
    {
        out << ' ' << arg;
    }
    return out.str();
}

/// State of one attempt. Shared by every outstanding operation of the attempt.
struct Exec : std::enable_shared_from_this<Exec>
{
    using executor_type = boost::asio::strand<boost::asio::any_io_executor>;

    boost::asio::any_completion_handler<ExecSig> handler_;
    boost::asio::cancellation_slot slot_;
    Logger& log_;

    std::string program_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds kill_grace_;

    executor_type executor_;
    boost::asio::writable_pipe stdin_;
    boost::asio::readable_pipe stdout_;
    boost::asio::readable_pipe stderr_;
    process::process proc_;
    boost::asio::steady_timer deadline_;
    boost::asio::steady_timer grace_;

    /// Outstanding parts of a natural exit: process wait, stdout EOF, stderr EOF.
    int stage_;

    bool spawned_;
    bool exited_;
    int exit_code_;
    /// Signal that ended the process, 0 after a normal exit.
    int term_signal_;
    boost::system::error_code wait_error_;

    std::optional<std::string> stdin_text_;
    std::string stdout_text_;
    std::string stderr_text_;

    /// Set by whichever event decides the outcome first.
    std::atomic<bool> resolved_;

    Exec(
        boost::asio::any_io_executor const& executor,
        boost::asio::any_completion_handler<ExecSig> handler,
        Logger& log,
        std::string program,
        std::chrono::milliseconds const timeout,
        std::chrono::milliseconds const kill_grace,
        std::optional<std::string> input
    )
        : handler_{std::move(handler)}
        , slot_{boost::asio::get_associated_cancellation_slot(handler_)}
        , log_{log}
        , program_{std::move(program)}
        , timeout_{timeout}
        , kill_grace_{kill_grace}
        , executor_{boost::asio::make_strand(executor)}
        , stdin_{executor_}
        , stdout_{executor_}
        , stderr_{executor_}
        , proc_{executor_}
        , deadline_{executor_}
        , grace_{executor_}
        , stage_{3}
        , spawned_{false}
        , exited_{false}
        , exit_code_{-1}
        , term_signal_{0}
        , stdin_text_{std::move(input)}
        , resolved_{false}
    {
    }

    auto start(Command const& command) -> void
    {
        auto const args = sanitize_arguments(command.arguments);
        log_.debug("execute", command_line(program_, args));

        try
        {
            spawn(command, args);
        }
        catch (boost::system::system_error const& err)
        {
            return resolve(spawn_failure(err.code().message()));
        }
        catch (std::exception const& err)
        {
            return resolve(spawn_failure(err.what()));
        }

        spawned_ = true;
        auto const self = shared_from_this();

        if (slot_.is_connected())
        {
            // Resolution clears the slot, which must not happen inside its own handler.
            slot_.assign([self](boost::asio::cancellation_type) {
                boost::asio::post(self->executor_, [self]() {
                    self->resolve(Outcome::failure(ExecErrc::Cancelled, "Command was aborted"));
                });
            });
        }

        if (stdin_text_)
        {
            boost::asio::async_write(
                stdin_,
                boost::asio::buffer(*stdin_text_),
                [self](boost::system::error_code const err, std::size_t) {
                    if (err)
                    {
                        self->log_.warn("execute", "writing stdin of ", self->program_, ": ", err.message());
                    }
                    boost::system::error_code ignored;
                    self->stdin_.close(ignored);
                }
            );
        }
        else
        {
            boost::system::error_code ignored;
            stdin_.close(ignored);
        }

        boost::asio::async_read(
            stdout_,
            boost::asio::dynamic_buffer(stdout_text_),
            [self](boost::system::error_code, std::size_t) {
                self->complete();
            }
        );

        boost::asio::async_read(
            stderr_,
            boost::asio::dynamic_buffer(stderr_text_),
            [self](boost::system::error_code, std::size_t) {
                self->complete();
            }
        );

        proc_.async_wait(
            [self](boost::system::error_code const err, int const exit_code) {
                self->exited_ = true;
                self->grace_.cancel();
                self->wait_error_ = err;
                auto const status = self->proc_.native_exit_code();
                if (not err && WIFSIGNALED(status))
                {
                    self->term_signal_ = WTERMSIG(status);
                }
                else
                {
                    self->exit_code_ = exit_code;
                }
                self->complete();
            }
        );

        deadline_.expires_after(timeout_);
        deadline_.async_wait(
            [self](boost::system::error_code const err) {
                if (not err)
                {
                    self->resolve(Outcome::failure(
                        ExecErrc::Timeout,
                        "Command timed out after " + std::to_string(self->timeout_.count()) + "ms"
                    ));
                }
            }
        );
    }

    auto spawn(Command const& command, std::vector<std::string> const& args) -> void
    {
        auto file = process::filesystem::path{command.program};
        if (not file.has_parent_path())
        {
            file = process::environment::find_executable(file);
            if (file.empty())
            {
                throw boost::system::system_error{
                    boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory)};
            }
        }

        auto const env = merged_environment(command.environment);

        auto const launch = [&](auto&&... inits) {
            return process::process{
                executor_,
                file,
                args,
                process::process_stdio{
                    .in = {stdin_},
                    .out = {stdout_},
                    .err = {stderr_},
                },
                process::process_environment(env),
                std::forward<decltype(inits)>(inits)...
            };
        };

        proc_ = command.working_directory
            ? launch(process::process_start_dir{*command.working_directory})
            : launch();
    }

    auto spawn_failure(std::string_view const detail) const -> Outcome
    {
        std::string message = "Failed to execute command: ";
        message += program_;
        message += ": ";
        message += detail;
        return Outcome::failure(ExecErrc::SpawnFailed, std::move(message));
    }

    auto complete() -> void
    {
        if (--stage_ == 0)
        {
            resolve(exit_outcome());
        }
    }

    auto exit_outcome() const -> Outcome
    {
        if (wait_error_)
        {
            return spawn_failure(wait_error_.message());
        }

        if (0 == term_signal_ && 0 == exit_code_)
        {
            return Outcome::success(trim(stdout_text_), exit_code_);
        }

        auto message = trim(stderr_text_);
        if (message.empty())
        {
            message = trim(stdout_text_);
        }
        if (message.empty())
        {
            message = 0 == term_signal_
                ? "Process exited with code " + std::to_string(exit_code_)
                : "Process terminated by signal " + std::to_string(term_signal_);
        }
        return Outcome::failure(ExecErrc::ExitNonZero, std::move(message), exit_code_);
    }

    /// First caller wins; later calls are no-ops.
    auto resolve(Outcome outcome) -> void
    {
        if (resolved_.exchange(true))
        {
            return;
        }

        deadline_.cancel();
        if (slot_.is_connected())
        {
            slot_.clear();
        }

        shut_down();

        boost::asio::post(executor_, boost::asio::append(std::move(handler_), std::move(outcome)));
    }

    /// Ask a still-running process to exit and kill it after the grace window.
    auto shut_down() -> void
    {
        if (not spawned_ || exited_)
        {
            return;
        }

        boost::system::error_code err;
        proc_.request_exit(err);
        if (err)
        {
            log_.warn("execute", "requesting exit of ", program_, ": ", err.message());
        }

        grace_.expires_after(kill_grace_);
        grace_.async_wait(
            [self = shared_from_this()](boost::system::error_code const err) {
                if (err || self->exited_)
                {
                    return;
                }

                self->log_.warn("execute", self->program_, " still running after ", self->kill_grace_.count(), "ms, killing it");
                boost::system::error_code kill_err;
                self->proc_.terminate(kill_err);
                if (kill_err)
                {
                    self->log_.error("execute", "killing ", self->program_, ": ", kill_err.message());
                }
            }
        );
    }
};

} // namespace

auto CommandExecutor::initiate(boost::asio::any_completion_handler<ExecSig> handler, Command command) -> void
{
    ignore_sigpipe();

    // Settings are sampled once per attempt.
    auto const timeout = command.timeout.value_or(settings_.timeout);
    auto const self = std::make_shared<Exec>(
        executor_,
        std::move(handler),
        log_,
        command.program,
        timeout,
        settings_.kill_grace,
        std::move(command.input)
    );
    boost::asio::dispatch(self->executor_, [self, command = std::move(command)]() {
        self->start(command);
    });
}

} // namespace cmdguard
