#pragma once
/**
 * @file retry.hpp
 * @brief Retry with exponential backoff around a command runner
 *
 * A logical call makes at most Settings::max_retries attempts. After a
 * failure whose message matches Settings::retryable the coordinator sleeps
 * retry_delay, 2*retry_delay, 4*retry_delay... before the next attempt.
 * Non-retryable failures and successes end the call immediately.
 *
 * Cancellation arrives through the cancellation slot bound to the
 * co_spawn completion token. It aborts the running attempt, and during a
 * backoff sleep it ends the call with the last attempt's outcome.
 *
 * Consecutive calls that fail to spawn, time out, run out of retry budget
 * or end on a transient failure open a circuit breaker that rejects calls
 * without spawning until its cooldown passes.
 */

#include "circuit_breaker.hpp"
#include "command.hpp"
#include "exec_error.hpp"
#include "log.hpp"
#include "settings.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_state.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <chrono>
#include <concepts>
#include <exception>
#include <string>

namespace cmdguard {

/// Anything that runs a Command and completes with `void(Outcome)`.
template <typename T>
concept CommandRunner = requires(T& runner, Command command) {
    runner.async_execute(std::move(command), boost::asio::use_awaitable);
};

template <CommandRunner Runner>
class RetryCoordinator
{
    Runner& runner_;
    Settings const& settings_;
    Logger& log_;
    CircuitBreaker breaker_;

public:
    RetryCoordinator(Runner& runner, Settings const& settings, Logger& log)
        : runner_{runner}
        , settings_{settings}
        , log_{log}
        , breaker_{settings.circuit_threshold, settings.circuit_cooldown}
    {
    }

    auto breaker() -> CircuitBreaker&
    {
        return breaker_;
    }

    /**
     * @brief Run a command, retrying transient failures.
     *
     * @param command command passed unchanged to every attempt
     * @return final outcome of the call
     */
    auto execute(Command command) -> boost::asio::awaitable<Outcome>
    {
        using namespace std::chrono_literals;
        namespace this_coro = boost::asio::this_coro;

        co_await this_coro::reset_cancellation_state(boost::asio::enable_total_cancellation());
        co_await this_coro::throw_if_cancelled(false);

        // Settings are sampled once per call.
        auto const max_attempts = settings_.max_retries < 1 ? 1 : settings_.max_retries;
        auto const base_delay = settings_.retry_delay;
        auto const max_total = settings_.max_total_retry_time;
        auto const classifier = settings_.retryable;
        breaker_.reconfigure(settings_.circuit_threshold, settings_.circuit_cooldown);

        if (auto const remaining = breaker_.admit())
        {
            auto const seconds = (remaining->count() + 999) / 1000;
            co_return Outcome::failure(
                ExecErrc::CircuitOpen,
                "Command temporarily unavailable due to repeated failures. Will retry after "
                    + std::to_string(seconds) + " seconds."
            );
        }

        boost::asio::steady_timer timer{co_await this_coro::executor};
        auto slept = 0ms;
        auto delay = base_delay;
        Outcome last;

        for (int attempt = 1; attempt <= max_attempts; ++attempt)
        {
            if (attempt > 1)
            {
                log_.info("retry", "attempt ", attempt, "/", max_attempts, " of ", command.program);
            }

            try
            {
                last = co_await runner_.async_execute(command, boost::asio::use_awaitable);
            }
            catch (std::exception const& err)
            {
                last = attempt == max_attempts
                    ? Outcome::failure(
                        ExecErrc::RetriesExhausted,
                        "Failed after " + std::to_string(max_attempts) + " attempts: " + err.what())
                    : Outcome::failure(ExecErrc::SpawnFailed, err.what());
            }

            if (last.succeeded)
            {
                if (attempt > 1)
                {
                    log_.info("retry", command.program, " succeeded after ", attempt, " attempts");
                }
                breaker_.record_success();
                co_return last;
            }

            if (cancelled(co_await this_coro::cancellation_state))
            {
                co_return last;
            }

            if (attempt == max_attempts || not classifier.retryable(last.error))
            {
                break;
            }

            if (slept + delay > max_total)
            {
                log_.info("retry", "maximum retry time of ", max_total.count(), "ms would be exceeded");
                last = Outcome::failure(
                    ExecErrc::RetryBudgetExceeded,
                    "Maximum retry time exceeded (" + std::to_string(max_total.count()) + "ms)"
                );
                break;
            }

            log_.info("retry", command.program, " failed (attempt ", attempt, "/", max_attempts,
                "), retrying in ", delay.count(), "ms: ", last.error);

            boost::system::error_code error;
            timer.expires_after(delay);
            co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));
            slept += delay;
            delay = std::min(delay * 2, max_total);

            if (error || cancelled(co_await this_coro::cancellation_state))
            {
                log_.info("retry", "cancelled while waiting to retry ", command.program);
                co_return last;
            }
        }

        if (trips_breaker(last, classifier) && breaker_.record_failure())
        {
            log_.warn("retry", "circuit opened after ", breaker_.failures(), " consecutive failures");
        }
        co_return last;
    }

private:
    /// Only failures of the tool itself count toward opening the circuit.
    /// Ordinary non-zero exits that are not transient leave it alone.
    static auto trips_breaker(Outcome const& outcome, RetryClassifier const& classifier) -> bool
    {
        return outcome.reason == ExecErrc::SpawnFailed
            || outcome.reason == ExecErrc::Timeout
            || outcome.reason == ExecErrc::RetriesExhausted
            || outcome.reason == ExecErrc::RetryBudgetExceeded
            || classifier.retryable(outcome.error);
    }

    static auto cancelled(boost::asio::cancellation_state const state) -> bool
    {
        return boost::asio::cancellation_type::none != state.cancelled();
    }
};

} // namespace cmdguard
