#pragma once
/**
 * @file circuit_breaker.hpp
 * @brief Rejects calls after repeated failures until a cooldown passes
 *
 */

#include <chrono>
#include <optional>

namespace cmdguard {

class CircuitBreaker
{
public:
    using clock = std::chrono::steady_clock;

    enum class State
    {
        Closed,
        Open,
        HalfOpen,
    };

    CircuitBreaker(int threshold, std::chrono::milliseconds cooldown);

    /**
     * @brief Decide whether a call may proceed.
     *
     * An open circuit whose cooldown has passed moves to half-open and
     * admits the call.
     *
     * @param now current time
     * @return nullopt when admitted, otherwise the remaining cooldown
     */
    auto admit(clock::time_point now = clock::now()) -> std::optional<std::chrono::milliseconds>;

    auto record_success() -> void;

    /// @return true when this failure opened the circuit
    auto record_failure(clock::time_point now = clock::now()) -> bool;

    /// Takes effect for decisions made after the call.
    auto reconfigure(int threshold, std::chrono::milliseconds cooldown) -> void;

    auto state() const -> State { return state_; }
    auto failures() const -> int { return failures_; }

private:
    int threshold_;
    std::chrono::milliseconds cooldown_;
    State state_ {State::Closed};
    int failures_ {0};
    clock::time_point last_failure_ {};
};

} // namespace cmdguard
