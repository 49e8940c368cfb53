#include "circuit_breaker.hpp"

#include <chrono>
#include <optional>

namespace cmdguard {

CircuitBreaker::CircuitBreaker(int const threshold, std::chrono::milliseconds const cooldown)
    : threshold_{threshold}
    , cooldown_{cooldown}
{
}

auto CircuitBreaker::admit(clock::time_point const now) -> std::optional<std::chrono::milliseconds>
{
    if (State::Open != state_)
    {
        return std::nullopt;
    }

    auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_failure_);
    if (elapsed > cooldown_)
    {
        state_ = State::HalfOpen;
        return std::nullopt;
    }

    return cooldown_ - elapsed;
}

auto CircuitBreaker::record_success() -> void
{
    failures_ = 0;
    state_ = State::Closed;
}

auto CircuitBreaker::record_failure(clock::time_point const now) -> bool
{
    ++failures_;
    last_failure_ = now;

    // A failed trial call reopens immediately.
    if (State::Open != state_ && (State::HalfOpen == state_ || failures_ >= threshold_))
    {
        state_ = State::Open;
        return true;
    }
    return false;
}

auto CircuitBreaker::reconfigure(int const threshold, std::chrono::milliseconds const cooldown) -> void
{
    threshold_ = threshold;
    cooldown_ = cooldown;
}

} // namespace cmdguard
