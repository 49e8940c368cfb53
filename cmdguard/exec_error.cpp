#include "exec_error.hpp"

namespace cmdguard {

ExecErrCategory const theExecErrCategory;

char const* ExecErrCategory::name() const noexcept
{
    return "cmdguard";
}

std::string ExecErrCategory::message(int ev) const
{
    switch (static_cast<ExecErrc>(ev))
    {
    case ExecErrc::Succeeded:
        return "succeeded";
    case ExecErrc::Timeout:
        return "command timed out";
    case ExecErrc::Cancelled:
        return "command was aborted";
    case ExecErrc::SpawnFailed:
        return "failed to execute command";
    case ExecErrc::ExitNonZero:
        return "command exited with non-zero status";
    case ExecErrc::RetriesExhausted:
        return "retry attempts exhausted";
    case ExecErrc::RetryBudgetExceeded:
        return "maximum retry time exceeded";
    case ExecErrc::CircuitOpen:
        return "command temporarily unavailable";
    default:
        return "(unrecognized error)";
    }
}

auto make_error_code(ExecErrc const err) -> boost::system::error_code
{
    return boost::system::error_code{int(err), theExecErrCategory};
}

} // namespace cmdguard
