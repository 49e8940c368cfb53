#pragma once
/**
 * @file exec_error.hpp
 * @brief Failure taxonomy for supervised command execution
 *
 */

#include <boost/system/error_code.hpp>

#include <string>
#include <type_traits>

namespace cmdguard {

struct ExecErrCategory : boost::system::error_category
{
    char const* name() const noexcept override;
    std::string message(int) const override;
};

extern ExecErrCategory const theExecErrCategory;

enum class ExecErrc
{
    Succeeded = 0,
    // Terminal states of a single attempt
    Timeout = 1,
    Cancelled = 2,
    SpawnFailed = 3,
    ExitNonZero = 4,
    // Decisions of the retry coordinator
    RetriesExhausted = 256,
    RetryBudgetExceeded,
    CircuitOpen,
};

auto make_error_code(ExecErrc err) -> boost::system::error_code;

} // namespace cmdguard

namespace boost::system {
template<>
struct is_error_code_enum<cmdguard::ExecErrc> : std::true_type {};
}
