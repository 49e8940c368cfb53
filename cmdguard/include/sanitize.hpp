#pragma once
/**
 * @file sanitize.hpp
 * @brief Shell metacharacter scrubbing for command arguments
 *
 */

#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

/// Characters deleted from every argument.
inline constexpr std::string_view shell_metacharacters = ";&|`$(){}[]<>";

/**
 * @brief Scrub a single argument.
 *
 * Deletes shell metacharacters, collapses whitespace runs to a single
 * space and trims both ends.
 *
 * @param arg raw argument
 * @return scrubbed argument, possibly empty
 */
auto sanitize_argument(std::string_view arg) -> std::string;

/**
 * @brief Scrub an argument list.
 *
 * Applies sanitize_argument to each element and drops the ones that end
 * up empty. Surviving arguments keep their order.
 *
 * @param args raw arguments
 * @return scrubbed arguments
 */
auto sanitize_arguments(std::vector<std::string> const& args) -> std::vector<std::string>;

} // namespace cmdguard
