#include "sanitize.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

namespace {

auto is_space(char const c) -> bool
{
    switch (c)
    {
    case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
        return true;
    default:
        return false;
    }
}

} // namespace

auto sanitize_argument(std::string_view const arg) -> std::string
{
    std::string result;
    result.reserve(arg.size());

    // A space is only emitted once a later non-space character shows up,
    // which collapses runs and trims both ends in one pass.
    bool pending_space = false;

    for (auto const c : arg)
    {
        if (shell_metacharacters.find(c) != std::string_view::npos)
        {
            continue;
        }

        if (is_space(c))
        {
            pending_space = not result.empty();
        }
        else
        {
            if (pending_space)
            {
                result.push_back(' ');
                pending_space = false;
            }
            result.push_back(c);
        }
    }

    return result;
}

auto sanitize_arguments(std::vector<std::string> const& args) -> std::vector<std::string>
{
    std::vector<std::string> result;
    result.reserve(args.size());
    for (auto const& arg : args)
    {
        auto clean = sanitize_argument(arg);
        if (not clean.empty())
        {
            result.push_back(std::move(clean));
        }
    }
    return result;
}

} // namespace cmdguard
