#include "classify.hpp"

#include <algorithm>
#include <regex>

namespace cmdguard {

auto RetryClassifier::default_patterns() -> std::vector<std::string>
{
    return {
        "network",
        "connection",
        "timeout",
        "temporary",
        "rate limit",
        "server error",
        "503",
        "502",
        "500",
    };
}

RetryClassifier::RetryClassifier()
    : RetryClassifier{default_patterns()}
{
}

RetryClassifier::RetryClassifier(std::vector<std::string> patterns)
    : sources_{std::move(patterns)}
{
    patterns_.reserve(sources_.size());
    for (auto const& source : sources_)
    {
        patterns_.emplace_back(source, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    }
}

auto RetryClassifier::retryable(std::string_view const message) const -> bool
{
    if (message.empty())
    {
        return false;
    }

    return std::ranges::any_of(patterns_, [message](std::regex const& pattern) {
        return std::regex_search(message.begin(), message.end(), pattern);
    });
}

} // namespace cmdguard
