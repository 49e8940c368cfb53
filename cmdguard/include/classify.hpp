#pragma once
/**
 * @file classify.hpp
 * @brief Transient-failure detection for retry decisions
 *
 */

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

/**
 * @brief Case-insensitive pattern set matched against failure messages.
 *
 * A message is retryable when any pattern matches somewhere inside it.
 */
class RetryClassifier
{
    std::vector<std::string> sources_;
    std::vector<std::regex> patterns_;

public:
    /// Patterns for network, connection, timeout, temporary, rate limit,
    /// server error and HTTP 500/502/503 failures.
    static auto default_patterns() -> std::vector<std::string>;

    RetryClassifier();

    /// @throws std::regex_error for an invalid pattern
    explicit RetryClassifier(std::vector<std::string> patterns);

    auto retryable(std::string_view message) const -> bool;

    auto patterns() const -> std::vector<std::string> const&
    {
        return sources_;
    }
};

} // namespace cmdguard
