#pragma once
#include <string>

namespace mcpguard {

/// A URL split the way httplib::Client wants it.
struct UrlParts {
    std::string scheme;   // "http" when absent
    std::string origin;   // scheme://host[:port]
    std::string path;     // "/" when absent, query string kept
};

/// Throws ConfigError for an empty host.
[[nodiscard]] UrlParts split_url(const std::string& url);

/// Join a base path and a child segment with exactly one '/'.
[[nodiscard]] std::string join_path(const std::string& base, const std::string& child);

} // namespace mcpguard
