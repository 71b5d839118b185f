#include "mcpguard/url.hpp"
#include "mcpguard/error.hpp"

namespace mcpguard {

UrlParts split_url(const std::string& url) {
    UrlParts parts;
    std::string rest = url;

    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        parts.scheme = rest.substr(0, scheme_end);
        rest = rest.substr(scheme_end + 3);
    } else {
        parts.scheme = "http";
    }

    auto slash = rest.find('/');
    std::string hostport = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    if (hostport.empty()) {
        throw ConfigError("URL has no host: '" + url + "'");
    }

    parts.origin = parts.scheme + "://" + hostport;
    parts.path = (slash == std::string::npos) ? "/" : rest.substr(slash);
    return parts;
}

std::string join_path(const std::string& base, const std::string& child) {
    std::string out = base.empty() ? "/" : base;
    if (out.back() != '/') out += '/';
    size_t skip = 0;
    while (skip < child.size() && child[skip] == '/') ++skip;
    return out + child.substr(skip);
}

} // namespace mcpguard
