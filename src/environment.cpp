#include "mcpguard/environment.hpp"
#include "mcpguard/log.hpp"

#include <cstdlib>

extern char** environ;

namespace mcpguard {

namespace {

constexpr const char* PLACEHOLDER_OPEN = "${KEYCHAIN:";

const char* const PROXY_VARIABLES[] = {
    env::ServerName, env::OriginalCommand, env::OriginalArgs,
    env::OriginalArgsB64, env::LogPath, env::BlockList
};

} // anonymous namespace

EnvMap current_environment() {
    EnvMap out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        out.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return out;
}

bool is_proxy_variable(const std::string& name) {
    for (const char* v : PROXY_VARIABLES) {
        if (name == v) return true;
    }
    return name.compare(0, std::char_traits<char>::length(env::GuardPrefix), env::GuardPrefix) == 0;
}

EnvMap sanitize_environment(const EnvMap& env) {
    EnvMap out;
    for (const auto& [k, v] : env) {
        if (!is_proxy_variable(k)) out.emplace(k, v);
    }
    return out;
}

std::string substitute_secrets(const std::string& value, const ISecretStore& secrets) {
    std::string out;
    size_t pos = 0;
    const size_t open_len = std::char_traits<char>::length(PLACEHOLDER_OPEN);

    while (true) {
        size_t start = value.find(PLACEHOLDER_OPEN, pos);
        if (start == std::string::npos) break;
        size_t end = value.find('}', start + open_len);
        if (end == std::string::npos) break;

        out.append(value, pos, start - pos);
        std::string name = value.substr(start + open_len, end - start - open_len);
        if (auto secret = secrets.get_secret(name)) {
            out += *secret;
        } else {
            log::warn("Secret '" + name + "' not found, leaving placeholder");
            out.append(value, start, end - start + 1);
        }
        pos = end + 1;
    }
    out.append(value, pos, std::string::npos);
    return out;
}

EnvMap resolve_secrets(const EnvMap& env, const ISecretStore& secrets) {
    EnvMap out;
    for (const auto& [k, v] : env) {
        out.emplace(k, substitute_secrets(v, secrets));
    }
    return out;
}

std::vector<std::string> to_envp(const EnvMap& env) {
    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& [k, v] : env) out.push_back(k + "=" + v);
    return out;
}

std::optional<std::string> get_env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

} // namespace mcpguard
