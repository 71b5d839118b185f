#include "mcpguard/config.hpp"
#include "mcpguard/base64.hpp"
#include "mcpguard/error.hpp"
#include "mcpguard/log.hpp"
#include "mcpguard/url.hpp"

#include <fstream>

namespace mcpguard {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> lookup(const EnvMap& env, const char* name) {
    auto it = env.find(name);
    if (it == env.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

std::vector<std::string> parse_string_array(const std::string& text, const char* what) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string(what) + " is not valid JSON: " + e.what());
    }
    if (!doc.is_array()) {
        throw ConfigError(std::string(what) + " must be a JSON array");
    }
    std::vector<std::string> out;
    for (const auto& item : doc) {
        if (!item.is_string()) {
            throw ConfigError(std::string(what) + " must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

template <typename T>
T get_field(const nlohmann::json& doc, const char* key, T fallback) {
    if (!doc.contains(key) || doc.at(key).is_null()) return fallback;
    try {
        return doc.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Config field '") + key + "': " + e.what());
    }
}

} // anonymous namespace

fs::path default_config_dir() {
    if (auto home = get_env("HOME")) {
        return fs::path(*home) / ".config" / "mcpguard";
    }
    return fs::path(".mcpguard");
}

fs::path default_config_path() {
    if (auto path = get_env("MCPGUARD_CONFIG")) return *path;
    return default_config_dir() / "config.json";
}

fs::path default_trust_store_path() {
    if (auto path = get_env("MCPGUARD_TRUST_STORE")) return *path;
    return default_config_dir() / "trusted_servers.json";
}

// ---- ProxyConfig ----

ProxyConfig ProxyConfig::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Config must be a JSON object");
    }

    ProxyConfig cfg;
    cfg.guard_rails.tool_control = tool_control_mode_from_string(
        get_field<std::string>(doc, "tool_control", "off"));
    cfg.guard_rails.security_detection = security_detection_mode_from_string(
        get_field<std::string>(doc, "security_detection", "off"));

    if (doc.contains("blacklist")) cfg.guard_rails.blacklist = doc.at("blacklist").get<ToolRuleSet>();
    if (doc.contains("whitelist")) cfg.guard_rails.whitelist = doc.at("whitelist").get<ToolRuleSet>();
    cfg.guard_rails.blocked_patterns =
        get_field<std::vector<std::string>>(doc, "blocked_patterns", {});

    auto exempt = get_field<std::vector<std::string>>(doc, "exempt_methods", {});
    cfg.extra_exempt_methods.insert(exempt.begin(), exempt.end());

    auto timeout_ms = get_field<int64_t>(doc, "decision_timeout_ms", 30000);
    if (timeout_ms <= 0) {
        throw ConfigError("decision_timeout_ms must be positive");
    }
    cfg.decision_timeout = std::chrono::milliseconds(timeout_ms);

    auto capacity = get_field<int64_t>(doc, "audit_capacity", 1000);
    if (capacity <= 0) {
        throw ConfigError("audit_capacity must be positive");
    }
    cfg.audit_capacity = static_cast<size_t>(capacity);

    cfg.scan_responses = get_field<bool>(doc, "scan_responses", true);

    if (auto url = get_field<std::string>(doc, "decision_url", ""); !url.empty()) {
        cfg.decision_url = url;
    }
    cfg.trust_store_path = get_field<std::string>(doc, "trust_store", "");
    cfg.secrets_path = get_field<std::string>(doc, "secrets", "");
    return cfg;
}

ProxyConfig ProxyConfig::load(const fs::path& path) {
    ProxyConfig cfg;
    std::error_code ec;
    if (!path.empty() && fs::exists(path, ec)) {
        std::ifstream in(path);
        if (!in) {
            throw ConfigError("Cannot read config " + path.string());
        }
        nlohmann::json doc;
        try {
            in >> doc;
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Config " + path.string() + " is not valid JSON: " + e.what());
        }
        cfg = from_json(doc);
        log::debug("Loaded config from " + path.string());
    } else {
        log::debug("No config at " + path.string() + ", using defaults");
    }

    if (cfg.trust_store_path.empty()) cfg.trust_store_path = default_trust_store_path();
    if (cfg.secrets_path.empty()) cfg.secrets_path = default_config_dir() / "secrets.json";
    return cfg;
}

ProxyConfig ProxyConfig::load_default() {
    ProxyConfig cfg = load(default_config_path());
    cfg.apply_env_overrides(current_environment());
    return cfg;
}

void ProxyConfig::apply_env_overrides(const EnvMap& env) {
    if (auto v = lookup(env, "MCPGUARD_TOOL_CONTROL")) {
        guard_rails.tool_control = tool_control_mode_from_string(*v);
    }
    if (auto v = lookup(env, "MCPGUARD_SECURITY_DETECTION")) {
        guard_rails.security_detection = security_detection_mode_from_string(*v);
    }
    if (auto v = lookup(env, "MCPGUARD_DECISION_URL")) decision_url = *v;
    if (auto v = lookup(env, "MCPGUARD_TRUST_STORE")) trust_store_path = *v;
    if (auto v = lookup(env, "MCPGUARD_SECRETS")) secrets_path = *v;
}

PolicyOptions ProxyConfig::policy_options() const {
    PolicyOptions opts;
    opts.tool_control = guard_rails.tool_control;
    opts.security_detection = guard_rails.security_detection;
    opts.exempt_methods.insert(extra_exempt_methods.begin(), extra_exempt_methods.end());
    opts.decision_timeout = decision_timeout;
    opts.scan_responses = scan_responses;
    return opts;
}

// ---- Launch specs ----

std::vector<std::string> decode_launch_args(const EnvMap& env) {
    if (auto b64 = lookup(env, env::OriginalArgsB64)) {
        auto decoded = base64::decode(*b64);
        if (!decoded) {
            throw ConfigError(std::string(env::OriginalArgsB64) + " is not valid base64");
        }
        return parse_string_array(*decoded, env::OriginalArgsB64);
    }
    if (auto json = lookup(env, env::OriginalArgs)) {
        return parse_string_array(*json, env::OriginalArgs);
    }
    return {};
}

StdioLaunchSpec StdioLaunchSpec::from_env(const EnvMap& env) {
    StdioLaunchSpec spec;
    if (auto name = lookup(env, env::ServerName)) spec.server_name = *name;

    auto command = lookup(env, env::OriginalCommand);
    if (!command) {
        throw ConfigError(std::string(env::OriginalCommand) + " is not set");
    }
    spec.command = *command;
    spec.args = decode_launch_args(env);
    if (auto path = lookup(env, env::LogPath)) spec.log_path = *path;
    return spec;
}

HttpLaunchSpec HttpLaunchSpec::from_env(const EnvMap& env) {
    HttpLaunchSpec spec;
    if (auto name = lookup(env, env::ServerName)) spec.server_name = *name;

    auto url = lookup(env, env::TargetUrl);
    if (!url) {
        throw ConfigError(std::string(env::TargetUrl) + " is not set");
    }
    (void)split_url(*url);
    spec.target_url = *url;

    if (auto port = lookup(env, env::LocalPort)) {
        long value = -1;
        try {
            size_t used = 0;
            value = std::stol(*port, &used);
            if (used != port->size()) value = -1;
        } catch (const std::exception&) {
            value = -1;
        }
        if (value < 0 || value > 65535) {
            throw ConfigError(std::string(env::LocalPort) + " is not a port: '" + *port + "'");
        }
        spec.local_port = static_cast<uint16_t>(value);
    }

    if (auto headers = lookup(env, env::TargetHeaders)) {
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(*headers);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string(env::TargetHeaders) + " is not valid JSON: " + e.what());
        }
        if (!doc.is_object()) {
            throw ConfigError(std::string(env::TargetHeaders) + " must be a JSON object");
        }
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (!it.value().is_string()) {
                throw ConfigError("Header '" + it.key() + "' must be a string");
            }
            spec.headers.emplace_back(it.key(), it.value().get<std::string>());
        }
    }

    if (auto path = lookup(env, env::LogPath)) spec.log_path = *path;
    return spec;
}

} // namespace mcpguard
