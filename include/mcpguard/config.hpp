#pragma once
#include "environment.hpp"
#include "guard_rails.hpp"
#include "policy_engine.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpguard {

/// $HOME/.config/mcpguard
[[nodiscard]] std::filesystem::path default_config_dir();

/// MCPGUARD_CONFIG, else <config dir>/config.json.
[[nodiscard]] std::filesystem::path default_config_path();

/// MCPGUARD_TRUST_STORE, else <config dir>/trusted_servers.json.
[[nodiscard]] std::filesystem::path default_trust_store_path();

/// Policy configuration shared by every proxy of a user.
struct ProxyConfig {
    GuardRailsConfig guard_rails;
    std::set<std::string> extra_exempt_methods;
    std::chrono::milliseconds decision_timeout{30000};
    size_t audit_capacity{1000};
    bool scan_responses{true};
    std::optional<std::string> decision_url;
    std::filesystem::path trust_store_path;
    std::filesystem::path secrets_path;

    /// Parse a config document. Throws ConfigError on wrong types or values.
    static ProxyConfig from_json(const nlohmann::json& doc);

    /// Read `path`. A missing file yields defaults; a malformed one throws.
    static ProxyConfig load(const std::filesystem::path& path);

    /// load(default_config_path()) followed by apply_env_overrides().
    static ProxyConfig load_default();

    /// MCPGUARD_TOOL_CONTROL, MCPGUARD_SECURITY_DETECTION,
    /// MCPGUARD_DECISION_URL, MCPGUARD_TRUST_STORE, MCPGUARD_SECRETS.
    void apply_env_overrides(const EnvMap& env);

    [[nodiscard]] PolicyOptions policy_options() const;
};

/// Launch parameters of the stdio proxy.
struct StdioLaunchSpec {
    std::string server_name{"unknown"};
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path log_path{"/tmp/mcp_proxy.log"};

    /// Throws ConfigError when MCP_ORIGINAL_COMMAND is missing or the
    /// argument list cannot be decoded.
    static StdioLaunchSpec from_env(const EnvMap& env);
};

/// Launch parameters of the HTTP proxy.
struct HttpLaunchSpec {
    std::string server_name{"unknown"};
    std::string target_url;
    std::vector<std::pair<std::string, std::string>> headers;
    uint16_t local_port{0};
    std::filesystem::path log_path{"/tmp/mcp_http_proxy.log"};

    /// Throws ConfigError when MCP_TARGET_URL is missing or invalid.
    static HttpLaunchSpec from_env(const EnvMap& env);
};

/// Argument list from MCP_ORIGINAL_ARGS_B64 (base64 JSON array), falling
/// back to MCP_ORIGINAL_ARGS (JSON array). Empty when neither is set.
[[nodiscard]] std::vector<std::string> decode_launch_args(const EnvMap& env);

} // namespace mcpguard
