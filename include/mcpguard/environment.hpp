#pragma once
#include "secret_store.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpguard {

using EnvMap = std::map<std::string, std::string>;

/// Variables the launcher hands to the proxy. Never passed to the server.
namespace env {
    constexpr const char* ServerName       = "MCP_SERVER_NAME";
    constexpr const char* OriginalCommand  = "MCP_ORIGINAL_COMMAND";
    constexpr const char* OriginalArgs     = "MCP_ORIGINAL_ARGS";
    constexpr const char* OriginalArgsB64  = "MCP_ORIGINAL_ARGS_B64";
    constexpr const char* LogPath          = "MCP_LOG_PATH";
    constexpr const char* BlockList        = "MCP_BLOCK_LIST";
    constexpr const char* TargetUrl        = "MCP_TARGET_URL";
    constexpr const char* TargetHeaders    = "MCP_TARGET_HEADERS";
    constexpr const char* LocalPort        = "MCP_LOCAL_PORT";
    constexpr const char* GuardPrefix      = "MCPGUARD_";
} // namespace env

/// Snapshot of this process's environment.
[[nodiscard]] EnvMap current_environment();

[[nodiscard]] bool is_proxy_variable(const std::string& name);

/// Copy of `env` without proxy variables.
[[nodiscard]] EnvMap sanitize_environment(const EnvMap& env);

/// Replace every `${KEYCHAIN:name}` in `value`. Unknown names keep their
/// placeholder and log a warning.
[[nodiscard]] std::string substitute_secrets(const std::string& value, const ISecretStore& secrets);

/// substitute_secrets() over every value.
[[nodiscard]] EnvMap resolve_secrets(const EnvMap& env, const ISecretStore& secrets);

/// "NAME=value" strings for execve.
[[nodiscard]] std::vector<std::string> to_envp(const EnvMap& env);

/// Optional variable lookup; empty values count as unset.
[[nodiscard]] std::optional<std::string> get_env(const char* name);

} // namespace mcpguard
