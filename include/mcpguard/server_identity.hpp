#pragma once
#include <optional>
#include <string>
#include <vector>

namespace mcpguard {

enum class ServerType { Url, Npx, Docker, Local };

[[nodiscard]] std::string to_string(ServerType type);
/// Throws ConfigError for an unknown name.
[[nodiscard]] ServerType server_type_from_string(const std::string& name);

/// Trust lookup key derived from how a server is launched.
struct TrustKey {
    ServerType type;
    std::string identifier;

    bool operator==(const TrustKey& o) const {
        return type == o.type && identifier == o.identifier;
    }
};

/// Derive the trust key for a launch command.
///
/// docker: last non-flag argument that looks like an image reference
/// (contains '/' or ':'), backslashes stripped. npx: "npx " followed by the
/// space-joined arguments. Anything else: the bare command.
/// The same function runs when trust is granted and when it is checked.
[[nodiscard]] TrustKey derive_trust_key(const std::string& command,
                                        const std::vector<std::string>& args);

/// Trust key for a remote server addressed by URL.
[[nodiscard]] TrustKey derive_trust_key(const std::string& url);

/// Who the proxy is fronting. Resolved once when a session starts.
struct ServerIdentity {
    std::string display_name;
    std::string command_or_url;
    std::vector<std::string> raw_args;
    bool is_url{false};

    static ServerIdentity for_command(std::string name, std::string command,
                                      std::vector<std::string> args);
    static ServerIdentity for_url(std::string name, std::string url);

    [[nodiscard]] TrustKey trust_key() const;
};

} // namespace mcpguard
