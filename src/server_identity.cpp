#include "mcpguard/server_identity.hpp"
#include "mcpguard/error.hpp"
#include <algorithm>

namespace mcpguard {

namespace {

std::string basename_of(const std::string& command) {
    auto slash = command.find_last_of('/');
    return slash == std::string::npos ? command : command.substr(slash + 1);
}

std::string strip_backslashes(std::string s) {
    s.erase(std::remove(s.begin(), s.end(), '\\'), s.end());
    return s;
}

} // anonymous namespace

std::string to_string(ServerType type) {
    switch (type) {
        case ServerType::Url:    return "url";
        case ServerType::Npx:    return "npx";
        case ServerType::Docker: return "docker";
        case ServerType::Local:  return "local";
    }
    return "local";
}

ServerType server_type_from_string(const std::string& name) {
    if (name == "url")    return ServerType::Url;
    if (name == "npx")    return ServerType::Npx;
    if (name == "docker") return ServerType::Docker;
    if (name == "local")  return ServerType::Local;
    throw ConfigError("Unknown server type: " + name);
}

TrustKey derive_trust_key(const std::string& command, const std::vector<std::string>& args) {
    const std::string base = basename_of(command);

    if (base == "docker") {
        for (auto it = args.rbegin(); it != args.rend(); ++it) {
            std::string arg = strip_backslashes(*it);
            if (arg.empty() || arg.front() == '-') continue;
            if (arg.find('/') != std::string::npos || arg.find(':') != std::string::npos) {
                return {ServerType::Docker, arg};
            }
        }
        // No image reference found: fall back to the command itself.
        return {ServerType::Local, command};
    }

    if (base == "npx") {
        std::string id = "npx";
        for (const auto& a : args) {
            id += ' ';
            id += a;
        }
        return {ServerType::Npx, id};
    }

    return {ServerType::Local, command};
}

TrustKey derive_trust_key(const std::string& url) {
    return {ServerType::Url, url};
}

ServerIdentity ServerIdentity::for_command(std::string name, std::string command,
                                           std::vector<std::string> args) {
    ServerIdentity id;
    id.display_name = std::move(name);
    id.command_or_url = std::move(command);
    id.raw_args = std::move(args);
    id.is_url = false;
    return id;
}

ServerIdentity ServerIdentity::for_url(std::string name, std::string url) {
    ServerIdentity id;
    id.display_name = std::move(name);
    id.command_or_url = std::move(url);
    id.is_url = true;
    return id;
}

TrustKey ServerIdentity::trust_key() const {
    return is_url ? derive_trust_key(command_or_url)
                  : derive_trust_key(command_or_url, raw_args);
}

} // namespace mcpguard
