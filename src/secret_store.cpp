#include "mcpguard/secret_store.hpp"
#include "mcpguard/error.hpp"
#include "mcpguard/log.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace mcpguard {

JsonSecretStore::JsonSecretStore(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        log::debug("No secrets file at " + path.string());
        return;
    }

    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot read secrets file " + path.string());
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Secrets file " + path.string() + " is not valid JSON: " + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigError("Secrets file " + path.string() + " must hold a JSON object");
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_string()) {
            throw ConfigError("Secret '" + it.key() + "' is not a string");
        }
        secrets_[it.key()] = it.value().get<std::string>();
    }
    log::debug("Loaded " + std::to_string(secrets_.size()) + " secrets");
}

std::optional<std::string> JsonSecretStore::get_secret(const std::string& name) const {
    auto it = secrets_.find(name);
    if (it == secrets_.end()) return std::nullopt;
    return it->second;
}

} // namespace mcpguard
