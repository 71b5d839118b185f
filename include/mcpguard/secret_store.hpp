#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace mcpguard {

/// Lookup of named secrets for `${KEYCHAIN:name}` placeholders.
class ISecretStore {
public:
    virtual ~ISecretStore() = default;
    [[nodiscard]] virtual std::optional<std::string> get_secret(const std::string& name) const = 0;
};

/// Secrets kept in a JSON object file: {"name": "value", ...}.
///
/// The file is read once at construction. A missing file is an empty store;
/// a file that is not a JSON object of strings raises ConfigError.
class JsonSecretStore : public ISecretStore {
public:
    explicit JsonSecretStore(const std::filesystem::path& path);

    [[nodiscard]] std::optional<std::string> get_secret(const std::string& name) const override;
    [[nodiscard]] size_t size() const { return secrets_.size(); }

private:
    std::map<std::string, std::string> secrets_;
};

/// In-memory store.
class StaticSecretStore : public ISecretStore {
public:
    StaticSecretStore() = default;
    explicit StaticSecretStore(std::map<std::string, std::string> secrets)
        : secrets_(std::move(secrets)) {}

    void set(const std::string& name, const std::string& value) { secrets_[name] = value; }

    [[nodiscard]] std::optional<std::string> get_secret(const std::string& name) const override {
        auto it = secrets_.find(name);
        if (it == secrets_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, std::string> secrets_;
};

} // namespace mcpguard
