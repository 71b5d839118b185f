#pragma once
#include "server_identity.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpguard {

/// A server the user explicitly trusted. Unique on (name, identifier).
struct TrustEntry {
    std::string name;
    ServerType type{ServerType::Local};
    std::string identifier;
    std::optional<std::string> config_path;
    std::chrono::system_clock::time_point trusted_at{std::chrono::system_clock::now()};
    std::optional<std::string> notes;

    static TrustEntry for_identity(const ServerIdentity& id,
                                   std::optional<std::string> notes = std::nullopt);
};

void to_json(nlohmann::json& j, const TrustEntry& e);
void from_json(const nlohmann::json& j, TrustEntry& e);

/// Read-mostly set of trusted servers, shared by every session.
class ITrustStore {
public:
    virtual ~ITrustStore() = default;

    [[nodiscard]] virtual bool is_trusted(const std::string& name,
                                          const std::string& identifier) const = 0;

    [[nodiscard]] bool is_trusted(const ServerIdentity& id) const {
        return is_trusted(id.display_name, id.trust_key().identifier);
    }

    /// Insert or replace the entry with the same (name, identifier).
    virtual void add(const TrustEntry& entry) = 0;

    /// False if nothing matched.
    virtual bool remove(const std::string& name, const std::string& identifier) = 0;

    /// All entries, most recently trusted first.
    [[nodiscard]] virtual std::vector<TrustEntry> list_all() const = 0;
};

/// Trust store persisted as a JSON document.
///
/// Writes replace the file atomically. Reads pick up changes made by other
/// processes (the trust CLI) by reloading when the file's mtime moves.
/// An empty path keeps everything in memory.
class TrustStore : public ITrustStore {
public:
    explicit TrustStore(std::filesystem::path path = {});

    using ITrustStore::is_trusted;
    [[nodiscard]] bool is_trusted(const std::string& name,
                                  const std::string& identifier) const override;
    void add(const TrustEntry& entry) override;
    bool remove(const std::string& name, const std::string& identifier) override;
    [[nodiscard]] std::vector<TrustEntry> list_all() const override;

    [[nodiscard]] std::vector<TrustEntry> list_by_type(ServerType type) const;

    /// JSON array of every entry.
    [[nodiscard]] nlohmann::json export_json() const;

    /// Upsert every well-formed entry of a JSON array (or {"servers": [...]}).
    /// Returns the number imported. Throws ConfigError for other shapes.
    size_t import_json(const nlohmann::json& doc);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    void refresh_if_changed() const;
    void load_locked() const;
    /// Writes `entries`; throws GuardError and leaves the file untouched on failure.
    void save_locked(const std::vector<TrustEntry>& entries) const;
    [[nodiscard]] std::optional<std::filesystem::file_time_type> file_mtime() const;

    std::filesystem::path path_;
    mutable std::shared_mutex mutex_;
    mutable std::vector<TrustEntry> entries_;
    mutable std::optional<std::filesystem::file_time_type> loaded_mtime_;
};

} // namespace mcpguard
