#include "mcpguard/trust_store.hpp"
#include "mcpguard/error.hpp"
#include "mcpguard/log.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <system_error>

namespace mcpguard {

namespace fs = std::filesystem;

namespace {

double to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_seconds(double secs) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(secs)));
}

void sort_newest_first(std::vector<TrustEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const TrustEntry& a, const TrustEntry& b) {
                         return a.trusted_at > b.trusted_at;
                     });
}

} // anonymous namespace

// ---- TrustEntry ----

TrustEntry TrustEntry::for_identity(const ServerIdentity& id, std::optional<std::string> notes) {
    TrustKey key = id.trust_key();
    TrustEntry e;
    e.name = id.display_name;
    e.type = key.type;
    e.identifier = key.identifier;
    e.notes = std::move(notes);
    return e;
}

void to_json(nlohmann::json& j, const TrustEntry& e) {
    j = nlohmann::json{
        {"name", e.name},
        {"type", to_string(e.type)},
        {"identifier", e.identifier},
        {"trustedAt", to_epoch_seconds(e.trusted_at)}
    };
    if (e.config_path) j["configPath"] = *e.config_path;
    if (e.notes) j["notes"] = *e.notes;
}

void from_json(const nlohmann::json& j, TrustEntry& e) {
    e.name = j.at("name").get<std::string>();
    e.type = server_type_from_string(j.at("type").get<std::string>());
    e.identifier = j.at("identifier").get<std::string>();
    e.config_path.reset();
    e.notes.reset();
    if (j.contains("configPath") && j.at("configPath").is_string() &&
        !j.at("configPath").get<std::string>().empty()) {
        e.config_path = j.at("configPath").get<std::string>();
    }
    if (j.contains("notes") && j.at("notes").is_string() &&
        !j.at("notes").get<std::string>().empty()) {
        e.notes = j.at("notes").get<std::string>();
    }
    e.trusted_at = j.contains("trustedAt")
        ? from_epoch_seconds(j.at("trustedAt").get<double>())
        : std::chrono::system_clock::now();
}

// ---- TrustStore ----

TrustStore::TrustStore(fs::path path)
    : path_(std::move(path)) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    load_locked();
}

std::optional<fs::file_time_type> TrustStore::file_mtime() const {
    if (path_.empty()) return std::nullopt;
    std::error_code ec;
    auto t = fs::last_write_time(path_, ec);
    if (ec) return std::nullopt;
    return t;
}

void TrustStore::refresh_if_changed() const {
    if (path_.empty()) return;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (file_mtime() == loaded_mtime_) return;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (file_mtime() != loaded_mtime_) load_locked();
}

void TrustStore::load_locked() const {
    entries_.clear();
    loaded_mtime_ = file_mtime();
    if (!loaded_mtime_) return;

    std::ifstream in(path_);
    if (!in) {
        log::error("Trust store: cannot open " + path_.string());
        return;
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        log::error("Trust store: " + path_.string() + " is not valid JSON: " + e.what());
        return;
    }

    const nlohmann::json* servers = &doc;
    if (doc.is_object() && doc.contains("servers")) servers = &doc.at("servers");
    if (!servers->is_array()) {
        log::error("Trust store: unexpected document shape in " + path_.string());
        return;
    }

    for (const auto& item : *servers) {
        try {
            entries_.push_back(item.get<TrustEntry>());
        } catch (const std::exception& e) {
            log::warn(std::string("Trust store: skipping malformed entry: ") + e.what());
        }
    }
    log::debug("Trust store: loaded " + std::to_string(entries_.size()) + " entries");
}

void TrustStore::save_locked(const std::vector<TrustEntry>& entries) const {
    if (path_.empty()) return;

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }

    nlohmann::json servers = nlohmann::json::array();
    for (const auto& e : entries) servers.push_back(e);
    nlohmann::json doc = {{"version", 1}, {"servers", servers}};

    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw GuardError("Trust store: cannot write " + tmp.string());
        }
        out << doc.dump(2) << '\n';
        if (!out) {
            throw GuardError("Trust store: write failed for " + tmp.string());
        }
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        throw GuardError("Trust store: cannot replace " + path_.string() + ": " + ec.message());
    }
    loaded_mtime_ = file_mtime();
}

bool TrustStore::is_trusted(const std::string& name, const std::string& identifier) const {
    refresh_if_changed();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    bool trusted = std::any_of(entries_.begin(), entries_.end(), [&](const TrustEntry& e) {
        return e.name == name && e.identifier == identifier;
    });
    if (log::level() <= log::Level::Debug) {
        log::debug("Trust check: name='" + name + "', identifier='" + identifier +
                   "', trusted=" + (trusted ? "true" : "false"));
    }
    return trusted;
}

void TrustStore::add(const TrustEntry& entry) {
    refresh_if_changed();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<TrustEntry> next = entries_;
    auto it = std::find_if(next.begin(), next.end(), [&](const TrustEntry& e) {
        return e.name == entry.name && e.identifier == entry.identifier;
    });
    if (it != next.end()) {
        *it = entry;
    } else {
        next.push_back(entry);
    }
    save_locked(next);
    entries_.swap(next);
    log::info("Trusted server '" + entry.name + "' (" + to_string(entry.type) + ": " +
              entry.identifier + ")");
}

bool TrustStore::remove(const std::string& name, const std::string& identifier) {
    refresh_if_changed();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<TrustEntry> next = entries_;
    next.erase(std::remove_if(next.begin(), next.end(), [&](const TrustEntry& e) {
        return e.name == name && e.identifier == identifier;
    }), next.end());
    if (next.size() == entries_.size()) return false;
    save_locked(next);
    entries_.swap(next);
    log::info("Removed trust for '" + name + "' (" + identifier + ")");
    return true;
}

std::vector<TrustEntry> TrustStore::list_all() const {
    refresh_if_changed();
    std::vector<TrustEntry> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out = entries_;
    }
    sort_newest_first(out);
    return out;
}

std::vector<TrustEntry> TrustStore::list_by_type(ServerType type) const {
    auto all = list_all();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [type](const TrustEntry& e) { return e.type != type; }),
              all.end());
    std::stable_sort(all.begin(), all.end(),
                     [](const TrustEntry& a, const TrustEntry& b) { return a.name < b.name; });
    return all;
}

nlohmann::json TrustStore::export_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : list_all()) arr.push_back(e);
    return arr;
}

size_t TrustStore::import_json(const nlohmann::json& doc) {
    const nlohmann::json* servers = &doc;
    if (doc.is_object() && doc.contains("servers")) servers = &doc.at("servers");
    if (!servers->is_array()) {
        throw ConfigError("Trust import expects a JSON array of servers");
    }

    size_t imported = 0;
    for (const auto& item : *servers) {
        TrustEntry entry;
        try {
            entry = item.get<TrustEntry>();
        } catch (const std::exception& e) {
            log::warn(std::string("Trust import: skipping entry: ") + e.what());
            continue;
        }
        add(entry);
        ++imported;
    }
    return imported;
}

} // namespace mcpguard
