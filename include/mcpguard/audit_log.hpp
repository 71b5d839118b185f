#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpguard {

/// One policy event. Only the most recent entries are kept.
struct AuditEntry {
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::string server_name;
    std::string action;        // effective method, or "response_scan" / "tools/call:<tool>"
    std::string message;       // raw payload as seen on the wire
    bool was_blocked{false};
    std::optional<std::string> block_reason;
    std::optional<std::string> risk_level;
    std::optional<nlohmann::json> ai_analysis;
    std::string decision;      // allowed, blocked, timeout, error, alert
    std::string transport;     // stdio or http
};

void to_json(nlohmann::json& j, const AuditEntry& e);

/// Capacity-bounded audit log shared by every session.
class AuditLog {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit AuditLog(size_t capacity = DEFAULT_CAPACITY);

    /// Record an entry, evicting the oldest once full.
    void append(AuditEntry entry);

    /// Snapshot, newest first.
    [[nodiscard]] std::vector<AuditEntry> entries() const;
    [[nodiscard]] std::vector<AuditEntry> entries_for(const std::string& server_name) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] size_t blocked_count() const;

    void clear();

    [[nodiscard]] nlohmann::json to_json() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<AuditEntry> entries_;  // front is newest
};

} // namespace mcpguard
