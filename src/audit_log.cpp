#include "mcpguard/audit_log.hpp"

#include <algorithm>
#include <iterator>

namespace mcpguard {

void to_json(nlohmann::json& j, const AuditEntry& e) {
    j = nlohmann::json{
        {"timestamp", std::chrono::duration<double>(e.timestamp.time_since_epoch()).count()},
        {"serverName", e.server_name},
        {"action", e.action},
        {"message", e.message},
        {"wasBlocked", e.was_blocked},
        {"decision", e.decision},
        {"transport", e.transport}
    };
    if (e.block_reason) j["blockReason"] = *e.block_reason;
    if (e.risk_level) j["riskLevel"] = *e.risk_level;
    if (e.ai_analysis) j["aiAnalysis"] = *e.ai_analysis;
}

AuditLog::AuditLog(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void AuditLog::append(AuditEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_front(std::move(entry));
    while (entries_.size() > capacity_) {
        entries_.pop_back();
    }
}

std::vector<AuditEntry> AuditLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {entries_.begin(), entries_.end()};
}

std::vector<AuditEntry> AuditLog::entries_for(const std::string& server_name) const {
    std::vector<AuditEntry> out;
    std::lock_guard<std::mutex> lock(mutex_);
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
                 [&](const AuditEntry& e) { return e.server_name == server_name; });
    return out;
}

size_t AuditLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t AuditLog::blocked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [](const AuditEntry& e) { return e.was_blocked; }));
}

void AuditLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

nlohmann::json AuditLog::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries()) arr.push_back(e);
    return arr;
}

} // namespace mcpguard
