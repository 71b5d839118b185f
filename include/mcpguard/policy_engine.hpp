#pragma once
#include "audit_log.hpp"
#include "decision_channel.hpp"
#include "guard_rails.hpp"
#include "message.hpp"
#include "serial_executor.hpp"
#include "server_identity.hpp"
#include "trust_store.hpp"
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcpguard {

/// Protocol-maintenance methods that are never gated.
[[nodiscard]] std::set<std::string> default_exempt_methods();

/// Substrings that mark a server response as leaking secrets.
[[nodiscard]] std::vector<std::string> default_response_patterns();

struct PolicyOptions {
    ToolControlMode tool_control{ToolControlMode::Off};
    SecurityDetectionMode security_detection{SecurityDetectionMode::Off};
    std::set<std::string> exempt_methods = default_exempt_methods();
    std::chrono::milliseconds decision_timeout{30000};
    bool scan_responses{true};
    std::vector<std::string> response_patterns = default_response_patterns();

    [[nodiscard]] bool policies_enabled() const {
        return tool_control != ToolControlMode::Off ||
               security_detection != SecurityDetectionMode::Off;
    }
};

/// Outcome for one client message.
struct PolicyDecision {
    bool allowed{true};
    std::string decision{"allowed"};   // allowed, blocked, timeout, error
    std::optional<std::string> reason;
    std::optional<std::string> risk_level;
    std::vector<std::string> concerns;

    static PolicyDecision forward() { return {}; }
    static PolicyDecision block(std::string decision, std::string reason);
};

/// Decides whether a client message reaches the server.
///
/// Steps, in order: exempt methods pass, untrusted servers are refused,
/// nothing else is checked when every policy mode is off, otherwise the
/// decision channel is asked and the answer awaited for at most
/// decision_timeout. A missing answer or a failed channel blocks.
///
/// Thread-safe. One engine is shared by every session of a process.
class PolicyEngine {
public:
    PolicyEngine(PolicyOptions opts, const ITrustStore& trust, AuditLog& audit,
                 IDecisionChannel& channel);
    ~PolicyEngine();

    PolicyEngine(const PolicyEngine&) = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;

    [[nodiscard]] bool is_system_method(const std::string& method) const;

    /// `raw` is the line or body the message was parsed from.
    [[nodiscard]] PolicyDecision evaluate(const Message& msg, const std::string& raw,
                                          const ServerIdentity& server,
                                          const std::string& transport);

    /// First sensitive pattern found in a server payload.
    [[nodiscard]] std::optional<std::string> scan_response(std::string_view payload) const;

    /// Scan a server payload and raise an alert in the background.
    /// Never blocks the caller.
    void inspect_response(std::string payload, const ServerIdentity& server,
                          const std::string& transport);

    /// Wait for queued alerts (tests and shutdown).
    void wait_idle();

    [[nodiscard]] const PolicyOptions& options() const { return opts_; }

private:
    PolicyDecision call_out(const Message& msg, const std::string& raw,
                            const ServerIdentity& server, const std::string& transport);
    void record(const Message& msg, const std::string& raw, const ServerIdentity& server,
                const std::string& transport, const PolicyDecision& decision,
                std::optional<nlohmann::json> ai_analysis);

    PolicyOptions opts_;
    const ITrustStore& trust_;
    AuditLog& audit_;
    IDecisionChannel& channel_;
    SerialExecutor alerts_;
};

} // namespace mcpguard
