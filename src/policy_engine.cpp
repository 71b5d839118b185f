#include "mcpguard/policy_engine.hpp"
#include "mcpguard/error.hpp"
#include "mcpguard/log.hpp"
#include "mcpguard/uuid.hpp"

#include <future>

namespace mcpguard {

namespace {

constexpr const char* UNTRUSTED_REASON =
    "Server is not trusted. Add it to trusted servers with mcpguard-trust.";
constexpr const char* POLICY_BLOCK_REASON = "Request blocked by security policy";
constexpr size_t ALERT_EXCERPT_LENGTH = 100;

std::string describe_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0) {
        auto secs = timeout.count() / 1000;
        return std::to_string(secs) + (secs == 1 ? " second" : " seconds");
    }
    return std::to_string(timeout.count()) + " ms";
}

// Truncate on a UTF-8 boundary.
std::string excerpt(const std::string& text, size_t max_len) {
    if (text.size() <= max_len) return text;
    size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut);
}

} // anonymous namespace

std::set<std::string> default_exempt_methods() {
    return {
        "initialize", "initialized", "notifications/initialized",
        "ping", "shutdown",
        "tools/list", "resources/list", "prompts/list"
    };
}

std::vector<std::string> default_response_patterns() {
    return {
        "PRIVATE KEY", "ssh-rsa ", "ssh-ed25519 ",
        "/etc/passwd", "/etc/shadow",
        "password=", "api_key=",
        "AKIA", "ghp_", "xoxb-"
    };
}

PolicyDecision PolicyDecision::block(std::string decision, std::string reason) {
    PolicyDecision d;
    d.allowed = false;
    d.decision = std::move(decision);
    d.reason = std::move(reason);
    return d;
}

PolicyEngine::PolicyEngine(PolicyOptions opts, const ITrustStore& trust, AuditLog& audit,
                           IDecisionChannel& channel)
    : opts_(std::move(opts))
    , trust_(trust)
    , audit_(audit)
    , channel_(channel)
    , alerts_("response-alerts") {
}

PolicyEngine::~PolicyEngine() {
    alerts_.stop();
}

bool PolicyEngine::is_system_method(const std::string& method) const {
    return opts_.exempt_methods.count(method) > 0;
}

PolicyDecision PolicyEngine::evaluate(const Message& msg, const std::string& raw,
                                      const ServerIdentity& server,
                                      const std::string& transport) {
    if (msg.method && is_system_method(*msg.method)) {
        log::debug("System method '" + *msg.method + "' bypasses policy");
        return PolicyDecision::forward();
    }

    if (!trust_.is_trusted(server)) {
        log::warn("Blocking '" + msg.describe() + "': server '" + server.display_name +
                  "' is not trusted");
        auto decision = PolicyDecision::block("blocked", UNTRUSTED_REASON);
        record(msg, raw, server, transport, decision,
               nlohmann::json{{"reason", "Server not trusted"}});
        return decision;
    }

    // Answers to server-initiated requests carry no tool invocation.
    if (!msg.method || !opts_.policies_enabled()) return PolicyDecision::forward();

    return call_out(msg, raw, server, transport);
}

PolicyDecision PolicyEngine::call_out(const Message& msg, const std::string& raw,
                                      const ServerIdentity& server,
                                      const std::string& transport) {
    DecisionRequest request;
    request.server = server.display_name;
    request.message = raw;
    request.tool_name = msg.tool_name();
    request.method = msg.describe();
    request.response_channel = generate_uuid();

    const std::string token = request.response_channel;
    PolicyDecision decision;
    std::optional<nlohmann::json> analysis;

    try {
        auto fut = channel_.submit(std::move(request));
        if (fut.wait_for(opts_.decision_timeout) == std::future_status::timeout) {
            channel_.cancel(token);
            decision = PolicyDecision::block(
                "timeout", "Security check timed out after " + describe_timeout(opts_.decision_timeout));
            log::warn("Decision for '" + msg.describe() + "' timed out, blocking");
        } else {
            DecisionResponse response = fut.get();
            decision.allowed = response.allowed;
            decision.decision = response.allowed ? "allowed" : "blocked";
            if (response.reason) {
                decision.reason = response.reason;
            } else if (!response.allowed) {
                decision.reason = POLICY_BLOCK_REASON;
            }
            decision.risk_level = response.risk_level;
            decision.concerns = response.concerns;
            analysis = response.ai_analysis;
        }
    } catch (const std::exception& e) {
        channel_.cancel(token);
        decision = PolicyDecision::block("error", std::string("Security check failed: ") + e.what());
        log::error("Decision channel error for '" + msg.describe() + "': " + e.what());
    }

    record(msg, raw, server, transport, decision, std::move(analysis));
    return decision;
}

void PolicyEngine::record(const Message& msg, const std::string& raw,
                          const ServerIdentity& server, const std::string& transport,
                          const PolicyDecision& decision,
                          std::optional<nlohmann::json> ai_analysis) {
    AuditEntry entry;
    entry.server_name = server.display_name;
    entry.action = msg.describe();
    entry.message = raw;
    entry.was_blocked = !decision.allowed;
    entry.block_reason = decision.reason;
    entry.risk_level = decision.risk_level;
    entry.ai_analysis = std::move(ai_analysis);
    entry.decision = decision.decision;
    entry.transport = transport;
    audit_.append(std::move(entry));
}

std::optional<std::string> PolicyEngine::scan_response(std::string_view payload) const {
    for (const auto& pattern : opts_.response_patterns) {
        if (!pattern.empty() && payload.find(pattern) != std::string_view::npos) {
            return pattern;
        }
    }
    return std::nullopt;
}

void PolicyEngine::inspect_response(std::string payload, const ServerIdentity& server,
                                    const std::string& transport) {
    if (!opts_.scan_responses) return;

    alerts_.post([this, payload = std::move(payload), name = server.display_name, transport] {
        auto hit = scan_response(payload);
        if (!hit) return;

        log::warn("Sensitive data detected in response from '" + name + "': " + *hit);

        SecurityAlert alert;
        alert.server = name;
        alert.threat = "Sensitive data in response: " + *hit;
        alert.content = excerpt(payload, ALERT_EXCERPT_LENGTH);
        channel_.publish_alert(alert);

        AuditEntry entry;
        entry.server_name = name;
        entry.action = "response_scan";
        entry.message = payload;
        entry.was_blocked = false;
        entry.block_reason = alert.threat;
        entry.risk_level = alert.severity;
        entry.decision = "alert";
        entry.transport = transport;
        audit_.append(std::move(entry));
    });
}

void PolicyEngine::wait_idle() {
    alerts_.wait_idle();
}

} // namespace mcpguard
