#pragma once
#include "decision_channel.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mcpguard {

enum class ToolControlMode {
    Off,         // every tool allowed
    Monitor,     // log tool usage, never block
    ApproveNew,  // ask the approval handler for tools not yet whitelisted
    Strict       // only whitelisted tools run
};

enum class SecurityDetectionMode {
    Off,
    Monitor,     // audit suspicious payloads, never block
    Block        // block blocked patterns and medium/high risk payloads
};

[[nodiscard]] std::string to_string(ToolControlMode mode);
[[nodiscard]] std::string to_string(SecurityDetectionMode mode);
/// Throw ConfigError for unknown names.
[[nodiscard]] ToolControlMode tool_control_mode_from_string(const std::string& name);
[[nodiscard]] SecurityDetectionMode security_detection_mode_from_string(const std::string& name);

/// Matches every tool of a server.
constexpr const char* ALL_TOOLS = "*";

struct ToolRule {
    std::string server;
    std::string tool;

    bool operator==(const ToolRule& o) const { return server == o.server && tool == o.tool; }
};

/// Set of (server, tool) rules with wildcard support.
class ToolRuleSet {
public:
    /// Adding ALL_TOOLS drops the server's individual entries.
    void add(const std::string& server, const std::string& tool);
    bool remove(const std::string& server, const std::string& tool);
    void remove_server(const std::string& server);

    /// Exact tool match or a wildcard entry for the server.
    [[nodiscard]] bool matches(const std::string& server, const std::string& tool) const;
    [[nodiscard]] bool covers_server(const std::string& server) const;

    [[nodiscard]] const std::vector<ToolRule>& rules() const { return rules_; }
    [[nodiscard]] bool empty() const { return rules_.empty(); }

private:
    std::vector<ToolRule> rules_;
};

void to_json(nlohmann::json& j, const ToolRuleSet& set);
void from_json(const nlohmann::json& j, ToolRuleSet& set);

struct GuardRailsConfig {
    ToolControlMode tool_control{ToolControlMode::Off};
    SecurityDetectionMode security_detection{SecurityDetectionMode::Off};
    ToolRuleSet blacklist;
    ToolRuleSet whitelist;
    std::vector<std::string> blocked_patterns;

    [[nodiscard]] bool enabled() const {
        return tool_control != ToolControlMode::Off ||
               security_detection != SecurityDetectionMode::Off;
    }
};

enum class RiskLevel { None, Low, Medium, High };

[[nodiscard]] std::string to_string(RiskLevel level);

/// Heuristic scan for dangerous command fragments and sensitive paths.
/// Command fragments match case-insensitively, paths exactly.
[[nodiscard]] std::vector<std::string> detect_risks(const std::string& payload);

/// High for three or more risks or any "rm -rf" / "credential" hit,
/// medium for two, low for one.
[[nodiscard]] RiskLevel calculate_risk_level(const std::vector<std::string>& risks);

/// Tool a decision request is about: the explicit tool name, else the part
/// after ':' in the method, else the last '/' component of the method.
[[nodiscard]] std::string resolve_tool_name(const DecisionRequest& request);

enum class ApprovalResult { ApproveOnce, ApproveAlways, BlockOnce, BlockAlways };

/// Asked about tools not yet whitelisted in ApproveNew mode.
using ApprovalHandler = std::function<ApprovalResult(const DecisionRequest&, const std::string& tool)>;

/// Automated decision backend.
///
/// decide() is a DecisionHandler: wrap it in a LocalDecisionChannel to plug
/// it into the policy engine. Blacklist entries are checked before anything
/// else and always win.
class GuardRails {
public:
    explicit GuardRails(GuardRailsConfig config = {}, ApprovalHandler approval = {});

    [[nodiscard]] DecisionResponse decide(const DecisionRequest& request);

    [[nodiscard]] DecisionHandler handler();

    /// Whitelisting a tool removes a matching blacklist entry and vice versa.
    void whitelist(const std::string& server, const std::string& tool);
    void blacklist(const std::string& server, const std::string& tool);
    void trust_all_tools(const std::string& server);
    void block_all_tools(const std::string& server);

    [[nodiscard]] bool is_whitelisted(const std::string& server, const std::string& tool) const;
    [[nodiscard]] bool is_blacklisted(const std::string& server, const std::string& tool) const;

    void set_tool_control(ToolControlMode mode);
    void set_security_detection(SecurityDetectionMode mode);
    void add_blocked_pattern(const std::string& pattern);

    [[nodiscard]] GuardRailsConfig config() const;

private:
    DecisionResponse analyze_security(const DecisionRequest& request, const std::string& tool,
                                      SecurityDetectionMode mode) const;

    mutable std::mutex mutex_;
    GuardRailsConfig config_;
    ApprovalHandler approval_;
};

} // namespace mcpguard
