#include "mcpguard/guard_rails.hpp"
#include "mcpguard/error.hpp"
#include "mcpguard/log.hpp"

#include <algorithm>
#include <cctype>

namespace mcpguard {

namespace {

const std::vector<std::string> DANGEROUS_FRAGMENTS = {
    "rm -rf", "del /f", "format", "fdisk",
    "eval(", "exec(", "system(",
    "subprocess", "shell",
    "../", "..\\",
    "password", "token", "secret", "key", "credential"
};

const std::vector<std::string> SENSITIVE_PATHS = {
    "/etc/", "/System/", "/Users/", "C:\\Windows\\",
    "~/.ssh/", "~/.aws/", "~/.config/"
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

DecisionResponse blocked(std::string reason, std::optional<std::string> risk = std::nullopt) {
    DecisionResponse r;
    r.allowed = false;
    r.decision = "blocked";
    r.reason = std::move(reason);
    r.risk_level = std::move(risk);
    return r;
}

DecisionResponse allowed(std::optional<std::string> risk = std::nullopt) {
    DecisionResponse r;
    r.allowed = true;
    r.decision = "allowed";
    r.risk_level = std::move(risk);
    return r;
}

} // anonymous namespace

// ---- Modes ----

std::string to_string(ToolControlMode mode) {
    switch (mode) {
        case ToolControlMode::Off:        return "off";
        case ToolControlMode::Monitor:    return "monitor";
        case ToolControlMode::ApproveNew: return "approve_new";
        case ToolControlMode::Strict:     return "strict";
    }
    return "off";
}

std::string to_string(SecurityDetectionMode mode) {
    switch (mode) {
        case SecurityDetectionMode::Off:     return "off";
        case SecurityDetectionMode::Monitor: return "monitor";
        case SecurityDetectionMode::Block:   return "block";
    }
    return "off";
}

ToolControlMode tool_control_mode_from_string(const std::string& name) {
    if (name == "off") return ToolControlMode::Off;
    if (name == "monitor") return ToolControlMode::Monitor;
    if (name == "approve_new") return ToolControlMode::ApproveNew;
    if (name == "strict") return ToolControlMode::Strict;
    throw ConfigError("Unknown tool control mode: '" + name + "'");
}

SecurityDetectionMode security_detection_mode_from_string(const std::string& name) {
    if (name == "off") return SecurityDetectionMode::Off;
    if (name == "monitor") return SecurityDetectionMode::Monitor;
    if (name == "block") return SecurityDetectionMode::Block;
    throw ConfigError("Unknown security detection mode: '" + name + "'");
}

std::string to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::None:   return "none";
        case RiskLevel::Low:    return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High:   return "high";
    }
    return "none";
}

// ---- ToolRuleSet ----

void ToolRuleSet::add(const std::string& server, const std::string& tool) {
    if (tool == ALL_TOOLS) {
        rules_.erase(std::remove_if(rules_.begin(), rules_.end(),
                                    [&](const ToolRule& r) { return r.server == server; }),
                     rules_.end());
    } else if (covers_server(server) ||
               std::find(rules_.begin(), rules_.end(), ToolRule{server, tool}) != rules_.end()) {
        return;
    }
    rules_.push_back({server, tool});
}

bool ToolRuleSet::remove(const std::string& server, const std::string& tool) {
    auto it = std::find(rules_.begin(), rules_.end(), ToolRule{server, tool});
    if (it == rules_.end()) return false;
    rules_.erase(it);
    return true;
}

void ToolRuleSet::remove_server(const std::string& server) {
    rules_.erase(std::remove_if(rules_.begin(), rules_.end(),
                                [&](const ToolRule& r) { return r.server == server; }),
                 rules_.end());
}

bool ToolRuleSet::matches(const std::string& server, const std::string& tool) const {
    return std::any_of(rules_.begin(), rules_.end(), [&](const ToolRule& r) {
        return r.server == server && (r.tool == tool || r.tool == ALL_TOOLS);
    });
}

bool ToolRuleSet::covers_server(const std::string& server) const {
    return std::any_of(rules_.begin(), rules_.end(), [&](const ToolRule& r) {
        return r.server == server && r.tool == ALL_TOOLS;
    });
}

void to_json(nlohmann::json& j, const ToolRuleSet& set) {
    j = nlohmann::json::array();
    for (const auto& r : set.rules()) {
        j.push_back({{"server", r.server}, {"tool", r.tool}});
    }
}

void from_json(const nlohmann::json& j, ToolRuleSet& set) {
    if (!j.is_array()) {
        throw ConfigError("Tool rule list must be an array");
    }
    set = ToolRuleSet{};
    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("server") || !item.at("server").is_string()) {
            throw ConfigError("Tool rule needs a string 'server': " + item.dump());
        }
        set.add(item.at("server").get<std::string>(), item.value("tool", std::string(ALL_TOOLS)));
    }
}

// ---- Risk heuristics ----

std::vector<std::string> detect_risks(const std::string& payload) {
    std::vector<std::string> risks;
    std::string lowered = to_lower(payload);

    for (const auto& fragment : DANGEROUS_FRAGMENTS) {
        if (lowered.find(to_lower(fragment)) != std::string::npos) {
            risks.push_back("Dangerous operation: " + fragment);
        }
    }
    for (const auto& path : SENSITIVE_PATHS) {
        if (payload.find(path) != std::string::npos) {
            risks.push_back("Access to sensitive path: " + path);
        }
    }
    return risks;
}

RiskLevel calculate_risk_level(const std::vector<std::string>& risks) {
    if (risks.empty()) return RiskLevel::None;
    bool severe = std::any_of(risks.begin(), risks.end(), [](const std::string& r) {
        return r.find("rm -rf") != std::string::npos || r.find("credential") != std::string::npos;
    });
    if (risks.size() >= 3 || severe) return RiskLevel::High;
    if (risks.size() == 2) return RiskLevel::Medium;
    return RiskLevel::Low;
}

std::string resolve_tool_name(const DecisionRequest& request) {
    if (request.tool_name && !request.tool_name->empty()) return *request.tool_name;

    const std::string& method = request.method;
    auto colon = method.rfind(':');
    if (colon != std::string::npos) return method.substr(colon + 1);
    auto slash = method.rfind('/');
    if (slash != std::string::npos) return method.substr(slash + 1);
    return method;
}

// ---- GuardRails ----

GuardRails::GuardRails(GuardRailsConfig config, ApprovalHandler approval)
    : config_(std::move(config))
    , approval_(std::move(approval)) {
    log::debug("Guard rails: tool_control=" + to_string(config_.tool_control) +
               ", security_detection=" + to_string(config_.security_detection));
}

DecisionHandler GuardRails::handler() {
    return [this](const DecisionRequest& req) { return decide(req); };
}

DecisionResponse GuardRails::decide(const DecisionRequest& request) {
    const std::string tool = resolve_tool_name(request);

    ToolControlMode tool_mode;
    SecurityDetectionMode security_mode;
    bool listed_black;
    bool listed_white;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tool_mode = config_.tool_control;
        security_mode = config_.security_detection;
        listed_black = config_.blacklist.matches(request.server, tool);
        listed_white = config_.whitelist.matches(request.server, tool);
    }

    if (listed_black) {
        log::warn("Blocked blacklisted tool '" + tool + "' on " + request.server);
        return blocked("Tool is blacklisted: " + tool);
    }

    if (tool_mode != ToolControlMode::Off && !listed_white) {
        switch (tool_mode) {
            case ToolControlMode::Monitor:
                log::info("Tool not whitelisted, monitoring: " + tool);
                break;

            case ToolControlMode::ApproveNew: {
                if (!approval_) {
                    return blocked("New tool requires approval: " + tool, "new_tool");
                }
                ApprovalResult answer = approval_(request, tool);
                switch (answer) {
                    case ApprovalResult::ApproveAlways:
                        whitelist(request.server, tool);
                        return allowed("new_tool");
                    case ApprovalResult::ApproveOnce:
                        return allowed("new_tool");
                    case ApprovalResult::BlockAlways:
                        blacklist(request.server, tool);
                        return blocked("Tool use was not approved: " + tool, "new_tool");
                    case ApprovalResult::BlockOnce:
                        return blocked("Tool use was not approved: " + tool, "new_tool");
                }
                break;
            }

            case ToolControlMode::Strict:
                return blocked("Tool is not whitelisted: " + tool);

            case ToolControlMode::Off:
                break;
        }
    }

    if (security_mode != SecurityDetectionMode::Off) {
        return analyze_security(request, tool, security_mode);
    }
    return allowed();
}

DecisionResponse GuardRails::analyze_security(const DecisionRequest& request,
                                              const std::string& tool,
                                              SecurityDetectionMode mode) const {
    std::vector<std::string> patterns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        patterns = config_.blocked_patterns;
    }

    for (const auto& pattern : patterns) {
        if (pattern.empty() || request.message.find(pattern) == std::string::npos) continue;
        std::string reason = "Matches blocked pattern: " + pattern;
        if (mode == SecurityDetectionMode::Block) {
            log::warn("Blocked message from " + request.server + ": " + reason);
            return blocked(reason, "high");
        }
        DecisionResponse r = allowed("high");
        r.reason = reason;
        r.concerns.push_back(reason);
        return r;
    }

    std::vector<std::string> risks = detect_risks(request.message);
    if (risks.empty()) {
        DecisionResponse r = allowed(is_whitelisted(request.server, tool) ? "safe (whitelisted)" : "safe");
        r.ai_analysis = std::string("Pattern analysis: no risks detected");
        return r;
    }

    RiskLevel level = calculate_risk_level(risks);
    std::string summary = join(risks, ", ");
    DecisionResponse r;
    if (mode == SecurityDetectionMode::Block &&
        (level == RiskLevel::High || level == RiskLevel::Medium)) {
        log::warn("Blocked message from " + request.server + ": " + summary);
        r = blocked("Security risk detected: " + summary, to_string(level));
    } else {
        r = allowed(to_string(level));
    }
    r.concerns = std::move(risks);
    r.ai_analysis = "Pattern analysis: risks detected - " + summary;
    return r;
}

void GuardRails::whitelist(const std::string& server, const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.whitelist.add(server, tool);
    config_.blacklist.remove(server, tool);
    log::info("Added to whitelist: " + server + ":" + tool);
}

void GuardRails::blacklist(const std::string& server, const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.blacklist.add(server, tool);
    config_.whitelist.remove(server, tool);
    log::info("Added to blacklist: " + server + ":" + tool);
}

void GuardRails::trust_all_tools(const std::string& server) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.whitelist.add(server, ALL_TOOLS);
    config_.blacklist.remove_server(server);
    log::info("Trusted all tools from server: " + server);
}

void GuardRails::block_all_tools(const std::string& server) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.blacklist.add(server, ALL_TOOLS);
    config_.whitelist.remove_server(server);
    log::info("Blocked all tools from server: " + server);
}

bool GuardRails::is_whitelisted(const std::string& server, const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.whitelist.matches(server, tool);
}

bool GuardRails::is_blacklisted(const std::string& server, const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.blacklist.matches(server, tool);
}

void GuardRails::set_tool_control(ToolControlMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.tool_control = mode;
}

void GuardRails::set_security_detection(SecurityDetectionMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.security_detection = mode;
}

void GuardRails::add_blocked_pattern(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(config_.blocked_patterns.begin(), config_.blocked_patterns.end(), pattern) ==
        config_.blocked_patterns.end()) {
        config_.blocked_patterns.push_back(pattern);
    }
}

GuardRailsConfig GuardRails::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

} // namespace mcpguard
