#include "mcpguard/decision_channel.hpp"
#include "mcpguard/error.hpp"
#include "mcpguard/log.hpp"
#include "mcpguard/url.hpp"

#include <httplib.h>

namespace mcpguard {

// ---- JSON mapping ----

void to_json(nlohmann::json& j, const DecisionRequest& r) {
    j = nlohmann::json{
        {"server", r.server},
        {"message", r.message},
        {"method", r.method},
        {"responseChannel", r.response_channel}
    };
    if (r.tool_name) j["toolName"] = *r.tool_name;
}

void from_json(const nlohmann::json& j, DecisionRequest& r) {
    r.server = j.at("server").get<std::string>();
    r.message = j.at("message").get<std::string>();
    r.method = j.value("method", std::string{});
    r.response_channel = j.value("responseChannel", std::string{});
    r.tool_name.reset();
    if (j.contains("toolName") && j.at("toolName").is_string()) {
        r.tool_name = j.at("toolName").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const DecisionResponse& r) {
    j = nlohmann::json{{"allowed", r.allowed}};
    if (r.reason) j["reason"] = *r.reason;
    if (r.decision) j["decision"] = *r.decision;
    if (r.risk_level) j["riskLevel"] = *r.risk_level;
    if (!r.concerns.empty()) j["concerns"] = r.concerns;
    if (r.ai_analysis) j["aiAnalysis"] = *r.ai_analysis;
}

void from_json(const nlohmann::json& j, DecisionResponse& r) {
    if (!j.is_object() || !j.contains("allowed") || !j.at("allowed").is_boolean()) {
        throw ParseError("Decision response must be an object with a boolean 'allowed'");
    }
    r.allowed = j.at("allowed").get<bool>();
    r.reason.reset();
    r.decision.reset();
    r.risk_level.reset();
    r.concerns.clear();
    r.ai_analysis.reset();
    if (j.contains("reason") && j.at("reason").is_string()) {
        r.reason = j.at("reason").get<std::string>();
    }
    if (j.contains("decision") && j.at("decision").is_string()) {
        r.decision = j.at("decision").get<std::string>();
    }
    if (j.contains("riskLevel") && j.at("riskLevel").is_string()) {
        r.risk_level = j.at("riskLevel").get<std::string>();
    }
    if (j.contains("concerns") && j.at("concerns").is_array()) {
        for (const auto& c : j.at("concerns")) {
            if (c.is_string()) r.concerns.push_back(c.get<std::string>());
        }
    }
    if (j.contains("aiAnalysis") && !j.at("aiAnalysis").is_null()) {
        r.ai_analysis = j.at("aiAnalysis");
    }
}

void to_json(nlohmann::json& j, const SecurityAlert& a) {
    j = nlohmann::json{
        {"server", a.server},
        {"threat", a.threat},
        {"severity", a.severity},
        {"content", a.content}
    };
}

// ---- PendingDecisions ----

std::future<DecisionResponse> PendingDecisions::open(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = pending_.try_emplace(token);
    if (!inserted) {
        throw GuardError("Duplicate decision token: " + token);
    }
    return it->second.get_future();
}

bool PendingDecisions::resolve(const std::string& token, DecisionResponse response) {
    std::promise<DecisionResponse> p;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(token);
        if (it == pending_.end()) return false;
        p = std::move(it->second);
        pending_.erase(it);
    }
    p.set_value(std::move(response));
    return true;
}

bool PendingDecisions::fail(const std::string& token, std::exception_ptr error) {
    std::promise<DecisionResponse> p;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(token);
        if (it == pending_.end()) return false;
        p = std::move(it->second);
        pending_.erase(it);
    }
    p.set_exception(std::move(error));
    return true;
}

void PendingDecisions::cancel(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(token);
}

bool PendingDecisions::contains(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(token) > 0;
}

void PendingDecisions::fail_all(const std::string& reason) {
    std::unordered_map<std::string, std::promise<DecisionResponse>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }
    for (auto& [token, p] : drained) {
        p.set_exception(std::make_exception_ptr(TransportError(reason)));
    }
}

size_t PendingDecisions::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

// ---- LocalDecisionChannel ----

LocalDecisionChannel::LocalDecisionChannel(DecisionHandler handler, AlertHandler on_alert,
                                           size_t workers)
    : handler_(std::move(handler))
    , on_alert_(std::move(on_alert))
    , workers_("decision-handler", workers)
    , alerts_("decision-alerts") {
}

LocalDecisionChannel::~LocalDecisionChannel() {
    shutdown();
}

std::future<DecisionResponse> LocalDecisionChannel::submit(DecisionRequest request) {
    std::string token = request.response_channel;
    auto fut = pending_.open(token);

    if (!handler_) {
        pending_.fail(token, std::make_exception_ptr(
            TransportError("No decision handler is listening")));
        return fut;
    }

    bool queued = workers_.post([this, token, req = std::move(request)] {
        if (!pending_.contains(token)) return;
        try {
            pending_.resolve(token, handler_(req));
        } catch (const std::exception&) {
            pending_.fail(token, std::current_exception());
        }
    });
    if (!queued) {
        pending_.fail(token, std::make_exception_ptr(
            TransportError("Decision channel is shut down")));
    }
    return fut;
}

void LocalDecisionChannel::cancel(const std::string& token) {
    pending_.cancel(token);
}

void LocalDecisionChannel::publish_alert(const SecurityAlert& alert) {
    if (!on_alert_) return;
    alerts_.post([this, alert] { on_alert_(alert); });
}

void LocalDecisionChannel::shutdown() {
    workers_.stop();
    alerts_.stop();
    pending_.fail_all("Decision channel is shut down");
}

// ---- HttpDecisionChannel ----

HttpDecisionChannel::HttpDecisionChannel(Options opts)
    : opts_(std::move(opts))
    , decisions_("decision-http", opts_.workers)
    , alerts_("alert-http") {
    UrlParts parts = split_url(opts_.base_url);
    origin_ = parts.origin;
    path_prefix_ = parts.path;
}

HttpDecisionChannel::~HttpDecisionChannel() {
    shutdown();
}

std::unique_ptr<httplib::Client> HttpDecisionChannel::make_client() const {
    auto client = std::make_unique<httplib::Client>(origin_);
    client->set_connection_timeout(opts_.connect_timeout);
    client->set_read_timeout(opts_.read_timeout);
    return client;
}

void HttpDecisionChannel::post_decision(const DecisionRequest& request) {
    auto client = make_client();

    httplib::Headers headers;
    for (const auto& [k, v] : opts_.headers) headers.emplace(k, v);

    nlohmann::json body = request;
    auto res = client->Post(join_path(path_prefix_, "decisions"), headers,
                            body.dump(), "application/json");
    if (!res) {
        throw TransportError("Decision service unreachable: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw TransportError("Decision service answered HTTP " + std::to_string(res->status));
    }

    DecisionResponse response;
    try {
        response = nlohmann::json::parse(res->body).get<DecisionResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("Malformed decision response: ") + e.what());
    }
    pending_.resolve(request.response_channel, std::move(response));
}

std::future<DecisionResponse> HttpDecisionChannel::submit(DecisionRequest request) {
    std::string token = request.response_channel;
    auto fut = pending_.open(token);

    bool queued = decisions_.post([this, token, req = std::move(request)] {
        if (!pending_.contains(token)) {
            log::debug("Skipping decision " + token + ": caller stopped waiting");
            return;
        }
        try {
            post_decision(req);
        } catch (const std::exception& e) {
            log::warn(std::string("Decision call-out failed: ") + e.what());
            pending_.fail(token, std::current_exception());
        }
    });
    if (!queued) {
        pending_.fail(token, std::make_exception_ptr(
            TransportError("Decision channel is shut down")));
    }
    return fut;
}

void HttpDecisionChannel::cancel(const std::string& token) {
    pending_.cancel(token);
}

void HttpDecisionChannel::publish_alert(const SecurityAlert& alert) {
    alerts_.post([this, alert] {
        auto client = make_client();
        httplib::Headers headers;
        for (const auto& [k, v] : opts_.headers) headers.emplace(k, v);
        nlohmann::json body = alert;
        auto res = client->Post(join_path(path_prefix_, "alerts"), headers,
                                body.dump(), "application/json");
        if (!res) {
            log::warn("Alert delivery failed: " + httplib::to_string(res.error()));
        } else if (res->status >= 300) {
            log::warn("Alert delivery answered HTTP " + std::to_string(res->status));
        }
    });
}

void HttpDecisionChannel::shutdown() {
    decisions_.stop();
    alerts_.stop();
    pending_.fail_all("Decision channel is shut down");
}

} // namespace mcpguard
