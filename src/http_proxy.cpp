#include "mcpguard/http_proxy.hpp"
#include "mcpguard/codec.hpp"
#include "mcpguard/environment.hpp"
#include "mcpguard/error.hpp"
#include "mcpguard/log.hpp"
#include "mcpguard/url.hpp"
#include "mcpguard/uuid.hpp"
#include "mcpguard/version.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace mcpguard {

namespace {

constexpr const char* TRANSPORT = "http";
constexpr const char* JSON_TYPE = "application/json";

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// httplib frames the relayed body itself.
bool is_framing_header(const std::string& name) {
    for (const char* h : {"Transfer-Encoding", "Connection", "Keep-Alive",
                          "Content-Length", "Content-Type"}) {
        if (iequals(name, h)) return true;
    }
    return false;
}

} // anonymous namespace

// ---- SessionToken ----

std::string SessionToken::get_or_create() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!value_) {
        value_ = generate_uuid();
        log::debug("Generated session id " + *value_);
    }
    return *value_;
}

void SessionToken::update(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token.empty() || value_ == token) return;
    log::info("Upstream assigned session id " + token);
    value_ = token;
}

std::optional<std::string> SessionToken::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
}

// ---- HttpProxySession ----

HttpProxySession::HttpProxySession(HttpLaunchSpec spec, PolicyEngine& policy,
                                   MessageLog* traffic, const ISecretStore* secrets)
    : HttpProxySession(std::move(spec), policy, traffic, secrets, Options{}) {
}

HttpProxySession::HttpProxySession(HttpLaunchSpec spec, PolicyEngine& policy,
                                   MessageLog* traffic, const ISecretStore* secrets,
                                   Options opts)
    : spec_(std::move(spec))
    , policy_(policy)
    , traffic_(traffic)
    , opts_(std::move(opts))
    , identity_(ServerIdentity::for_url(spec_.server_name, spec_.target_url))
    , server_(std::make_unique<httplib::Server>()) {
    UrlParts parts = split_url(spec_.target_url);
    origin_ = parts.origin;
    path_ = parts.path;

    for (const auto& [k, v] : spec_.headers) {
        static_headers_.emplace_back(k, secrets ? substitute_secrets(v, *secrets) : v);
    }
    setup_routes();
}

HttpProxySession::~HttpProxySession() {
    stop();
}

void HttpProxySession::setup_routes() {
    // One worker and one request per connection.
    server_->new_task_queue = [] { return new httplib::ThreadPool(1); };
    server_->set_keep_alive_max_count(1);
    server_->set_read_timeout(opts_.client_timeout);
    server_->set_payload_max_length(opts_.max_request_bytes);

    server_->Post(".*", [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    });
}

uint16_t HttpProxySession::bind() {
    int port = -1;
    if (spec_.local_port == 0) {
        port = server_->bind_to_any_port(opts_.bind_host);
    } else if (server_->bind_to_port(opts_.bind_host, spec_.local_port)) {
        port = spec_.local_port;
    }
    if (port <= 0) {
        throw TransportError("Failed to bind " + opts_.bind_host + ":" +
                             std::to_string(spec_.local_port));
    }
    port_ = static_cast<uint16_t>(port);
    bound_ = true;

    log::info("HTTP proxy for '" + identity_.display_name + "' listening on " +
              opts_.bind_host + ":" + std::to_string(port_) + " -> " + spec_.target_url);
    if (opts_.announce_port) {
        std::printf("PROXY_PORT:%u\n", static_cast<unsigned>(port_));
        std::fflush(stdout);
    }
    return port_;
}

void HttpProxySession::serve() {
    if (!bound_) {
        throw TransportError("HTTP proxy is not bound");
    }
    if (!server_->listen_after_bind()) {
        log::error("HTTP proxy listener failed on port " + std::to_string(port_));
    }
    bound_ = false;
    log::info("HTTP proxy stopped");
}

void HttpProxySession::run() {
    bind();
    serve();
}

void HttpProxySession::stop() {
    if (server_) server_->stop();
}

void HttpProxySession::handle(const httplib::Request& req, httplib::Response& res) {
    trace(direction::ClientToProxy, req.body);

    std::optional<nlohmann::json> request_id;
    try {
        Message msg = Codec::parse(req.body);
        request_id = msg.id;

        PolicyDecision decision = policy_.evaluate(msg, req.body, identity_, TRANSPORT);
        if (!decision.allowed) {
            std::string body = Codec::make_block_response(
                msg, decision.reason.value_or("Request blocked by security policy"));
            trace(direction::ProxyToClient, body);
            res.status = 200;
            res.set_content(body, JSON_TYPE);
            return;
        }
    } catch (const ParseError& e) {
        log::debug(std::string("Forwarding unparsed body: ") + e.what());
    }

    trace(direction::ClientToServer, req.body);

    try {
        forward(req, res);
    } catch (const std::exception& e) {
        log::error(std::string("Upstream request failed: ") + e.what());
        trace(direction::Error, e.what());
        bad_gateway(request_id, e.what(), res);
    }
}

void HttpProxySession::forward(const httplib::Request& req, httplib::Response& res) {
    httplib::Client client(origin_);
    client.set_connection_timeout(opts_.upstream_connect_timeout);
    client.set_read_timeout(opts_.upstream_read_timeout);

    httplib::Headers headers;
    headers.emplace("Accept", "application/json, text/event-stream");
    for (const auto& [k, v] : static_headers_) {
        if (iequals(k, "Content-Type") || iequals(k, std::string(SESSION_HEADER))) continue;
        headers.emplace(k, v);
    }
    if (req.has_header("MCP-Protocol-Version")) {
        headers.emplace("MCP-Protocol-Version", req.get_header_value("MCP-Protocol-Version"));
    }
    headers.emplace(std::string(SESSION_HEADER), token_.get_or_create());

    auto upstream = client.Post(path_, headers, req.body, JSON_TYPE);
    if (!upstream) {
        throw TransportError(httplib::to_string(upstream.error()));
    }

    const std::string session_header(SESSION_HEADER);
    if (upstream->has_header(session_header)) {
        token_.update(upstream->get_header_value(session_header));
    }

    trace(direction::ServerToClient, upstream->body);
    if (!upstream->body.empty()) {
        policy_.inspect_response(upstream->body, identity_, TRANSPORT);
    }

    res.status = upstream->status;
    for (const auto& [k, v] : upstream->headers) {
        if (!is_framing_header(k)) res.set_header(k, v);
    }
    std::string content_type = upstream->get_header_value("Content-Type");
    res.set_content(upstream->body, content_type.empty() ? JSON_TYPE : content_type);
}

void HttpProxySession::bad_gateway(const std::optional<nlohmann::json>& id,
                                   const std::string& detail, httplib::Response& res) {
    nlohmann::json body = {
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"id", id.value_or(nullptr)},
        {"error", {{"code", error::BadGateway}, {"message", "Bad Gateway: " + detail}}}
    };
    std::string text = body.dump();
    trace(direction::ProxyToClient, text);
    res.status = 502;
    res.set_content(text, JSON_TYPE);
}

void HttpProxySession::trace(const char* dir, const std::string& content) {
    if (traffic_) traffic_->write(dir, content);
}

} // namespace mcpguard
