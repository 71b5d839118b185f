#pragma once
#include "config.hpp"
#include "message_log.hpp"
#include "policy_engine.hpp"
#include "secret_store.hpp"
#include "server_identity.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace mcpguard {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// Session affinity token for one upstream.
///
/// Starts empty. The first request gets a random UUID; any token the server
/// sends back replaces it for every later request.
class SessionToken {
public:
    [[nodiscard]] std::string get_or_create();
    void update(const std::string& token);
    [[nodiscard]] std::optional<std::string> current() const;

private:
    mutable std::mutex mutex_;
    std::optional<std::string> value_;
};

/// Local HTTP listener in front of a remote MCP server.
///
/// Served by httplib::Server with a single worker and no keep-alive, so one
/// connection is handled at a time and closed after its response. Every
/// POST body runs the policy path and is forwarded upstream as a POST.
/// Blocked requests get a 200 with a JSON-RPC error; upstream failures get
/// a 502.
class HttpProxySession {
public:
    struct Options {
        std::string bind_host = "127.0.0.1";
        std::chrono::seconds client_timeout{10};
        std::chrono::seconds upstream_connect_timeout{10};
        std::chrono::seconds upstream_read_timeout{60};
        size_t max_request_bytes = 16 * 1024 * 1024;
        bool announce_port = true;
    };

    /// Header values may hold `${KEYCHAIN:name}` placeholders; they are
    /// resolved through `secrets` when given.
    HttpProxySession(HttpLaunchSpec spec, PolicyEngine& policy, MessageLog* traffic = nullptr,
                     const ISecretStore* secrets = nullptr);
    HttpProxySession(HttpLaunchSpec spec, PolicyEngine& policy, MessageLog* traffic,
                     const ISecretStore* secrets, Options opts);
    ~HttpProxySession();

    HttpProxySession(const HttpProxySession&) = delete;
    HttpProxySession& operator=(const HttpProxySession&) = delete;

    /// Bind the listening socket. Returns the bound port. Throws TransportError.
    uint16_t bind();

    /// Serve until stop(). Throws TransportError if bind() was not called.
    void serve();

    /// bind() + serve().
    void run();

    void stop();

    /// Policy path and upstream relay for one client request. Never throws.
    void handle(const httplib::Request& req, httplib::Response& res);

    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] std::optional<std::string> session_token() const { return token_.current(); }
    [[nodiscard]] const ServerIdentity& identity() const { return identity_; }

private:
    void setup_routes();
    void forward(const httplib::Request& req, httplib::Response& res);
    void bad_gateway(const std::optional<nlohmann::json>& id, const std::string& detail,
                     httplib::Response& res);
    void trace(const char* dir, const std::string& content);

    HttpLaunchSpec spec_;
    PolicyEngine& policy_;
    MessageLog* traffic_;
    Options opts_;
    ServerIdentity identity_;
    std::string origin_;
    std::string path_;
    HeaderList static_headers_;
    SessionToken token_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> bound_{false};
    uint16_t port_{0};
};

} // namespace mcpguard
