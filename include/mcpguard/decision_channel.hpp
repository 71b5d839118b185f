#pragma once
#include "serial_executor.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace httplib { class Client; }

namespace mcpguard {

/// Question put to a decision backend for one message.
struct DecisionRequest {
    std::string server;
    std::string message;                   // raw payload
    std::optional<std::string> tool_name;
    std::string method;                    // effective method
    std::string response_channel;          // single-use correlation token
};

/// Verdict from a decision backend.
struct DecisionResponse {
    bool allowed{false};
    std::optional<std::string> reason;
    std::optional<std::string> decision;
    std::optional<std::string> risk_level;
    std::vector<std::string> concerns;
    std::optional<nlohmann::json> ai_analysis;
};

/// Raised when a server response carries sensitive content.
struct SecurityAlert {
    std::string server;
    std::string threat;
    std::string severity{"critical"};
    std::string content;                   // truncated excerpt
};

void to_json(nlohmann::json& j, const DecisionRequest& r);
void from_json(const nlohmann::json& j, DecisionRequest& r);
void to_json(nlohmann::json& j, const DecisionResponse& r);
void from_json(const nlohmann::json& j, DecisionResponse& r);
void to_json(nlohmann::json& j, const SecurityAlert& a);

/// Asynchronous request/response link to whoever makes policy decisions.
///
/// submit() never blocks on the backend. The returned future is satisfied
/// with a response, or holds an exception when the backend fails. Callers
/// bound the wait themselves and cancel() the token when they give up.
class IDecisionChannel {
public:
    virtual ~IDecisionChannel() = default;

    virtual std::future<DecisionResponse> submit(DecisionRequest request) = 0;

    /// Forget a request whose caller stopped waiting.
    virtual void cancel(const std::string& /*token*/) {}

    /// Fire-and-forget notification about a suspicious response.
    virtual void publish_alert(const SecurityAlert& /*alert*/) {}
};

/// Correlation table: token -> promise.
class PendingDecisions {
public:
    /// Register a token. Throws GuardError if it is already in use.
    std::future<DecisionResponse> open(const std::string& token);

    /// Satisfy and remove. False if the token is unknown (cancelled or done).
    bool resolve(const std::string& token, DecisionResponse response);
    bool fail(const std::string& token, std::exception_ptr error);

    void cancel(const std::string& token);

    /// True while the token still has a waiting caller.
    [[nodiscard]] bool contains(const std::string& token) const;

    /// Fail every outstanding request with TransportError(reason).
    void fail_all(const std::string& reason);

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::promise<DecisionResponse>> pending_;
};

/// Backend that decides in-process (GuardRails, a human approval bridge).
using DecisionHandler = std::function<DecisionResponse(const DecisionRequest&)>;
using AlertHandler = std::function<void(const SecurityAlert&)>;

/// Runs a DecisionHandler on a small worker pool. The handler must be
/// thread-safe. Requests cancelled before a worker picks them up are skipped.
class LocalDecisionChannel : public IDecisionChannel {
public:
    explicit LocalDecisionChannel(DecisionHandler handler, AlertHandler on_alert = {},
                                  size_t workers = 4);
    ~LocalDecisionChannel() override;

    std::future<DecisionResponse> submit(DecisionRequest request) override;
    void cancel(const std::string& token) override;
    void publish_alert(const SecurityAlert& alert) override;

    /// Stop accepting work and fail what is still outstanding.
    void shutdown();

    [[nodiscard]] size_t outstanding() const { return pending_.size(); }

private:
    DecisionHandler handler_;
    AlertHandler on_alert_;
    PendingDecisions pending_;
    WorkerPool workers_;
    SerialExecutor alerts_;
};

/// Decision service reached over HTTP.
///
/// Requests are POSTed as JSON to <base_url>/decisions and must be answered
/// with a DecisionResponse object. Alerts go to <base_url>/alerts. Each
/// request gets its own client on a pool worker; a request cancelled while
/// queued is never sent.
class HttpDecisionChannel : public IDecisionChannel {
public:
    struct Options {
        std::string base_url = "http://127.0.0.1:7821";
        std::chrono::seconds connect_timeout{5};
        /// Keep at or below the caller's decision timeout.
        std::chrono::milliseconds read_timeout{30000};
        size_t workers = 4;
        std::vector<std::pair<std::string, std::string>> headers;
    };

    explicit HttpDecisionChannel(Options opts);
    ~HttpDecisionChannel() override;

    std::future<DecisionResponse> submit(DecisionRequest request) override;
    void cancel(const std::string& token) override;
    void publish_alert(const SecurityAlert& alert) override;

    void shutdown();

private:
    void post_decision(const DecisionRequest& request);

    [[nodiscard]] std::unique_ptr<httplib::Client> make_client() const;

    Options opts_;
    std::string origin_;       // scheme://host[:port]
    std::string path_prefix_;
    PendingDecisions pending_;
    WorkerPool decisions_;
    SerialExecutor alerts_;
};

} // namespace mcpguard
