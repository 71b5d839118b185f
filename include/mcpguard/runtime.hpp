#pragma once
#include "audit_log.hpp"
#include "config.hpp"
#include "decision_channel.hpp"
#include "guard_rails.hpp"
#include "policy_engine.hpp"
#include "secret_store.hpp"
#include "trust_store.hpp"
#include <memory>

namespace mcpguard {

/// Everything a proxy process shares between its sessions, built from a
/// ProxyConfig.
///
/// Decisions go to the HTTP decision service when decision_url is set, and
/// to an in-process GuardRails otherwise.
class GuardRuntime {
public:
    explicit GuardRuntime(ProxyConfig config);
    ~GuardRuntime();

    GuardRuntime(const GuardRuntime&) = delete;
    GuardRuntime& operator=(const GuardRuntime&) = delete;

    [[nodiscard]] const ProxyConfig& config() const { return config_; }
    [[nodiscard]] TrustStore& trust() { return *trust_; }
    [[nodiscard]] AuditLog& audit() { return audit_; }
    [[nodiscard]] const ISecretStore& secrets() const { return *secrets_; }
    [[nodiscard]] IDecisionChannel& channel() { return *channel_; }
    [[nodiscard]] PolicyEngine& policy() { return *policy_; }

    /// Null when decisions go to a remote service.
    [[nodiscard]] GuardRails* guard_rails() { return guard_rails_.get(); }

private:
    ProxyConfig config_;
    std::unique_ptr<TrustStore> trust_;
    AuditLog audit_;
    std::unique_ptr<JsonSecretStore> secrets_;
    std::unique_ptr<GuardRails> guard_rails_;
    std::unique_ptr<IDecisionChannel> channel_;
    std::unique_ptr<PolicyEngine> policy_;
};

} // namespace mcpguard
