#include "mcpguard/runtime.hpp"
#include "mcpguard/log.hpp"

namespace mcpguard {

GuardRuntime::GuardRuntime(ProxyConfig config)
    : config_(std::move(config))
    , trust_(std::make_unique<TrustStore>(config_.trust_store_path))
    , audit_(config_.audit_capacity)
    , secrets_(std::make_unique<JsonSecretStore>(config_.secrets_path)) {
    if (config_.decision_url) {
        HttpDecisionChannel::Options opts;
        opts.base_url = *config_.decision_url;
        opts.read_timeout = config_.decision_timeout;
        channel_ = std::make_unique<HttpDecisionChannel>(std::move(opts));
        log::info("Policy decisions go to " + *config_.decision_url);
    } else {
        guard_rails_ = std::make_unique<GuardRails>(config_.guard_rails);
        channel_ = std::make_unique<LocalDecisionChannel>(guard_rails_->handler());
    }
    policy_ = std::make_unique<PolicyEngine>(config_.policy_options(), *trust_, audit_, *channel_);
}

GuardRuntime::~GuardRuntime() = default;

} // namespace mcpguard
