/// mcpguard-http: policy-enforcing proxy in front of a remote MCP server.
///
/// Listens on 127.0.0.1:MCP_LOCAL_PORT (ephemeral when unset) and prints
/// PROXY_PORT:<n> once bound. Requests go to MCP_TARGET_URL with the
/// headers from MCP_TARGET_HEADERS.

#include <mcpguard/mcpguard.hpp>

#include <csignal>
#include <cstdio>
#include <pthread.h>
#include <thread>

int main() {
    using namespace mcpguard;

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    HttpLaunchSpec spec;
    std::unique_ptr<GuardRuntime> runtime;
    try {
        spec = HttpLaunchSpec::from_env(current_environment());
        runtime = std::make_unique<GuardRuntime>(ProxyConfig::load_default());
    } catch (const GuardError& e) {
        std::fprintf(stderr, "mcpguard-http: %s\n", e.what());
        return 1;
    }

    MessageLog traffic(spec.log_path, spec.server_name);
    HttpProxySession session(spec, runtime->policy(), &traffic, &runtime->secrets());

    try {
        session.bind();
    } catch (const TransportError& e) {
        std::fprintf(stderr, "mcpguard-http: %s\n", e.what());
        return 1;
    }

    std::thread([&session, signals] {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            log::info("Received signal " + std::to_string(sig) + ", shutting down");
            session.stop();
        }
    }).detach();

    session.serve();
    runtime->policy().wait_idle();
    return 0;
}
