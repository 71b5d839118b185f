/// mcpguard-stdio: policy-enforcing proxy in front of a stdio MCP server.
///
/// Launched in place of the server. The real command comes from
/// MCP_ORIGINAL_COMMAND and MCP_ORIGINAL_ARGS_B64 (or MCP_ORIGINAL_ARGS);
/// MCP_SERVER_NAME names it for trust checks and MCP_LOG_PATH receives the
/// traffic log. The exit status is the server's.

#include <mcpguard/mcpguard.hpp>

#include <csignal>
#include <cstdio>
#include <pthread.h>
#include <thread>

int main() {
    using namespace mcpguard;

    // Termination signals are taken by a dedicated thread and turned into a
    // clean stop. Spawned servers reset the mask before exec.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    EnvMap env = current_environment();

    StdioLaunchSpec spec;
    std::unique_ptr<GuardRuntime> runtime;
    try {
        spec = StdioLaunchSpec::from_env(env);
        runtime = std::make_unique<GuardRuntime>(ProxyConfig::load_default());
    } catch (const GuardError& e) {
        std::fprintf(stderr, "mcpguard-stdio: %s\n", e.what());
        return 1;
    }

    EnvMap child_env = resolve_secrets(sanitize_environment(env), runtime->secrets());
    MessageLog traffic(spec.log_path, spec.server_name);
    StdioProxySession session(spec, std::move(child_env), runtime->policy(), &traffic);

    std::thread([&session, signals] {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            log::info("Received signal " + std::to_string(sig) + ", stopping server");
            session.stop();
        }
    }).detach();

    try {
        int code = session.run();
        runtime->policy().wait_idle();
        return code;
    } catch (const SpawnError& e) {
        std::fprintf(stderr, "mcpguard-stdio: %s\n", e.what());
        traffic.write(direction::Error, e.what());
        return 1;
    } catch (const GuardError& e) {
        std::fprintf(stderr, "mcpguard-stdio: %s\n", e.what());
        return 1;
    }
}
