#pragma once
#include "child_process.hpp"
#include "config.hpp"
#include "line_framer.hpp"
#include "message_log.hpp"
#include "policy_engine.hpp"
#include "serial_executor.hpp"
#include "server_identity.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <unistd.h>

namespace mcpguard {

/// Proxies a stdio server launched as a child process.
///
/// Four streams are wired: client stdin to child stdin through the policy
/// engine, child stdout to client stdout with response scanning, and child
/// stderr straight through to our stderr. Each input has its own reader
/// thread and framer; each output has its own writer queue, so a stalled
/// peer on one side never blocks the other direction. Client messages are
/// decided one at a time in arrival order.
class StdioProxySession {
public:
    struct Fds {
        int client_in = STDIN_FILENO;
        int client_out = STDOUT_FILENO;
        int diagnostics = STDERR_FILENO;
    };

    /// `child_env` is passed to the server as is; sanitize and resolve it
    /// before handing it over.
    StdioProxySession(StdioLaunchSpec spec, EnvMap child_env, PolicyEngine& policy,
                      MessageLog* traffic = nullptr);
    StdioProxySession(StdioLaunchSpec spec, EnvMap child_env, PolicyEngine& policy,
                      MessageLog* traffic, Fds fds);
    ~StdioProxySession();

    StdioProxySession(const StdioProxySession&) = delete;
    StdioProxySession& operator=(const StdioProxySession&) = delete;

    /// Spawn the server and proxy until it exits. Returns its exit code.
    /// Throws SpawnError if the server cannot be started.
    int run();

    /// Terminate the server; run() returns shortly after.
    void stop();

    [[nodiscard]] const ServerIdentity& identity() const { return identity_; }

private:
    void client_read_loop();
    void server_read_loop();
    void stderr_read_loop();

    /// Read `fd` until EOF or wakeup, handing each chunk to `on_chunk`.
    template <typename OnChunk>
    void pump(int fd, OnChunk&& on_chunk);

    void handle_client_line(const std::string& line);
    void handle_server_line(const std::string& line);

    void send_to_server(std::string line);
    void send_to_client(std::string line);
    void trace(const char* dir, const std::string& content);

    StdioLaunchSpec spec_;
    EnvMap child_env_;
    PolicyEngine& policy_;
    MessageLog* traffic_;
    Fds fds_;
    ServerIdentity identity_;

    ChildProcess child_;
    int wakeup_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};

    LineFramer client_framer_;
    LineFramer server_framer_;

    SerialExecutor processing_;
    SerialExecutor to_server_;
    SerialExecutor to_client_;

    std::thread client_reader_;
    std::thread server_reader_;
    std::thread stderr_reader_;
};

} // namespace mcpguard
