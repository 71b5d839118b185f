#include "mcpguard/stdio_proxy.hpp"
#include "mcpguard/codec.hpp"
#include "mcpguard/error.hpp"
#include "mcpguard/log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>

namespace mcpguard {

namespace {

constexpr const char* TRANSPORT = "stdio";

bool write_all(int fd, const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

std::string trim_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

} // anonymous namespace

StdioProxySession::StdioProxySession(StdioLaunchSpec spec, EnvMap child_env,
                                     PolicyEngine& policy, MessageLog* traffic)
    : StdioProxySession(std::move(spec), std::move(child_env), policy, traffic, Fds{}) {
}

StdioProxySession::StdioProxySession(StdioLaunchSpec spec, EnvMap child_env,
                                     PolicyEngine& policy, MessageLog* traffic, Fds fds)
    : spec_(std::move(spec))
    , child_env_(std::move(child_env))
    , policy_(policy)
    , traffic_(traffic)
    , fds_(fds)
    , identity_(ServerIdentity::for_command(spec_.server_name, spec_.command, spec_.args))
    , processing_("client-to-server")
    , to_server_("server-writer")
    , to_client_("client-writer") {
}

StdioProxySession::~StdioProxySession() {
    stop();
    for (auto* t : {&client_reader_, &server_reader_, &stderr_reader_}) {
        if (t->joinable()) t->join();
    }
    processing_.stop();
    to_server_.stop();
    to_client_.stop();
    for (int& fd : wakeup_pipe_) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
}

int StdioProxySession::run() {
    if (running_.exchange(true)) {
        throw GuardError("Proxy session is already running");
    }

    // A vanished peer must surface as EPIPE, not kill the proxy.
    std::signal(SIGPIPE, SIG_IGN);

    log::info("Starting proxy for server '" + identity_.display_name + "': " + spec_.command);
    child_ = ChildProcess::spawn(spec_.command, spec_.args, child_env_);
    log::debug("Server started with pid " + std::to_string(child_.pid()));

    if (::pipe(wakeup_pipe_) < 0) {
        child_.kill(SIGTERM);
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    server_reader_ = std::thread([this] { server_read_loop(); });
    stderr_reader_ = std::thread([this] { stderr_read_loop(); });
    client_reader_ = std::thread([this] { client_read_loop(); });

    int code = child_.wait();

    // Drain what the server wrote before exiting, then release the client side.
    if (server_reader_.joinable()) server_reader_.join();
    if (stderr_reader_.joinable()) stderr_reader_.join();
    char b = 1;
    ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
    (void)ignored;
    if (client_reader_.joinable()) client_reader_.join();

    processing_.stop();
    to_server_.stop();
    to_client_.stop();

    std::string report = "Server process exited with status " + std::to_string(code);
    if (code == 0) {
        log::info(report);
    } else {
        log::warn(report);
    }
    trace(direction::Error, report);

    running_ = false;
    return code;
}

void StdioProxySession::stop() {
    child_.kill(SIGTERM);
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
        (void)ignored;
    }
}

template <typename OnChunk>
void StdioProxySession::pump(int fd, OnChunk&& on_chunk) {
    char chunk[4096];

    while (true) {
        struct pollfd fds[2];
        fds[0].fd = fd;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            log::error(std::string("poll failed: ") + std::strerror(errno));
            return;
        }

        if (fds[1].revents & POLLIN) return;
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            log::error(std::string("Read error: ") + std::strerror(errno));
            return;
        }
        if (n == 0) {
            on_chunk(nullptr, 0);
            return;
        }
        on_chunk(chunk, static_cast<size_t>(n));
    }
}

void StdioProxySession::client_read_loop() {
    bool eof = false;
    pump(fds_.client_in, [this, &eof](const char* data, size_t n) {
        if (!data) {
            eof = true;
            return;
        }
        size_t dropped = client_framer_.dropped_frames();
        client_framer_.append(data, n);
        for (auto& line : client_framer_.extract_lines()) {
            processing_.post([this, line = std::move(line)] { handle_client_line(line); });
        }
        if (client_framer_.dropped_frames() != dropped) {
            log::warn("Dropped client frame with invalid UTF-8");
        }
    });

    if (client_framer_.has_partial_data()) {
        log::debug("Discarding " + std::to_string(client_framer_.buffered_size()) +
                   " bytes of unterminated client input");
    }
    if (eof) {
        log::info("Client closed stdin, closing server stdin after pending messages");
        processing_.post([this] {
            to_server_.post([this] { child_.close_stdin(); });
        });
    }
}

void StdioProxySession::server_read_loop() {
    pump(child_.stdout_fd(), [this](const char* data, size_t n) {
        if (!data) return;
        size_t dropped = server_framer_.dropped_frames();
        server_framer_.append(data, n);
        for (auto& line : server_framer_.extract_lines()) {
            handle_server_line(line);
        }
        if (server_framer_.dropped_frames() != dropped) {
            log::warn("Dropped server frame with invalid UTF-8");
        }
    });
}

void StdioProxySession::stderr_read_loop() {
    pump(child_.stderr_fd(), [this](const char* data, size_t n) {
        if (!data) return;
        if (!write_all(fds_.diagnostics, std::string(data, n))) {
            log::debug("Could not relay server stderr");
        }
        trace(direction::Error, trim_newlines(std::string(data, n)));
    });
}

void StdioProxySession::handle_client_line(const std::string& line) {
    trace(direction::ClientToServer, line);

    Message msg;
    try {
        msg = Codec::parse(line);
    } catch (const ParseError& e) {
        log::debug(std::string("Forwarding unparsed client line: ") + e.what());
        send_to_server(line);
        return;
    }

    PolicyDecision decision = policy_.evaluate(msg, line, identity_, TRANSPORT);
    if (!decision.allowed) {
        std::string reason = decision.reason.value_or(
            "Proxy blocked request: '" + msg.describe() + "'");
        std::string response = Codec::make_block_response(msg, reason);
        trace(direction::ProxyToClient, response);
        send_to_client(std::move(response));
        return;
    }
    send_to_server(line);
}

void StdioProxySession::handle_server_line(const std::string& line) {
    trace(direction::ServerToClient, line);
    send_to_client(line);
    policy_.inspect_response(line, identity_, TRANSPORT);
}

void StdioProxySession::send_to_server(std::string line) {
    to_server_.post([this, line = std::move(line)] {
        int fd = child_.stdin_fd();
        if (fd < 0) {
            log::debug("Server stdin closed, dropping message");
            return;
        }
        if (!write_all(fd, line + "\n")) {
            log::warn(std::string("Write to server failed: ") + std::strerror(errno));
        }
    });
}

void StdioProxySession::send_to_client(std::string line) {
    to_client_.post([this, line = std::move(line)] {
        if (!write_all(fds_.client_out, line + "\n")) {
            log::warn(std::string("Write to client failed: ") + std::strerror(errno));
        }
    });
}

void StdioProxySession::trace(const char* dir, const std::string& content) {
    if (traffic_) traffic_->write(dir, content);
}

} // namespace mcpguard
