#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace mcpguard {

/// Traffic directions written to the message log.
namespace direction {
    constexpr const char* ClientToServer = "CLIENT->SERVER";
    constexpr const char* ServerToClient = "SERVER->CLIENT";
    constexpr const char* ProxyToClient  = "PROXY->CLIENT";
    constexpr const char* ClientToProxy  = "CLIENT->PROXY";
    constexpr const char* ServerToProxy  = "SERVER->PROXY";
    constexpr const char* Error          = "ERROR";
} // namespace direction

/// Per-server traffic log.
///
/// Lines look like `[2024-05-01T10:00:00.000Z] [server] [CLIENT->SERVER] {...}`.
/// When the file grows past max_bytes it is renamed to
/// `<path>.<yyyymmdd-HHMMSS>.<seq>` and only the newest max_archives survive.
/// Write failures are reported once and otherwise ignored.
class MessageLog {
public:
    static constexpr uintmax_t DEFAULT_MAX_BYTES = 10u * 1024u * 1024u;
    static constexpr size_t DEFAULT_MAX_ARCHIVES = 5;

    MessageLog(std::filesystem::path path, std::string server_name,
               uintmax_t max_bytes = DEFAULT_MAX_BYTES,
               size_t max_archives = DEFAULT_MAX_ARCHIVES);

    MessageLog(const MessageLog&) = delete;
    MessageLog& operator=(const MessageLog&) = delete;

    void write(const std::string& dir, const std::string& content);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    void open_locked();
    void rotate_locked();
    void prune_archives_locked();

    std::filesystem::path path_;
    std::string server_name_;
    uintmax_t max_bytes_;
    size_t max_archives_;
    std::mutex mutex_;
    std::ofstream out_;
    uintmax_t written_{0};
    bool failed_{false};
};

} // namespace mcpguard
