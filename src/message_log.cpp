#include "mcpguard/message_log.hpp"
#include "mcpguard/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <vector>

namespace mcpguard {

namespace fs = std::filesystem;

namespace {

std::string iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms.count()));
    return out;
}

std::string archive_suffix() {
    const auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm_buf);
    return buf;
}

} // anonymous namespace

MessageLog::MessageLog(fs::path path, std::string server_name,
                       uintmax_t max_bytes, size_t max_archives)
    : path_(std::move(path))
    , server_name_(std::move(server_name))
    , max_bytes_(max_bytes)
    , max_archives_(max_archives) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_locked();
}

void MessageLog::open_locked() {
    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);

    out_.open(path_, std::ios::app);
    if (!out_) {
        if (!failed_) log::warn("Cannot open message log " + path_.string());
        failed_ = true;
        return;
    }
    failed_ = false;
    auto size = fs::file_size(path_, ec);
    written_ = ec ? 0 : size;
}

void MessageLog::write(const std::string& dir, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) return;

    std::string line = "[" + iso_timestamp() + "] [" + server_name_ + "] [" + dir + "] " +
                       content + "\n";
    out_ << line;
    out_.flush();
    if (!out_) {
        if (!failed_) log::warn("Write to message log " + path_.string() + " failed");
        failed_ = true;
        out_.clear();
        return;
    }
    written_ += line.size();
    if (written_ > max_bytes_) rotate_locked();
}

void MessageLog::rotate_locked() {
    out_.close();

    // Several rotations can land in the same second.
    const std::string stamp = archive_suffix();
    std::error_code ec;
    fs::path archive;
    for (unsigned seq = 0;; ++seq) {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), ".%03u", seq);
        archive = path_;
        archive += "." + stamp + suffix;
        if (!fs::exists(archive, ec)) break;
    }
    fs::rename(path_, archive, ec);
    if (ec) {
        log::warn("Cannot rotate message log " + path_.string() + ": " + ec.message());
    }

    prune_archives_locked();
    written_ = 0;
    open_locked();
}

void MessageLog::prune_archives_locked() {
    const fs::path dir = path_.has_parent_path() ? path_.parent_path() : fs::path(".");
    const std::string prefix = path_.filename().string() + ".";

    std::vector<fs::path> archives;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
            archives.push_back(entry.path());
        }
    }
    if (archives.size() <= max_archives_) return;

    // Timestamp then zero-padded sequence sorts chronologically.
    std::sort(archives.begin(), archives.end());
    for (size_t i = 0; i + max_archives_ < archives.size(); ++i) {
        fs::remove(archives[i], ec);
    }
}

} // namespace mcpguard
