#include "mcpguard/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace mcpguard::log {

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::atomic<int>& current_level() {
    static std::atomic<int> lvl{[] {
        const char* env = std::getenv("MCPGUARD_LOG_LEVEL");
        return static_cast<int>(env ? parse_level(env) : Level::Info);
    }()};
    return lvl;
}

// stdout may carry protocol traffic, so diagnostics only ever go to stderr.
void write(Level lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < current_level().load()) return;

    const char* tag = "";
    switch (lvl) {
        case Level::Debug: tag = "DEBUG"; break;
        case Level::Info:  tag = "INFO "; break;
        case Level::Warn:  tag = "WARN "; break;
        case Level::Error: tag = "ERROR"; break;
    }

    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);

    char time_buf[16];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::fprintf(stderr, "%s.%03d [%s] %s\n",
                 time_buf, static_cast<int>(ms.count()), tag, msg.c_str());
    std::fflush(stderr);
}

} // anonymous namespace

Level level() {
    return static_cast<Level>(current_level().load());
}

void set_level(Level lvl) {
    current_level().store(static_cast<int>(lvl));
}

Level parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

void debug(const std::string& msg) { write(Level::Debug, msg); }
void info(const std::string& msg)  { write(Level::Info, msg); }
void warn(const std::string& msg)  { write(Level::Warn, msg); }
void error(const std::string& msg) { write(Level::Error, msg); }

} // namespace mcpguard::log
