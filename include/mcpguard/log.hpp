#pragma once
#include <string>

namespace mcpguard::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Minimum level written. Initialized from MCPGUARD_LOG_LEVEL on first use.
Level level();
void set_level(Level level);

/// Parse "debug", "info", "warn" or "error". Unknown names map to Info.
Level parse_level(const std::string& name);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace mcpguard::log
