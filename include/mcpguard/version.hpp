#pragma once
#include <string_view>

namespace mcpguard {

constexpr std::string_view LIBRARY_VERSION     = "0.3.0";
constexpr std::string_view JSONRPC_VERSION     = "2.0";
constexpr std::string_view SESSION_HEADER      = "Mcp-Session-Id";

} // namespace mcpguard
