#pragma once
#include <string>

namespace mcpguard {

/// Random RFC 4122 version 4 UUID in canonical lowercase form.
[[nodiscard]] std::string generate_uuid();

} // namespace mcpguard
