#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace mcpguard::base64 {

[[nodiscard]] std::string encode(std::string_view data);

/// Standard alphabet, padding optional, line breaks ignored.
/// nullopt for any other character.
[[nodiscard]] std::optional<std::string> decode(std::string_view encoded);

} // namespace mcpguard::base64
