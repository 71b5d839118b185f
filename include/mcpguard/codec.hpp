#pragma once
#include "message.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcpguard {

class Codec {
public:
    /// Parse one JSON-RPC message.
    /// Throws ParseError on invalid JSON, a non-object document, or a
    /// wrongly typed "jsonrpc"/"method" member.
    [[nodiscard]] static Message parse(std::string_view raw);

    /// Serialize a message to compact JSON.
    [[nodiscard]] static std::string serialize(const Message& msg);

    /// Error response answering `original`, carrying its id (or null).
    [[nodiscard]] static Message make_error_response(const Message& original,
                                                     int code,
                                                     const std::string& message);

    /// Error response with code BlockedByPolicy, serialized.
    [[nodiscard]] static std::string make_block_response(const Message& original,
                                                         const std::string& reason);

    /// Block response for a payload that could not be parsed (id is null).
    [[nodiscard]] static std::string make_block_response(const std::string& reason);
};

} // namespace mcpguard
