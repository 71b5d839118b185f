#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpguard {

/// Methods whose params name the tool being invoked.
constexpr const char* TOOLS_CALL_METHOD = "tools/call";
constexpr const char* TOOLS_USE_METHOD  = "tools/use";

enum class MessageKind {
    Request,       // method and id
    Notification,  // method, no id
    Response,      // result or error, no method
    Unknown
};

/// A JSON-RPC shaped message as seen on the wire.
///
/// Every field is optional because the proxy must carry whatever the peers
/// send. Dynamic members hold arbitrary JSON values; `id` distinguishes an
/// explicit `null` from an absent member.
struct Message {
    std::optional<std::string> jsonrpc;
    std::optional<std::string> method;
    std::optional<nlohmann::json> params;
    std::optional<nlohmann::json> id;
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> error;

    [[nodiscard]] MessageKind kind() const;

    /// Tool name for tools/call and tools/use requests whose params carry a
    /// string "name". Anything else yields nullopt.
    [[nodiscard]] std::optional<std::string> tool_name() const;

    /// "tools/call:<tool>" for tool invocations, otherwise the method.
    [[nodiscard]] std::optional<std::string> effective_method() const;

    /// effective_method() or the given fallback.
    [[nodiscard]] std::string describe(const std::string& fallback = "unknown") const;

    bool operator==(const Message& o) const {
        return jsonrpc == o.jsonrpc && method == o.method && params == o.params &&
               id == o.id && result == o.result && error == o.error;
    }
};

void to_json(nlohmann::json& j, const Message& m);
void from_json(const nlohmann::json& j, Message& m);

} // namespace mcpguard
