#include "mcpguard/message.hpp"
#include "mcpguard/error.hpp"

namespace mcpguard {

MessageKind Message::kind() const {
    if (method) return id ? MessageKind::Request : MessageKind::Notification;
    if (result || error) return MessageKind::Response;
    return MessageKind::Unknown;
}

std::optional<std::string> Message::tool_name() const {
    if (!method) return std::nullopt;
    if (*method != TOOLS_CALL_METHOD && *method != TOOLS_USE_METHOD) return std::nullopt;
    if (!params || !params->is_object()) return std::nullopt;

    auto it = params->find("name");
    if (it == params->end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<std::string> Message::effective_method() const {
    if (auto tool = tool_name()) {
        return std::string(TOOLS_CALL_METHOD) + ":" + *tool;
    }
    return method;
}

std::string Message::describe(const std::string& fallback) const {
    return effective_method().value_or(fallback);
}

void to_json(nlohmann::json& j, const Message& m) {
    j = nlohmann::json::object();
    if (m.jsonrpc) j["jsonrpc"] = *m.jsonrpc;
    if (m.id) j["id"] = *m.id;
    if (m.method) j["method"] = *m.method;
    if (m.params) j["params"] = *m.params;
    if (m.result) j["result"] = *m.result;
    if (m.error) j["error"] = *m.error;
}

void from_json(const nlohmann::json& j, Message& m) {
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }

    m = Message{};
    if (auto it = j.find("jsonrpc"); it != j.end()) {
        if (!it->is_string()) throw ParseError("'jsonrpc' must be a string");
        m.jsonrpc = it->get<std::string>();
    }
    if (auto it = j.find("method"); it != j.end()) {
        if (!it->is_string()) throw ParseError("'method' must be a string");
        m.method = it->get<std::string>();
    }
    if (auto it = j.find("params"); it != j.end()) m.params = *it;
    if (auto it = j.find("id"); it != j.end()) m.id = *it;
    if (auto it = j.find("result"); it != j.end()) m.result = *it;
    if (auto it = j.find("error"); it != j.end()) m.error = *it;
}

} // namespace mcpguard
