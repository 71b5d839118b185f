#include "mcpguard/codec.hpp"
#include "mcpguard/error.hpp"
#include "mcpguard/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpguard {

namespace {

// Depth-first copy of an on-demand value into a DOM the proxy can keep.
// simdjson reports malformed input by throwing simdjson_error.
nlohmann::json to_dom(simdjson::ondemand::value val) {
    using simdjson::ondemand::json_type;
    using simdjson::ondemand::number_type;

    switch (json_type(val.type())) {
        case json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string key(std::string_view(field.unescaped_key()));
                obj[std::move(key)] = to_dom(field.value());
            }
            return obj;
        }
        case json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_dom(elem.value()));
            }
            return arr;
        }
        case json_type::string:
            return std::string(std::string_view(val.get_string()));
        case json_type::number:
            switch (number_type(val.get_number_type())) {
                case number_type::signed_integer:   return int64_t(val.get_int64());
                case number_type::unsigned_integer: return uint64_t(val.get_uint64());
                default:                            return double(val.get_double());
            }
        case json_type::boolean:
            return bool(val.get_bool());
        case json_type::null:
            return nullptr;
    }
    return nullptr;
}

} // anonymous namespace

Message Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::json_type root_type;
    if (doc.type().get(root_type) || root_type != simdjson::ondemand::json_type::object) {
        throw ParseError("Message must be a JSON object");
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::value root;
        if (doc.get_value().get(root)) {
            throw ParseError("Failed to get document value");
        }
        j = to_dom(root);
        if (!doc.at_end()) {
            throw ParseError("Trailing content after JSON object");
        }
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }

    Message msg;
    from_json(j, msg);
    return msg;
}

std::string Codec::serialize(const Message& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

Message Codec::make_error_response(const Message& original, int code,
                                   const std::string& message) {
    Message resp;
    resp.jsonrpc = std::string(JSONRPC_VERSION);
    resp.id = original.id.value_or(nlohmann::json(nullptr));
    resp.error = nlohmann::json{{"code", code}, {"message", message}};
    return resp;
}

std::string Codec::make_block_response(const Message& original, const std::string& reason) {
    return serialize(make_error_response(original, error::BlockedByPolicy, reason));
}

std::string Codec::make_block_response(const std::string& reason) {
    return make_block_response(Message{}, reason);
}

} // namespace mcpguard
