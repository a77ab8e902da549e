#include "mcpd/codec.hpp"
#include "mcpd/error.hpp"
#include "mcpd/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpd {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

// Scalars at the document root are not reachable through get_value(),
// so they are read through the document itself.
nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    simdjson::ondemand::json_type type;
    if (doc.type().get(type)) {
        throw McpdParseError("Failed to get document type");
    }
    switch (type) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array: {
            auto val = doc.get_value();
            if (val.error()) {
                throw McpdParseError("Failed to get document value");
            }
            return simdjson_to_nlohmann(val.value());
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            int64_t i;
            if (!doc.get_int64().get(i)) return nlohmann::json(i);
            return nlohmann::json(doc.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(doc.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpdParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpdParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const McpdParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpdParseError(std::string("JSON conversion error: ") + e.what());
    }

    // On-demand parsing is lazy: trailing garbage only shows up here.
    if (!doc.at_end()) {
        throw McpdParseError("JSON parse error: trailing content after document");
    }
    return j;
}

JsonRpcMessage Codec::decode(const nlohmann::json& j) {
    if (!j.contains("jsonrpc")) {
        throw McpdParseError("Missing 'jsonrpc' field");
    }
    if (!j.at("jsonrpc").is_string() || j.at("jsonrpc").get<std::string>() != JSONRPC_VERSION) {
        throw McpdParseError("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    try {
        if (has_method && has_id) {
            if (j.at("id").is_null()) {
                throw McpdParseError("Request ID must not be null");
            }
            JsonRpcRequest req;
            from_json(j, req);
            return req;
        } else if (has_method) {
            JsonRpcNotification notif;
            from_json(j, notif);
            return notif;
        } else if (has_id) {
            JsonRpcResponse resp;
            from_json(j, resp);
            return resp;
        }
    } catch (const McpdParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpdParseError(std::string("Malformed message: ") + e.what());
    }
    throw McpdParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw McpdParseError("Message must be a JSON object");
    }
    return decode(j);
}

std::vector<JsonRpcMessage> Codec::parse_batch(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_array()) {
        throw McpdParseError("Batch must be a JSON array");
    }

    std::vector<JsonRpcMessage> messages;
    messages.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_object()) {
            throw McpdParseError("Each batch item must be a JSON object");
        }
        messages.push_back(decode(item));
    }
    return messages;
}

bool Codec::is_batch(std::string_view raw) {
    for (char c : raw) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        return c == '[';
    }
    return false;
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Tool output may carry arbitrary bytes; never let dump() throw on them.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Codec::serialize_batch(const std::vector<JsonRpcMessage>& msgs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& msg : msgs) {
        nlohmann::json j;
        to_json(j, msg);
        arr.push_back(std::move(j));
    }
    return arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcpd
