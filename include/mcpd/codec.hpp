#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>
#include <vector>

namespace mcpd {

class Codec {
public:
    /// Parse any JSON document into a nlohmann value.
    /// Throws McpdParseError on malformed input.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Parse raw JSON bytes into a message.
    /// Throws McpdParseError on invalid JSON or missing required fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse a batch of messages (JSON array).
    [[nodiscard]] static std::vector<JsonRpcMessage> parse_batch(std::string_view raw);

    /// Decode an already-parsed JSON object into a message.
    /// Throws McpdParseError when the object is not valid JSON-RPC 2.0.
    [[nodiscard]] static JsonRpcMessage decode(const nlohmann::json& j);

    /// True when the frame's first significant character opens an array.
    [[nodiscard]] static bool is_batch(std::string_view raw);

    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
    [[nodiscard]] static std::string serialize_batch(const std::vector<JsonRpcMessage>& msgs);
};

} // namespace mcpd
