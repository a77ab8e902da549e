#include "mcpd/transport/transport.hpp"
#include "mcpd/codec.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"

namespace mcpd {

namespace {

// Best effort: echo the id of a rejected request back if it is usable.
std::optional<RequestId> recover_id(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find("id");
    if (it == j.end()) return std::nullopt;
    if (it->is_number_integer()) return RequestId{it->get<int64_t>()};
    if (it->is_string()) return RequestId{it->get<std::string>()};
    return std::nullopt;
}

void decode_entry(const nlohmann::json& j, Frame& frame) {
    if (!j.is_object()) {
        frame.rejects.push_back(JsonRpcResponse::failure(
            std::nullopt, error::InvalidRequest, "Invalid Request: message must be an object"));
        return;
    }
    try {
        frame.messages.push_back(Codec::decode(j));
    } catch (const McpdParseError& e) {
        frame.rejects.push_back(JsonRpcResponse::failure(
            recover_id(j), error::InvalidRequest, std::string("Invalid Request: ") + e.what()));
    }
}

} // anonymous namespace

bool Frame::has_requests() const {
    for (const auto& m : messages) {
        if (std::holds_alternative<JsonRpcRequest>(m)) return true;
    }
    return false;
}

Frame decode_frame(std::string_view raw) {
    Frame frame;
    nlohmann::json doc;
    try {
        doc = Codec::parse_json(raw);
    } catch (const McpdParseError& e) {
        frame.rejects.push_back(JsonRpcResponse::failure(
            std::nullopt, error::ParseError, std::string("Parse error: ") + e.what()));
        return frame;
    }

    if (!doc.is_array()) {
        decode_entry(doc, frame);
        return frame;
    }
    if (doc.empty()) {
        frame.rejects.push_back(JsonRpcResponse::failure(
            std::nullopt, error::InvalidRequest, "Invalid Request: empty batch"));
        return frame;
    }
    frame.batch = true;
    for (const auto& item : doc) {
        decode_entry(item, frame);
    }
    return frame;
}

std::optional<std::string> encode_replies(const std::vector<JsonRpcMessage>& replies, bool batch) {
    if (replies.empty()) return std::nullopt;
    if (batch) return Codec::serialize_batch(replies);
    return Codec::serialize(replies.front());
}

std::optional<std::string> handle_frame(std::string_view raw, const MessageHandler& handler) {
    Frame frame = decode_frame(raw);
    std::vector<JsonRpcMessage> replies;
    for (auto& reject : frame.rejects) {
        log()->warn("rejected frame: {}", reject.error ? reject.error->message : "");
        replies.emplace_back(std::move(reject));
    }
    for (const auto& msg : frame.messages) {
        if (auto reply = handler(msg)) {
            replies.push_back(std::move(*reply));
        }
    }
    return encode_replies(replies, frame.batch);
}

} // namespace mcpd
