#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpd {

/// Handles one incoming message and returns the reply to send back, if any.
using MessageHandler = std::function<std::optional<JsonRpcMessage>(const JsonRpcMessage&)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface. Every reply travels back on the channel
/// its request arrived on.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until shutdown or end of input.
    virtual void start(MessageHandler on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Graceful shutdown; safe to call from another thread.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

/// One decoded wire frame: a single message or a batch.
struct Frame {
    std::vector<JsonRpcMessage> messages;
    std::vector<JsonRpcResponse> rejects;  // error replies for undecodable entries
    bool batch = false;

    [[nodiscard]] bool has_requests() const;
};

/// Decode a frame. Never throws: malformed JSON yields a single ParseError
/// reject, structurally invalid entries yield InvalidRequest rejects.
[[nodiscard]] Frame decode_frame(std::string_view raw);

/// Serialize replies (an array for batches). Empty when there is nothing
/// to send.
[[nodiscard]] std::optional<std::string> encode_replies(const std::vector<JsonRpcMessage>& replies,
                                                        bool batch);

/// Decode `raw`, run every message through `handler` and encode the
/// replies. Shared by the line-oriented transports.
[[nodiscard]] std::optional<std::string> handle_frame(std::string_view raw,
                                                      const MessageHandler& handler);

} // namespace mcpd
