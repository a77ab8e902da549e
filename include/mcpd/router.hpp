#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace mcpd {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Method table. Handlers are registered before serving starts and the
/// table is only read afterwards.
class Router {
public:
    void on_request(const std::string& method, RequestHandler handler);
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming message. Requests always produce a response;
    /// notifications and stray responses never do.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mcpd
