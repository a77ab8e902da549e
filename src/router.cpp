#include "mcpd/router.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"

namespace mcpd {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg) const {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        auto it = request_handlers_.find(req->method);
        if (it == request_handlers_.end()) {
            log()->debug("method not found: {}", req->method);
            return JsonRpcResponse::failure(req->id, error::MethodNotFound,
                                            "Method not found: " + req->method);
        }

        const nlohmann::json params = req->params ? *req->params : nlohmann::json::object();
        try {
            auto result = it->second(params);
            if (auto* err = std::get_if<JsonRpcError>(&result)) {
                JsonRpcResponse resp;
                resp.id = req->id;
                resp.error = std::move(*err);
                return resp;
            }
            return JsonRpcResponse::success(req->id, std::get<nlohmann::json>(std::move(result)));
        } catch (const McpdProtocolError& e) {
            return JsonRpcResponse::failure(req->id, e.code, e.what());
        } catch (const nlohmann::json::exception& e) {
            return JsonRpcResponse::failure(req->id, error::InvalidParams,
                                            std::string("Invalid params: ") + e.what());
        } catch (const std::exception& e) {
            log()->error("handler for {} failed: {}", req->method, e.what());
            return JsonRpcResponse::failure(req->id, error::InternalError, e.what());
        }
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        auto it = notification_handlers_.find(notif->method);
        if (it == notification_handlers_.end()) {
            log()->debug("ignoring notification: {}", notif->method);
            return std::nullopt;
        }
        const nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();
        try {
            it->second(params);
        } catch (const std::exception& e) {
            log()->warn("notification handler for {} failed: {}", notif->method, e.what());
        }
        return std::nullopt;
    }

    // The server issues no requests of its own, so responses have no taker.
    log()->debug("ignoring unsolicited response");
    return std::nullopt;
}

} // namespace mcpd
