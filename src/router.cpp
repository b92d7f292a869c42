#include "mcpipboy/router.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/logging.hpp"

namespace mcpipboy {

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
        const nlohmann::json params = req->params ? *req->params : nlohmann::json::object();

        auto it = request_handlers_.find(req->method);
        if (it == request_handlers_.end()) {
            return make_error(req->id, JsonRpcError{
                error::MethodNotFound,
                "Method not found: " + req->method,
                std::nullopt
            });
        }

        try {
            auto result = it->second(params);
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                return make_result(req->id, std::move(*ok));
            }
            return make_error(req->id, std::get<JsonRpcError>(std::move(result)));
        } catch (const McpProtocolError& e) {
            return make_error(req->id, JsonRpcError{e.code, e.what(), e.data});
        } catch (const std::exception& e) {
            MCPIPBOY_ERROR("handler for {} failed: {}", req->method, e.what());
            return make_error(req->id, JsonRpcError{error::InternalError, e.what(), std::nullopt});
        }
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        auto it = notification_handlers_.find(notif->method);
        if (it == notification_handlers_.end()) {
            MCPIPBOY_DEBUG("ignoring notification {}", notif->method);
            return std::nullopt;
        }
        const nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();
        try {
            it->second(params);
        } catch (const std::exception& e) {
            // notifications never get a reply
            MCPIPBOY_WARN("notification handler for {} failed: {}", notif->method, e.what());
        }
        return std::nullopt;
    }

    // Responses to server-initiated requests; this server sends none.
    return std::nullopt;
}

} // namespace mcpipboy
