#include "ctx7/router.hpp"
#include "ctx7/error.hpp"
#include <spdlog/spdlog.h>

namespace ctx7 {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg) const {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        return dispatch_request(*req);
    }
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        dispatch_notification(*notif);
        return std::nullopt;
    }
    // This server never issues requests, so a response has nobody waiting on it.
    spdlog::debug("Ignoring unsolicited JSON-RPC response");
    return std::nullopt;
}

JsonRpcResponse Router::dispatch_request(const JsonRpcRequest& req) const {
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request_handlers_.find(req.method);
        if (it == request_handlers_.end()) {
            return make_error_response(req.id, error::MethodNotFound,
                                       "Method not found: " + req.method);
        }
        handler = it->second;
    }

    const nlohmann::json params = req.params ? *req.params : nlohmann::json::object();
    if (!params.is_object()) {
        return make_error_response(req.id, error::InvalidParams, "params must be an object");
    }

    // Handlers run without the lock so that concurrent requests do not serialize.
    try {
        auto result = handler(params);
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            JsonRpcResponse resp;
            resp.id = req.id;
            resp.error = std::move(*err);
            return resp;
        }
        JsonRpcResponse resp;
        resp.id = req.id;
        resp.result = std::move(std::get<nlohmann::json>(result));
        return resp;
    } catch (const ProtocolError& e) {
        return make_error_response(req.id, e.code, e.what());
    } catch (const nlohmann::json::exception& e) {
        return make_error_response(req.id, error::InvalidParams,
                                   std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Handler for '{}' failed: {}", req.method, e.what());
        return make_error_response(req.id, error::InternalError, e.what());
    }
}

void Router::dispatch_notification(const JsonRpcNotification& notif) const {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notif.method);
        if (it == notification_handlers_.end()) {
            spdlog::debug("No handler for notification '{}'", notif.method);
            return;
        }
        handler = it->second;
    }
    try {
        handler(notif.params ? *notif.params : nlohmann::json::object());
    } catch (const std::exception& e) {
        // Notifications have no reply channel.
        spdlog::warn("Notification '{}' failed: {}", notif.method, e.what());
    }
}

} // namespace ctx7
