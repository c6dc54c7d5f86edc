#include "ctx7/json_rpc.hpp"
#include "ctx7/version.hpp"

namespace ctx7 {

JsonRpcResponse make_error_response(const RequestId& id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

nlohmann::json make_unaddressed_error(int code, const std::string& message) {
    return nlohmann::json{
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"id", nullptr},
        {"error", {{"code", code}, {"message", message}}}
    };
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = {{"jsonrpc", std::string(JSONRPC_VERSION)}, {"method", r.method}};
    to_json(j["id"], r.id);
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = {{"jsonrpc", std::string(JSONRPC_VERSION)}};
    to_json(j["id"], r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        // a success reply always carries a result member
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = {{"jsonrpc", std::string(JSONRPC_VERSION)}, {"method", n.method}};
    if (n.params) j["params"] = *n.params;
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace ctx7
