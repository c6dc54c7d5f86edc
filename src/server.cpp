#include "ctx7/server.hpp"
#include "ctx7/router.hpp"
#include "ctx7/error.hpp"
#include "ctx7/version.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <unordered_map>

namespace ctx7 {

struct Server::Impl {
    Options opts;
    Router router;

    mutable std::mutex store_mutex;
    std::vector<ToolDefinition> tools;
    std::unordered_map<std::string, ToolHandler> tool_handlers;

    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};
    std::atomic<SessionState> state{SessionState::Uninitialized};

    explicit Impl(Options o) : opts(std::move(o)) {}

    void setup_handlers() {
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            if (params.contains("clientInfo")) {
                auto client = params.at("clientInfo").get<Implementation>();
                spdlog::info("Client connected: {} {}", client.name, client.version);
            }
            if (params.contains("protocolVersion")) {
                spdlog::debug("Client requested protocol {}",
                              params.at("protocolVersion").get<std::string>());
            }
            state = SessionState::Initializing;

            InitializeResult result;
            result.protocol_version = std::string(PROTOCOL_VERSION);
            result.capabilities.tools = nlohmann::json{{"listChanged", false}};
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;
            return nlohmann::json(result);
        });

        router.on_notification("notifications/initialized", [this](const nlohmann::json&) {
            state = SessionState::Ready;
        });

        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            std::lock_guard<std::mutex> lock(store_mutex);
            return nlohmann::json{{"tools", tools}};
        });

        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            std::string name = params.at("name").get<std::string>();
            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
            if (!arguments.is_object()) {
                return JsonRpcError{error::InvalidParams, "arguments must be an object", std::nullopt};
            }

            ToolHandler handler;
            {
                std::lock_guard<std::mutex> lock(store_mutex);
                auto it = tool_handlers.find(name);
                if (it == tool_handlers.end()) {
                    return JsonRpcError{error::InvalidParams, "Unknown tool: " + name, std::nullopt};
                }
                handler = it->second;
            }

            try {
                return nlohmann::json(handler(arguments));
            } catch (const std::exception& e) {
                spdlog::error("Tool '{}' threw: {}", name, e.what());
                return nlohmann::json(CallToolResult::error(std::string("Error: ") + e.what()));
            }
        });
    }
};

Server::Server(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

Server::~Server() = default;

void Server::add_tool(ToolDefinition def, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->store_mutex);
    auto& items = impl_->tools;
    items.erase(std::remove_if(items.begin(), items.end(),
        [&def](const ToolDefinition& t) { return t.name == def.name; }), items.end());
    impl_->tool_handlers[def.name] = std::move(handler);
    spdlog::debug("Registered tool: {}", def.name);
    items.push_back(std::move(def));
}

std::vector<ToolDefinition> Server::tools() const {
    std::lock_guard<std::mutex> lock(impl_->store_mutex);
    return impl_->tools;
}

std::optional<JsonRpcMessage> Server::handle(const JsonRpcMessage& msg) {
    return impl_->router.dispatch(msg);
}

void Server::serve(ITransport& transport, ErrorCallback on_error) {
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = &transport;
    }
    impl_->running = true;

    try {
        transport.start([this](const JsonRpcMessage& msg) { return handle(msg); },
                        std::move(on_error));
    } catch (...) {
        impl_->running = false;
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
        throw;
    }

    impl_->running = false;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->transport = nullptr;
}

void Server::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool Server::is_running() const {
    return impl_->running;
}

SessionState Server::session_state() const {
    return impl_->state;
}

} // namespace ctx7
