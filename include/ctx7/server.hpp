#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "transport/transport.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <optional>

namespace ctx7 {

using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready
};

/// MCP tool server: lifecycle, tool listing and tool dispatch on top of the
/// JSON-RPC router. Transport agnostic; one transport is bound by serve().
class Server {
public:
    struct Options {
        Implementation server_info;
        std::optional<std::string> instructions;
    };

    explicit Server(Options opts);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Register or replace a tool. Must happen before serve().
    void add_tool(ToolDefinition def, ToolHandler handler);

    [[nodiscard]] std::vector<ToolDefinition> tools() const;

    /// Process one inbound message; returns the reply, if any.
    /// Safe to call concurrently.
    [[nodiscard]] std::optional<JsonRpcMessage> handle(const JsonRpcMessage& msg);

    /// Bind the tool registry to a transport and block for its lifetime.
    void serve(ITransport& transport, ErrorCallback on_error = nullptr);
    void shutdown();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] SessionState session_state() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ctx7
