#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>
#include <optional>

namespace ctx7 {

/// Handles one inbound message and returns the reply to deliver, if any.
using MessageHandler = std::function<std::optional<JsonRpcMessage>(const JsonRpcMessage&)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// A delivery channel for tool requests. Exactly one is active per process.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start serving. Blocks for the lifetime of the channel.
    virtual void start(MessageHandler on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Ask a running transport to stop. Safe from any thread.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace ctx7
