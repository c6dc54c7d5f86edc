#pragma once
#include "server.hpp"
#include "transport/http_transport.hpp"
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace ctx7 {

enum class TransportKind {
    Stdio,
    Http
};

enum class TransportState {
    Unstarted,
    SelectingTransport,
    StdioActive,
    HttpActive,
    ServingForever
};

[[nodiscard]] const char* to_string(TransportKind kind);
[[nodiscard]] const char* to_string(TransportState state);

/// HTTP when either the TRANSPORT environment value or the --transport flag
/// says "http"; stdio otherwise.
[[nodiscard]] TransportKind select_transport(const std::string& env_value,
                                             const std::string& flag_value);

struct ListenerRequest {
    std::string host = "0.0.0.0";
    int port = 9700;
};

struct CapabilityUnavailable {
    std::string reason;
};

using ListenerResult = std::variant<std::unique_ptr<HttpServerTransport>, CapabilityUnavailable>;

/// Source of the network listener. Reports CapabilityUnavailable instead of
/// throwing when a listener cannot be offered.
class IListenerProvider {
public:
    virtual ~IListenerProvider() = default;
    virtual ListenerResult acquire(const ListenerRequest& request) = 0;
};

/// Builds an HttpServerTransport on the requested address.
class HttpListenerProvider : public IListenerProvider {
public:
    ListenerResult acquire(const ListenerRequest& request) override;
};

/// Runs exactly one transport for the lifetime of the process.
class TransportManager {
public:
    struct Options {
        std::string env_transport;
        std::string flag_transport;
        ListenerRequest listener;
        int read_fd = 0;
        int write_fd = 1;
    };

    TransportManager(Server& server, Options opts,
                     std::shared_ptr<IListenerProvider> provider = nullptr);

    TransportManager(const TransportManager&) = delete;
    TransportManager& operator=(const TransportManager&) = delete;

    /// Select, activate and serve. Returns when the stdio peer hangs up or
    /// shutdown() is called. Throws FatalError when the chosen transport
    /// cannot be brought up or fails while serving.
    void run();

    /// Stop the active transport. Safe from any thread.
    void shutdown();

    [[nodiscard]] TransportState state() const { return state_; }
    [[nodiscard]] TransportKind kind() const { return kind_; }

private:
    void run_stdio();
    void run_http();
    void record_failure(std::exception_ptr ep);
    void rethrow_failure();
    void enter(TransportState next);

    Server& server_;
    Options opts_;
    std::shared_ptr<IListenerProvider> provider_;

    std::atomic<TransportState> state_{TransportState::Unstarted};
    std::atomic<TransportKind> kind_{TransportKind::Stdio};

    std::mutex failure_mutex_;
    std::exception_ptr failure_;
};

} // namespace ctx7
