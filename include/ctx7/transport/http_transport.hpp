#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace ctx7 {

/// What the request observer gets to see of each inbound HTTP request.
struct HttpRequestInfo {
    std::string method;
    std::string path;
    std::multimap<std::string, std::string> headers;
};

using RequestObserver = std::function<void(const HttpRequestInfo&)>;

/// Streamable HTTP listener. Every POST carries one JSON-RPC message or a
/// batch and gets its replies in the response body. Requests are served
/// concurrently by the listener's worker pool.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 9700;
        std::string mcp_path = "/mcp";
        std::vector<std::string> allowed_origins;
        /// Live sessions kept at most; the least recently used one is evicted.
        size_t max_sessions = 1024;
        /// Sessions unused for this long are forgotten.
        std::chrono::seconds session_idle_timeout{std::chrono::minutes(30)};
    };

    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport() override;

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    /// Called for every inbound request before routing. Set before start().
    void set_request_observer(RequestObserver observer);

    /// Blocks inside the listener until shutdown(). Throws TransportError
    /// when the address cannot be bound.
    void start(MessageHandler on_message, ErrorCallback on_error = nullptr) override;
    void shutdown() override;
    bool is_connected() const override;

    [[nodiscard]] bool is_valid() const;
    /// True once the socket is bound and accepting.
    [[nodiscard]] bool is_listening() const;
    [[nodiscard]] const Options& options() const { return opts_; }

    /// Number of live Mcp-Session-Id sessions.
    [[nodiscard]] size_t session_count() const;

private:
    std::string open_session();
    bool touch_session(const std::string& id);
    void prune_sessions(std::chrono::steady_clock::time_point now);
    bool validate_origin(const std::string& origin) const;
    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};

    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::chrono::steady_clock::time_point> sessions_;

    RequestObserver observer_;
    MessageHandler message_handler_;
    ErrorCallback error_callback_;
};

} // namespace ctx7
