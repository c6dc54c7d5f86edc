#include "ctx7/transport/http_transport.hpp"
#include "ctx7/error.hpp"
#include "ctx7/version.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace ctx7 {

namespace {

constexpr const char* kJson = "application/json";

std::string generate_uuid() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // version 4, variant 1
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

bool is_supported_protocol(const std::string& version) {
    static const char* const kKnown[] = {"2024-11-05", "2025-03-26", "2025-06-18"};
    return std::find(std::begin(kKnown), std::end(kKnown), version) != std::end(kKnown);
}

void reply_error(httplib::Response& res, int status, int code, const std::string& message) {
    res.status = status;
    res.set_content(make_unaddressed_error(code, message).dump(), kJson);
}

} // namespace

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

void HttpServerTransport::set_request_observer(RequestObserver observer) {
    observer_ = std::move(observer);
}

bool HttpServerTransport::is_valid() const {
    return server_ && server_->is_valid();
}

bool HttpServerTransport::is_listening() const {
    return server_ && server_->is_running();
}

size_t HttpServerTransport::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::string HttpServerTransport::open_session() {
    std::string id = generate_uuid();
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    prune_sessions(now);
    if (opts_.max_sessions > 0 && sessions_.size() >= opts_.max_sessions) {
        auto oldest = std::min_element(sessions_.begin(), sessions_.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
        spdlog::debug("Session limit {} reached, evicting {}", opts_.max_sessions, oldest->first);
        sessions_.erase(oldest);
    }
    sessions_.emplace(id, now);
    return id;
}

// Caller holds sessions_mutex_.
void HttpServerTransport::prune_sessions(std::chrono::steady_clock::time_point now) {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second > opts_.session_idle_timeout) {
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

bool HttpServerTransport::touch_session(const std::string& id) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    if (now - it->second > opts_.session_idle_timeout) {
        sessions_.erase(it);
        return false;
    }
    it->second = now;
    return true;
}

bool HttpServerTransport::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    return std::find(opts_.allowed_origins.begin(), opts_.allowed_origins.end(), origin)
           != opts_.allowed_origins.end();
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        reply_error(res, 403, error::InvalidRequest, "Invalid origin");
        return;
    }

    auto proto = req.get_header_value("MCP-Protocol-Version");
    if (!proto.empty() && !is_supported_protocol(proto)) {
        reply_error(res, 400, error::InvalidRequest, "Unsupported protocol version: " + proto);
        return;
    }

    std::string session_id = req.get_header_value("Mcp-Session-Id");
    if (session_id.empty()) {
        session_id = open_session();
    } else if (!touch_session(session_id)) {
        reply_error(res, 404, error::InvalidRequest, "Session not found");
        return;
    }
    res.set_header("Mcp-Session-Id", session_id);

    Payload payload;
    try {
        payload = Codec::parse_payload(req.body);
    } catch (const ParseError& e) {
        spdlog::warn("Rejecting malformed HTTP payload: {}", e.what());
        reply_error(res, 400, error::ParseError, e.what());
        return;
    }

    std::vector<JsonRpcMessage> replies;
    for (const auto& msg : payload.messages) {
        if (auto reply = message_handler_(msg)) {
            replies.push_back(std::move(*reply));
        }
    }

    if (replies.empty()) {
        res.status = 202;
        return;
    }
    res.status = 200;
    if (payload.batch) {
        res.set_content(Codec::serialize_batch(replies), kJson);
    } else {
        res.set_content(Codec::serialize(replies.front()), kJson);
    }
}

void HttpServerTransport::setup_routes() {
    const std::string& path = opts_.mcp_path;

    server_->set_pre_routing_handler(
        [this](const httplib::Request& req, httplib::Response&) {
            if (observer_) {
                HttpRequestInfo info;
                info.method = req.method;
                info.path = req.path;
                info.headers.insert(req.headers.begin(), req.headers.end());
                observer_(info);
            }
            return httplib::Server::HandlerResponse::Unhandled;
        });

    server_->set_exception_handler(
        [this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            res.status = 500;
            res.set_content(make_unaddressed_error(error::InternalError,
                                                   "Internal server error").dump(), kJson);
            if (error_callback_) {
                error_callback_(ep);
            } else {
                spdlog::error("Unhandled failure serving {} {}", req.method, req.path);
            }
        });

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    });

    // No server-initiated stream is offered.
    server_->Get(path, [](const httplib::Request&, httplib::Response& res) {
        res.status = 405;
        res.set_header("Allow", "POST, DELETE");
    });

    server_->Delete(path, [this](const httplib::Request& req, httplib::Response& res) {
        std::string session_id = req.get_header_value("Mcp-Session-Id");
        if (session_id.empty()) {
            res.status = 400;
            return;
        }
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        res.status = sessions_.erase(session_id) > 0 ? 200 : 404;
    });
}

void HttpServerTransport::start(MessageHandler on_message, ErrorCallback on_error) {
    if (running_.exchange(true)) return;

    message_handler_ = std::move(on_message);
    error_callback_ = std::move(on_error);

    setup_routes();

    if (!server_->listen(opts_.host, opts_.port)) {
        running_ = false;
        throw TransportError("Failed to start HTTP server on " + opts_.host + ":"
                             + std::to_string(opts_.port));
    }
    running_ = false;
}

void HttpServerTransport::shutdown() {
    if (!running_.load()) return;
    server_->stop();
}

bool HttpServerTransport::is_connected() const {
    return running_;
}

} // namespace ctx7
