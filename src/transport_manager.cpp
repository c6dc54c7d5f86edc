#include "ctx7/transport_manager.hpp"
#include "ctx7/error.hpp"
#include "ctx7/transport/stdio_transport.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace ctx7 {

const char* to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http:  return "http";
    }
    return "unknown";
}

const char* to_string(TransportState state) {
    switch (state) {
        case TransportState::Unstarted:          return "Unstarted";
        case TransportState::SelectingTransport: return "SelectingTransport";
        case TransportState::StdioActive:        return "StdioActive";
        case TransportState::HttpActive:         return "HttpActive";
        case TransportState::ServingForever:     return "ServingForever";
    }
    return "unknown";
}

TransportKind select_transport(const std::string& env_value, const std::string& flag_value) {
    if (env_value == "http" || flag_value == "http") {
        return TransportKind::Http;
    }
    return TransportKind::Stdio;
}

ListenerResult HttpListenerProvider::acquire(const ListenerRequest& request) {
    if (request.host.empty()) {
        return CapabilityUnavailable{"no listen address given"};
    }
    if (request.port < 1 || request.port > 65535) {
        return CapabilityUnavailable{"port " + std::to_string(request.port) + " is out of range"};
    }

    HttpServerTransport::Options opts;
    opts.host = request.host;
    opts.port = static_cast<uint16_t>(request.port);

    auto transport = std::make_unique<HttpServerTransport>(std::move(opts));
    if (!transport->is_valid()) {
        return CapabilityUnavailable{"HTTP listener could not be initialized"};
    }
    return ListenerResult{std::move(transport)};
}

TransportManager::TransportManager(Server& server, Options opts,
                                   std::shared_ptr<IListenerProvider> provider)
    : server_(server),
      opts_(std::move(opts)),
      provider_(std::move(provider)) {
    if (!provider_) provider_ = std::make_shared<HttpListenerProvider>();
}

void TransportManager::enter(TransportState next) {
    spdlog::debug("Transport state {} -> {}", to_string(state_.load()), to_string(next));
    state_ = next;
}

void TransportManager::record_failure(std::exception_ptr ep) {
    {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        if (!failure_) failure_ = ep;
    }
    server_.shutdown();
}

void TransportManager::rethrow_failure() {
    std::exception_ptr ep;
    {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        ep = failure_;
    }
    if (!ep) return;
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        throw FatalError(std::string(to_string(kind_.load())) + " transport failed: " + e.what());
    }
}

void TransportManager::run() {
    if (state_ != TransportState::Unstarted) {
        throw FatalError("transport manager already started");
    }

    enter(TransportState::SelectingTransport);
    kind_ = select_transport(opts_.env_transport, opts_.flag_transport);
    spdlog::info("Selected {} transport", to_string(kind_.load()));

    if (kind_ == TransportKind::Http) {
        run_http();
    } else {
        run_stdio();
    }
}

void TransportManager::run_stdio() {
    StdioTransport transport(opts_.read_fd, opts_.write_fd);
    enter(TransportState::StdioActive);
    spdlog::info("Context7 Documentation MCP Server running on stdio");

    server_.serve(transport, [this](std::exception_ptr ep) { record_failure(ep); });
    rethrow_failure();
}

void TransportManager::run_http() {
    auto acquired = provider_->acquire(opts_.listener);
    if (auto* unavailable = std::get_if<CapabilityUnavailable>(&acquired)) {
        throw FatalError("HTTP transport unavailable: " + unavailable->reason);
    }
    auto transport = std::move(std::get<std::unique_ptr<HttpServerTransport>>(acquired));

    transport->set_request_observer([](const HttpRequestInfo& info) {
        nlohmann::json headers = nlohmann::json::object();
        for (const auto& [name, value] : info.headers) {
            headers[name] = value;
        }
        spdlog::info("[HTTP] {} {} headers={}", info.method, info.path,
                     headers.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    });

    enter(TransportState::HttpActive);
    const auto& o = transport->options();
    spdlog::info("Context7 Documentation MCP Server running on http://{}:{}{}",
                 o.host, o.port, o.mcp_path);

    enter(TransportState::ServingForever);
    try {
        server_.serve(*transport, [this](std::exception_ptr ep) { record_failure(ep); });
    } catch (const TransportError& e) {
        throw FatalError(e.what());
    }
    rethrow_failure();
}

void TransportManager::shutdown() {
    server_.shutdown();
}

} // namespace ctx7
