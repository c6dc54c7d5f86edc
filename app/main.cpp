/// Context7 documentation server.
/// Usage: ctx7-mcp-server [--transport stdio|http] [--host ADDR] [--port N] [--log-level LEVEL]

#include <ctx7/ctx7.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stderr_color_sink.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>

int main(int argc, char* argv[]) {
    ctx7::install_fatal_handlers();

    CLI::App app{"Context7 documentation MCP server", "ctx7-mcp-server"};
    app.allow_extras();

    std::string transport_flag;
    std::string host = "0.0.0.0";
    int port = 9700;
    std::string log_level = "info";

    app.add_option("--transport", transport_flag, "Transport to serve on (stdio or http)");
    app.add_option("--host", host, "HTTP address to bind to")->default_val("0.0.0.0");
    app.add_option("--port", port, "HTTP port to bind to")->default_val(9700);
    app.add_option("--log-level", log_level, "Log level (trace/debug/info/warn/error/critical/off)")
        ->default_val("info");

    CLI11_PARSE(app, argc, argv);

    // stdout carries the protocol; all logging goes to stderr.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("ctx7", stderr_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(log_level));
    spdlog::flush_on(spdlog::level::warn);

    std::signal(SIGPIPE, SIG_IGN);

    return ctx7::supervise([&]() {
        auto config = std::make_shared<const ctx7::ConfigSnapshot>(ctx7::ConfigResolver().load());

        ctx7::TokenPolicy policy;
        policy.minimum = ctx7::minimum_tokens_from_env();

        ctx7::HttpDocsClient::Options client_opts;
        client_opts.base_url = ctx7::env_or(ctx7::env::ApiUrl, ctx7::kDefaultApiUrl);

        ctx7::Server::Options server_opts;
        server_opts.server_info = {std::string(ctx7::SERVER_NAME), std::string(ctx7::SERVER_VERSION)};
        ctx7::Server server{std::move(server_opts)};

        ctx7::DocsToolHandlers handlers(
            config, policy,
            std::make_shared<ctx7::HttpDocsClient>(std::move(client_opts)),
            std::make_shared<ctx7::SpdlogEventLogger>());
        handlers.register_tools(server);

        ctx7::TransportManager::Options transport_opts;
        transport_opts.env_transport = ctx7::env_or(ctx7::env::Transport, "");
        transport_opts.flag_transport = transport_flag;
        transport_opts.listener.host = host;
        transport_opts.listener.port = port;

        ctx7::TransportManager manager(server, std::move(transport_opts));
        manager.run();
    });
}
