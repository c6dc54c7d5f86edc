#include <gtest/gtest.h>
#include "ctx7/transport/stdio_transport.hpp"
#include "ctx7/codec.hpp"
#include "ctx7/error.hpp"
#include "support/pipe_peer.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>

using namespace ctx7;
using ctx7::test::PipePeer;

namespace {

// Replies to every request with {"method": <method>}.
std::optional<JsonRpcMessage> echo_method(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        JsonRpcResponse resp;
        resp.id = req->id;
        resp.result = nlohmann::json{{"method", req->method}};
        return JsonRpcMessage{resp};
    }
    return std::nullopt;
}

nlohmann::json request(int64_t id, const std::string& method) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
}

} // namespace

TEST(StdioTransport, NotConnectedBeforeStart) {
    PipePeer peer;
    StdioTransport t(peer.server_read_fd(), peer.server_write_fd());
    EXPECT_FALSE(t.is_connected());
}

TEST(StdioTransport, RepliesInArrivalOrder) {
    PipePeer peer;
    StdioTransport t(peer.server_read_fd(), peer.server_write_fd());
    std::thread runner([&] { t.start(echo_method); });

    peer.send_json(request(1, "ping"));
    peer.send_json(request(2, "tools/list"));
    peer.send_json(request(3, "initialize"));

    for (int64_t id = 1; id <= 3; ++id) {
        auto reply = peer.read_json();
        ASSERT_TRUE(reply.has_value());
        EXPECT_EQ((*reply)["id"], id);
    }

    peer.close_input();
    runner.join();
    EXPECT_FALSE(t.is_connected());
}

TEST(StdioTransport, SeveralMessagesInOneWrite) {
    PipePeer peer;
    StdioTransport t(peer.server_read_fd(), peer.server_write_fd());
    std::thread runner([&] { t.start(echo_method); });

    peer.send_raw(request(1, "a").dump() + "\n" + request(2, "b").dump() + "\r\n\n");

    auto first = peer.read_json();
    auto second = peer.read_json();
    ASSERT_TRUE(first && second);
    EXPECT_EQ((*first)["result"]["method"], "a");
    EXPECT_EQ((*second)["result"]["method"], "b");

    peer.close_input();
    runner.join();
}

TEST(StdioTransport, NotificationsGetNoReply) {
    PipePeer peer;
    StdioTransport t(peer.server_read_fd(), peer.server_write_fd());
    std::thread runner([&] { t.start(echo_method); });

    peer.notify("notifications/initialized");
    peer.send_json(request(9, "ping"));

    auto reply = peer.read_json();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 9);

    peer.close_input();
    runner.join();
}

TEST(StdioTransport, MalformedLineAnsweredAndSessionContinues) {
    PipePeer peer;
    StdioTransport t(peer.server_read_fd(), peer.server_write_fd());
    std::atomic<bool> error_seen{false};
    std::thread runner([&] {
        t.start(echo_method, [&](std::exception_ptr) { error_seen = true; });
    });

    peer.send_line("{not json");
    auto err = peer.read_json();
    ASSERT_TRUE(err.has_value());
    EXPECT_TRUE((*err)["id"].is_null());
    EXPECT_EQ((*err)["error"]["code"], error::ParseError);

    peer.send_json(request(2, "ping"));
    auto reply = peer.read_json();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 2);

    peer.close_input();
    runner.join();
    EXPECT_FALSE(error_seen);
}

TEST(StdioTransport, ShutdownStopsBlockedReader) {
    PipePeer peer;
    StdioTransport t(peer.server_read_fd(), peer.server_write_fd());
    std::thread runner([&] { t.start(echo_method); });

    peer.send_json(request(1, "ping"));
    ASSERT_TRUE(peer.read_json().has_value());
    EXPECT_TRUE(t.is_connected());

    t.shutdown();
    runner.join();
    EXPECT_FALSE(t.is_connected());
}

TEST(StdioTransport, ShutdownBeforeStartMakesStartReturn) {
    PipePeer peer;
    StdioTransport t(peer.server_read_fd(), peer.server_write_fd());
    t.shutdown();
    t.start(echo_method);
    EXPECT_FALSE(t.is_connected());
}

TEST(StdioTransport, HandlerExceptionStopsWriterAndPropagates) {
    PipePeer peer;
    std::atomic<bool> rethrown{false};
    {
        StdioTransport t(peer.server_read_fd(), peer.server_write_fd());
        std::thread runner([&] {
            try {
                t.start([](const JsonRpcMessage&) -> std::optional<JsonRpcMessage> {
                    throw std::runtime_error("handler failed");
                });
            } catch (const std::runtime_error&) {
                rethrown = true;
            }
        });

        peer.send_json(request(1, "ping"));
        runner.join();
        EXPECT_FALSE(t.is_connected());
    }
    EXPECT_TRUE(rethrown);
}
