#include <gtest/gtest.h>
#include "ctx7/codec.hpp"
#include "ctx7/error.hpp"

using namespace ctx7;

// ---- Parse tests ----

TEST(CodecParse, ToolCallRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":7,"method":"tools/call",)"
                            R"("params":{"name":"resolve-library-id","arguments":{"libraryName":"react"}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 7);
    EXPECT_EQ(req.method, "tools/call");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->at("arguments").at("libraryName"), "react");
}

TEST(CodecParse, StringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"req-1","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<std::string>(std::get<JsonRpcRequest>(msg).id), "req-1");
}

TEST(CodecParse, NumericArgumentTypesSurvive) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"tools/call",)"
                            R"("params":{"arguments":{"a":-5,"b":18446744073709551615,"c":2.5}}})");
    auto& args = std::get<JsonRpcRequest>(msg).params->at("arguments");
    EXPECT_TRUE(args.at("a").is_number_integer());
    EXPECT_EQ(args.at("a").get<int64_t>(), -5);
    EXPECT_TRUE(args.at("b").is_number_unsigned());
    EXPECT_TRUE(args.at("c").is_number_float());
    EXPECT_DOUBLE_EQ(args.at("c").get<double>(), 2.5);
}

TEST(CodecParse, ErrorResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
}

TEST(CodecParse, Notification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/initialized");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), ParseError);
}

TEST(CodecParse, MissingJsonrpc) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"ping"})"), ParseError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), ParseError);
}

TEST(CodecParse, NullId) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"), ParseError);
}

TEST(CodecParse, NonStringMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":5})"), ParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), ParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), ParseError);
}

TEST(CodecParse, NeitherIdNorMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0"})"), ParseError);
}

// ---- Payload tests ----

TEST(CodecPayload, SingleMessage) {
    auto p = Codec::parse_payload(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_FALSE(p.batch);
    ASSERT_EQ(p.messages.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<JsonRpcRequest>(p.messages[0]));
}

TEST(CodecPayload, Batch) {
    auto p = Codec::parse_payload(R"([
        {"jsonrpc":"2.0","id":1,"method":"ping"},
        {"jsonrpc":"2.0","id":2,"method":"tools/list"},
        {"jsonrpc":"2.0","method":"notifications/initialized"}
    ])");
    EXPECT_TRUE(p.batch);
    ASSERT_EQ(p.messages.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<JsonRpcNotification>(p.messages[2]));
}

TEST(CodecPayload, EmptyBatchRejected) {
    EXPECT_THROW(Codec::parse_payload("[]"), ParseError);
}

TEST(CodecPayload, BadElementRejectsBatch) {
    EXPECT_THROW(Codec::parse_payload(R"([{"jsonrpc":"2.0","id":1,"method":"ping"},{"id":2}])"),
                 ParseError);
}

// ---- Serialize tests ----

TEST(CodecSerialize, SuccessResponseAlwaysHasResult) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{3}};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 3);
    EXPECT_TRUE(j["result"].is_object());
    EXPECT_FALSE(j.contains("error"));
}

TEST(CodecSerialize, ErrorResponseOmitsResult) {
    auto resp = make_error_response(RequestId{std::string("x")}, error::InvalidParams, "bad");
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["id"], "x");
    EXPECT_EQ(j["error"]["code"], error::InvalidParams);
    EXPECT_FALSE(j.contains("result"));
}

TEST(CodecSerialize, UnaddressedErrorHasNullId) {
    auto j = make_unaddressed_error(error::ParseError, "oops");
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], -32700);
}

TEST(CodecSerialize, Batch) {
    std::vector<JsonRpcMessage> msgs;
    JsonRpcResponse a;
    a.id = RequestId{int64_t{1}};
    msgs.push_back(a);
    msgs.push_back(make_error_response(RequestId{int64_t{2}}, error::MethodNotFound, "nope"));

    auto j = nlohmann::json::parse(Codec::serialize_batch(msgs));
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[1]["error"]["code"], error::MethodNotFound);
}

TEST(CodecSerialize, InvalidUtf8TextIsReplaced) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{4}};
    resp.result = nlohmann::json{{"content", nlohmann::json::array({
        {{"type", "text"}, {"text", std::string("caf\xE9 docs")}}
    })}};

    std::string out;
    ASSERT_NO_THROW(out = Codec::serialize(resp));
    auto j = nlohmann::json::parse(out);
    auto text = j["result"]["content"][0]["text"].get<std::string>();
    EXPECT_EQ(text.rfind("caf", 0), 0u);
    EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NE(text.find("docs"), std::string::npos);

    std::vector<JsonRpcMessage> batch{resp};
    EXPECT_NO_THROW(nlohmann::json::parse(Codec::serialize_batch(batch)));
}

// ---- Large message test ----

TEST(CodecParse, LargeDocumentationPayload) {
    std::string text(200000, 'x');
    nlohmann::json response = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"content", {{{"type", "text"}, {"text", text}}}}}}
    };
    auto msg = Codec::parse(response.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(resp.result->at("content")[0].at("text").get<std::string>().size(), text.size());
}
