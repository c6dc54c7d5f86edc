#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>
#include <vector>

namespace ctx7 {

/// One decoded wire payload: a single message or a batch.
struct Payload {
    std::vector<JsonRpcMessage> messages;
    bool batch = false;
};

class Codec {
public:
    /// Parse a single JSON-RPC message.
    /// Throws ParseError on invalid JSON or missing required fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse either a single message or a JSON array of messages.
    [[nodiscard]] static Payload parse_payload(std::string_view raw);

    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
    [[nodiscard]] static std::string serialize_batch(const std::vector<JsonRpcMessage>& msgs);

private:
    static nlohmann::json decode(std::string_view raw);
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace ctx7
