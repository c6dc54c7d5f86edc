#include "ctx7/codec.hpp"
#include "ctx7/error.hpp"
#include "ctx7/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace ctx7 {

namespace {

// Tool output carries remote text verbatim; invalid UTF-8 becomes U+FFFD
// instead of failing the whole reply.
std::string dump_lenient(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            simdjson::ondemand::number num = val.get_number();
            switch (num.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(num.get_int64());
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(num.get_uint64());
                default:
                    return nlohmann::json(num.get_double());
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(val.get_bool()));
        default:
            return nlohmann::json(nullptr);
    }
}

std::string require_method(const nlohmann::json& j) {
    const auto& m = j.at("method");
    if (!m.is_string()) throw ParseError("'method' must be a string");
    return m.get<std::string>();
}

RequestId require_id(const nlohmann::json& j) {
    const auto& id = j.at("id");
    if (id.is_null()) throw ParseError("'id' must not be null");
    RequestId out;
    try {
        from_json(id, out);
    } catch (const std::invalid_argument& e) {
        throw ParseError(e.what());
    }
    return out;
}

} // namespace

nlohmann::json Codec::decode(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    try {
        simdjson::ondemand::value root = doc.get_value();
        return to_nlohmann(root);
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }
    auto ver = j.find("jsonrpc");
    if (ver == j.end() || !ver->is_string() || ver->get<std::string>() != JSONRPC_VERSION) {
        throw ParseError("Invalid or missing jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_method && has_id) {
        JsonRpcRequest req;
        req.id = require_id(j);
        req.method = require_method(j);
        if (j.contains("params")) req.params = j.at("params");
        return req;
    }
    if (has_method) {
        JsonRpcNotification notif;
        notif.method = require_method(j);
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    }
    if (has_id) {
        JsonRpcResponse resp;
        resp.id = require_id(j);
        if (j.contains("result")) resp.result = j.at("result");
        if (j.contains("error")) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception& e) {
                throw ParseError(std::string("Malformed error object: ") + e.what());
            }
        }
        return resp;
    }
    throw ParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return parse_object(decode(raw));
}

Payload Codec::parse_payload(std::string_view raw) {
    nlohmann::json j = decode(raw);
    Payload out;
    if (!j.is_array()) {
        out.messages.push_back(parse_object(j));
        return out;
    }
    if (j.empty()) {
        throw ParseError("Batch must not be empty");
    }
    out.batch = true;
    out.messages.reserve(j.size());
    for (const auto& item : j) {
        out.messages.push_back(parse_object(item));
    }
    return out;
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return dump_lenient(j);
}

std::string Codec::serialize_batch(const std::vector<JsonRpcMessage>& msgs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& msg : msgs) {
        nlohmann::json j;
        to_json(j, msg);
        arr.push_back(std::move(j));
    }
    return dump_lenient(arr);
}

} // namespace ctx7
