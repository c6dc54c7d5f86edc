#include "ctx7/types.hpp"
#include <stdexcept>

namespace ctx7 {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    if (j.value("type", std::string("text")) != "text") {
        throw std::invalid_argument("Unsupported content type: " + j.at("type").dump());
    }
    j.at("text").get_to(t.text);
}

// ---------- Tool ----------

void to_json(nlohmann::json& j, const ToolAnnotations& a) {
    j = {
        {"readOnlyHint", a.read_only_hint},
        {"destructiveHint", a.destructive_hint},
        {"idempotentHint", a.idempotent_hint},
        {"openWorldHint", a.open_world_hint}
    };
    if (a.title) j["title"] = *a.title;
}

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.title) j["title"] = *t.title;
    if (t.description) j["description"] = *t.description;
    if (t.annotations) j["annotations"] = *t.annotations;
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = {{"content", t.content}};
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content = j.at("content").get<std::vector<TextContent>>();
    t.is_error = j.value("isError", false);
}

// ---------- Lifecycle ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    j.at("name").get_to(t.name);
    t.version = j.value("version", std::string());
}

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

} // namespace ctx7
