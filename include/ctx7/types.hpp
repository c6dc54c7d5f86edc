#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace ctx7 {

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

// ---------- Tool ----------

struct ToolAnnotations {
    std::optional<std::string> title;
    bool read_only_hint = false;
    bool destructive_hint = true;
    bool idempotent_hint = false;
    bool open_world_hint = true;

    bool operator==(const ToolAnnotations& o) const {
        return title == o.title && read_only_hint == o.read_only_hint
               && destructive_hint == o.destructive_hint
               && idempotent_hint == o.idempotent_hint
               && open_world_hint == o.open_world_hint;
    }
};

struct ToolDefinition {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json input_schema;
    std::optional<ToolAnnotations> annotations;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && title == o.title && description == o.description
               && input_schema == o.input_schema && annotations == o.annotations;
    }
};

/// Result envelope of every tool call. Success, validation failure and
/// remote failure all take this shape.
struct CallToolResult {
    std::vector<TextContent> content;
    bool is_error = false;

    static CallToolResult text(std::string body) {
        CallToolResult r;
        r.content.push_back(TextContent{std::move(body)});
        return r;
    }

    static CallToolResult error(std::string message) {
        CallToolResult r = text(std::move(message));
        r.is_error = true;
        return r;
    }

    bool operator==(const CallToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }
};

// ---------- Lifecycle ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const ToolAnnotations& a);

void to_json(nlohmann::json& j, const ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);

void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace ctx7
