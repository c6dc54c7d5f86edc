#include "ctx7/tool_handlers.hpp"
#include "ctx7/server.hpp"

#include <sstream>

namespace ctx7 {

const char* const kFailedToRetrieveMessage =
    "Failed to retrieve library documentation data from Context7";
const char* const kNoLibrariesMessage = "No documentation libraries available";
const char* const kDocsNotFoundMessage =
    "Documentation not found or not finalized for this library. This might have happened "
    "because you used an invalid Context7-compatible library ID. To get a valid "
    "Context7-compatible library ID, use the 'resolve-library-id' with the package name "
    "you wish to retrieve documentation for.";

namespace {

const char* const kResolvePreamble =
    "Available Libraries (top matches):\n\n"
    "Each result includes:\n"
    "- Library ID: Context7-compatible identifier (format: /org/repo)\n"
    "- Name: Library or package name\n"
    "- Description: Short summary\n"
    "- Code Snippets: Number of available code examples\n"
    "- GitHub Stars: Popularity indicator\n\n"
    "For best results, select libraries based on name match, popularity (stars), "
    "snippet coverage, and relevance to your use case.\n\n"
    "---\n\n";

const char* const kResolveDescription =
    "Resolves a package name to a Context7-compatible library ID and returns a list of "
    "matching libraries.\n\n"
    "You MUST call this function before 'get-library-docs' to obtain a valid "
    "Context7-compatible library ID.\n\n"
    "When selecting the best match, consider:\n"
    "- Name similarity to the query\n"
    "- Description relevance\n"
    "- Code Snippet count (documentation coverage)\n"
    "- GitHub Stars (popularity)\n\n"
    "> Language and version context are set dynamically from project config "
    "(.context7rc.json) but can be overridden per request.\n\n"
    "Return the selected library ID and explain your choice. If there are multiple good "
    "matches, mention this but proceed with the most relevant one.";

const char* const kDocsDescription =
    "Fetches up-to-date documentation for a library. You must call 'resolve-library-id' "
    "first to obtain the exact Context7-compatible library ID required to use this tool. "
    "Language and version are dynamic and project-aware, but can be overridden per request.";

ToolAnnotations read_only_annotations(const char* title) {
    ToolAnnotations a;
    a.title = title;
    a.read_only_hint = true;
    a.destructive_hint = false;
    a.idempotent_hint = true;
    a.open_world_hint = true;
    return a;
}

nlohmann::json docs_details(const DocsRequest& req) {
    nlohmann::json d = {
        {"libraryId", req.library_id},
        {"tokens", req.tokens},
        {"topic", req.topic},
        {"lang", req.lang}
    };
    if (!req.folders.empty()) d["folders"] = req.folders;
    if (req.version) d["python"] = *req.version;
    return d;
}

} // namespace

std::string format_search_results(const SearchResponse& response) {
    std::ostringstream out;
    bool first = true;
    for (const auto& r : response.results) {
        if (!first) out << "\n----------\n";
        first = false;

        out << "- Title: " << r.name << "\n"
            << "- Context7-compatible library ID: " << r.id << "\n"
            << "- Description: " << r.description;
        if (r.snippet_count) out << "\n- Code Snippets: " << *r.snippet_count;
        if (r.star_count) out << "\n- GitHub Stars: " << *r.star_count;
    }
    return out.str();
}

DocsToolHandlers::DocsToolHandlers(ConfigPtr config,
                                   TokenPolicy policy,
                                   std::shared_ptr<IDocsClient> client,
                                   std::shared_ptr<IEventLogger> events)
    : config_(std::move(config)),
      policy_(policy),
      client_(std::move(client)),
      events_(std::move(events)) {
    if (!config_) config_ = std::make_shared<const ConfigSnapshot>();
}

CallToolResult DocsToolHandlers::resolve_library_id(const nlohmann::json& arguments) {
    events_->log_event("resolve-library-id invoked", arguments);

    auto validated = validate_resolve(arguments, *config_);
    if (auto* err = std::get_if<ValidationError>(&validated)) {
        events_->log_event("resolve-library-id error: invalid libraryName", arguments);
        return CallToolResult::error(err->message);
    }
    const auto& query = std::get<ResolveQuery>(validated).query;
    nlohmann::json details = {{"searchQuery", query}};

    try {
        auto response = client_->search(query);
        if (!response) {
            events_->log_event("resolve-library-id error: no results", details);
            return CallToolResult::error(kFailedToRetrieveMessage);
        }
        if (response->results.empty()) {
            events_->log_event("resolve-library-id error: empty results", details);
            return CallToolResult::error(kNoLibrariesMessage);
        }

        auto body = std::string(kResolvePreamble) + format_search_results(*response);
        events_->log_event("resolve-library-id success", details);
        return CallToolResult::text(std::move(body));
    } catch (const std::exception& e) {
        events_->log_event("resolve-library-id error: exception", {{"error", e.what()}});
        return CallToolResult::error(std::string("Error: ") + e.what());
    }
}

CallToolResult DocsToolHandlers::get_library_docs(const nlohmann::json& arguments) {
    events_->log_event("get-library-docs invoked", arguments);

    auto validated = validate_docs(arguments, *config_, policy_);
    if (auto* err = std::get_if<ValidationError>(&validated)) {
        events_->log_event("get-library-docs error: invalid arguments",
                           {{"error", err->message}, {"arguments", arguments}});
        return CallToolResult::error(err->message);
    }
    const auto& req = std::get<DocsRequest>(validated);
    auto details = docs_details(req);

    FetchOptions opts;
    opts.tokens = req.tokens;
    opts.topic = req.topic;
    opts.folders = req.folders;
    opts.lang = req.lang;
    opts.version = req.version;

    try {
        auto text = client_->fetch(req.library_id, opts);
        if (!text || text->empty()) {
            events_->log_event("get-library-docs error: not found", details);
            return CallToolResult::error(kDocsNotFoundMessage);
        }
        events_->log_event("get-library-docs success", details);
        return CallToolResult::text(std::move(*text));
    } catch (const std::exception& e) {
        events_->log_event("get-library-docs error: exception", {{"error", e.what()}});
        return CallToolResult::error(std::string("Error: ") + e.what());
    }
}

ToolDefinition DocsToolHandlers::resolve_definition() const {
    ToolDefinition def;
    def.name = tools::ResolveLibraryId;
    def.title = "Resolve Library ID";
    def.description = kResolveDescription;
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"libraryName", {
                {"type", "string"},
                {"description", "Library name to search for and retrieve a Context7-compatible "
                                "library ID. Language and version context are set dynamically "
                                "from project config but can be overridden."}
            }}
        }},
        {"required", nlohmann::json::array({"libraryName"})}
    };
    def.annotations = read_only_annotations("Resolve Library ID");
    return def;
}

ToolDefinition DocsToolHandlers::docs_definition() const {
    ToolDefinition def;
    def.name = tools::GetLibraryDocs;
    def.title = "Get Library Documentation";
    def.description = kDocsDescription;
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"context7CompatibleLibraryID", {
                {"type", "string"},
                {"description", "Exact Context7-compatible library ID (e.g., 'mongodb/docs', "
                                "'vercel/nextjs') retrieved from 'resolve-library-id'."}
            }},
            {"topic", {
                {"type", "string"},
                {"description", "Topic to focus documentation on (e.g., 'hooks', 'routing')."}
            }},
            {"tokens", {
                {"type", nlohmann::json::array({"number", "string"})},
                {"description", "Maximum number of tokens of documentation to retrieve (default: "
                                + std::to_string(policy_.minimum)
                                + "). Higher values provide more context but consume more tokens."}
            }},
            {"lang", {
                {"type", "string"},
                {"description", "Programming language, e.g. 'python'. If omitted, project "
                                "default is used."}
            }},
            {"python", {
                {"type", "string"},
                {"description", "Python version, e.g. '3.11'. If omitted, project default is "
                                "used for Python."}
            }}
        }},
        {"required", nlohmann::json::array({"context7CompatibleLibraryID"})}
    };
    def.annotations = read_only_annotations("Get Library Documentation");
    return def;
}

void DocsToolHandlers::register_tools(Server& server) {
    server.add_tool(resolve_definition(),
        [this](const nlohmann::json& args) { return resolve_library_id(args); });
    server.add_tool(docs_definition(),
        [this](const nlohmann::json& args) { return get_library_docs(args); });
}

} // namespace ctx7
