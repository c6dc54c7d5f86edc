#pragma once
#include "config.hpp"
#include "docs_client.hpp"
#include "event_logger.hpp"
#include "types.hpp"
#include "validation.hpp"
#include <memory>
#include <string>

namespace ctx7 {

class Server;

namespace tools {
    constexpr const char* ResolveLibraryId = "resolve-library-id";
    constexpr const char* GetLibraryDocs   = "get-library-docs";
} // namespace tools

extern const char* const kFailedToRetrieveMessage;
extern const char* const kNoLibrariesMessage;
extern const char* const kDocsNotFoundMessage;

/// Render search hits as the text block returned by resolve-library-id.
[[nodiscard]] std::string format_search_results(const SearchResponse& response);

/// The two documentation tools. Every outcome, including an exception from
/// the docs client, comes back as a CallToolResult; nothing is thrown.
class DocsToolHandlers {
public:
    DocsToolHandlers(ConfigPtr config,
                     TokenPolicy policy,
                     std::shared_ptr<IDocsClient> client,
                     std::shared_ptr<IEventLogger> events);

    CallToolResult resolve_library_id(const nlohmann::json& arguments);
    CallToolResult get_library_docs(const nlohmann::json& arguments);

    [[nodiscard]] ToolDefinition resolve_definition() const;
    [[nodiscard]] ToolDefinition docs_definition() const;

    /// Add both tools to the server's registry. The server must not outlive `this`.
    void register_tools(Server& server);

private:
    ConfigPtr config_;
    TokenPolicy policy_;
    std::shared_ptr<IDocsClient> client_;
    std::shared_ptr<IEventLogger> events_;
};

} // namespace ctx7
