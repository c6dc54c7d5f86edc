#include "ctx7/docs_client.hpp"
#include "ctx7/error.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace ctx7 {

namespace {

const char* const kSourceHeader = "X-Context7-Source";
const char* const kSourceValue = "mcp-server";

std::optional<int64_t> first_integer(const nlohmann::json& j, const char* a, const char* b) {
    for (const char* key : {a, b}) {
        auto it = j.find(key);
        if (it != j.end() && it->is_number()) {
            return it->get<int64_t>();
        }
    }
    return std::nullopt;
}

std::string first_string(const nlohmann::json& j, const char* a, const char* b) {
    for (const char* key : {a, b}) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

bool is_success(int status) {
    return status >= 200 && status < 300;
}

} // namespace

void from_json(const nlohmann::json& j, SearchResult& r) {
    r.id = j.value("id", std::string());
    r.name = first_string(j, "title", "name");
    r.description = j.value("description", std::string());
    r.snippet_count = first_integer(j, "totalSnippets", "snippetCount");
    r.star_count = first_integer(j, "stars", "starCount");
}

HttpDocsClient::HttpDocsClient(Options opts)
    : opts_(std::move(opts)) {
    std::string url = opts_.base_url;
    std::string scheme = "http://";
    if (url.rfind("https://", 0) == 0) {
        scheme = "https://";
        url = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        url = url.substr(7);
    }

    auto slash = url.find('/');
    origin_ = scheme + (slash == std::string::npos ? url : url.substr(0, slash));
    prefix_ = slash == std::string::npos ? std::string() : url.substr(slash);
    while (!prefix_.empty() && prefix_.back() == '/') prefix_.pop_back();
}

HttpDocsClient::~HttpDocsClient() = default;

std::unique_ptr<httplib::Client> HttpDocsClient::make_client() const {
    auto client = std::make_unique<httplib::Client>(origin_);
    client->set_connection_timeout(opts_.connect_timeout_sec);
    client->set_read_timeout(opts_.read_timeout_sec);
    client->set_follow_location(true);
    return client;
}

std::optional<SearchResponse> HttpDocsClient::search(const std::string& query) {
    auto client = make_client();
    httplib::Params params{{"query", query}};
    httplib::Headers headers{{kSourceHeader, kSourceValue}};

    auto res = client->Get(prefix_ + "/v1/search", params, headers);
    if (!res) {
        throw RemoteError("Search request failed: " + httplib::to_string(res.error()));
    }
    if (!is_success(res->status)) {
        spdlog::warn("Search for '{}' answered HTTP {}", query, res->status);
        return std::nullopt;
    }

    auto doc = nlohmann::json::parse(res->body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw RemoteError("Search response is not valid JSON");
    }
    auto results = doc.find("results");
    if (results == doc.end() || !results->is_array()) {
        return std::nullopt;
    }

    SearchResponse out;
    out.results = results->get<std::vector<SearchResult>>();
    return out;
}

std::optional<std::string> HttpDocsClient::fetch(const std::string& library_id,
                                                 const FetchOptions& opts) {
    std::string id = library_id;
    if (!id.empty() && id.front() == '/') id.erase(0, 1);

    httplib::Params params;
    if (opts.tokens > 0) params.emplace("tokens", std::to_string(opts.tokens));
    if (!opts.topic.empty()) params.emplace("topic", opts.topic);
    if (!opts.folders.empty()) params.emplace("folders", opts.folders);
    if (!opts.lang.empty()) params.emplace("lang", opts.lang);
    if (opts.version) params.emplace("python", *opts.version);
    params.emplace("type", "txt");

    httplib::Headers headers{{kSourceHeader, kSourceValue}};

    auto client = make_client();
    auto res = client->Get(prefix_ + "/v1/" + id, params, headers);
    if (!res) {
        throw RemoteError("Documentation request failed: " + httplib::to_string(res.error()));
    }
    if (!is_success(res->status)) {
        spdlog::warn("Documentation fetch for '{}' answered HTTP {}", id, res->status);
        return std::nullopt;
    }

    const auto& body = res->body;
    if (body.empty() || body == "No content available" || body == "No context data available") {
        return std::nullopt;
    }
    return body;
}

} // namespace ctx7
