#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace httplib { class Client; }

namespace ctx7 {

struct SearchResult {
    std::string id;
    std::string name;
    std::string description;
    std::optional<int64_t> snippet_count;
    std::optional<int64_t> star_count;
};

struct SearchResponse {
    std::vector<SearchResult> results;
};

struct FetchOptions {
    int64_t tokens = 0;
    std::string topic;
    std::string folders;
    std::string lang;
    std::optional<std::string> version;
};

/// Tolerant decoding of one search hit. Accepts both the service field names
/// (title, totalSnippets, stars) and the short ones (name, snippetCount, starCount).
void from_json(const nlohmann::json& j, SearchResult& r);

/// Remote documentation index. Implementations throw RemoteError when the
/// service cannot be reached; an empty optional means it answered with nothing usable.
class IDocsClient {
public:
    virtual ~IDocsClient() = default;

    virtual std::optional<SearchResponse> search(const std::string& query) = 0;
    virtual std::optional<std::string> fetch(const std::string& library_id,
                                             const FetchOptions& opts) = 0;
};

/// IDocsClient over the Context7 HTTP API.
class HttpDocsClient : public IDocsClient {
public:
    struct Options {
        std::string base_url = "https://context7.com/api";
        int connect_timeout_sec = 10;
        int read_timeout_sec = 60;
    };

    explicit HttpDocsClient(Options opts);
    ~HttpDocsClient() override;

    std::optional<SearchResponse> search(const std::string& query) override;
    std::optional<std::string> fetch(const std::string& library_id,
                                     const FetchOptions& opts) override;

    /// scheme://host[:port] part of the base URL.
    [[nodiscard]] const std::string& origin() const { return origin_; }
    /// Path prefix of the base URL, without a trailing slash.
    [[nodiscard]] const std::string& prefix() const { return prefix_; }

private:
    std::unique_ptr<httplib::Client> make_client() const;

    Options opts_;
    std::string origin_;
    std::string prefix_;
};

} // namespace ctx7
