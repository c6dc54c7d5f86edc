#include <gtest/gtest.h>
#include "ctx7/docs_client.hpp"
#include "ctx7/error.hpp"
#include <httplib.h>
#include <chrono>
#include <mutex>
#include <thread>

using namespace ctx7;

// ---- Decoding ----

TEST(SearchResultJson, ServiceFieldNames) {
    auto r = nlohmann::json::parse(R"({"id":"/facebook/react","title":"React",
        "description":"UI library","totalSnippets":1200,"stars":220000})").get<SearchResult>();
    EXPECT_EQ(r.id, "/facebook/react");
    EXPECT_EQ(r.name, "React");
    EXPECT_EQ(r.description, "UI library");
    EXPECT_EQ(r.snippet_count, std::optional<int64_t>(1200));
    EXPECT_EQ(r.star_count, std::optional<int64_t>(220000));
}

TEST(SearchResultJson, ShortFieldNames) {
    auto r = nlohmann::json::parse(R"({"id":"/a/b","name":"B","snippetCount":3,"starCount":4})")
                 .get<SearchResult>();
    EXPECT_EQ(r.name, "B");
    EXPECT_TRUE(r.description.empty());
    EXPECT_EQ(r.snippet_count, std::optional<int64_t>(3));
    EXPECT_EQ(r.star_count, std::optional<int64_t>(4));
}

TEST(SearchResultJson, MissingCountsStayUnknown) {
    auto r = nlohmann::json::parse(R"({"id":"/a/b","title":"B","stars":"many"})").get<SearchResult>();
    EXPECT_FALSE(r.snippet_count.has_value());
    EXPECT_FALSE(r.star_count.has_value());
}

// ---- Base URL ----

TEST(HttpDocsClient, SplitsBaseUrl) {
    HttpDocsClient client({"https://context7.com/api/", 10, 60});
    EXPECT_EQ(client.origin(), "https://context7.com");
    EXPECT_EQ(client.prefix(), "/api");
}

TEST(HttpDocsClient, BaseUrlWithoutPath) {
    HttpDocsClient client({"http://127.0.0.1:8080", 10, 60});
    EXPECT_EQ(client.origin(), "http://127.0.0.1:8080");
    EXPECT_TRUE(client.prefix().empty());
}

// ---- Against a local stand-in for the service ----

class HttpDocsClientTest : public ::testing::Test {
protected:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;

    std::mutex mutex_;
    httplib::Params last_params_;
    std::string last_path_;
    std::string last_source_header_;

    void SetUp() override {
        server_.Get("/api/v1/search", [this](const httplib::Request& req, httplib::Response& res) {
            remember(req);
            auto query = req.get_param_value("query");
            if (query == "nothing") {
                res.set_content(R"({"results":[]})", "application/json");
            } else if (query == "broken") {
                res.set_content(R"({"error":"x"})", "application/json");
            } else if (query == "down") {
                res.status = 503;
            } else {
                res.set_content(R"({"results":[{"id":"/facebook/react","title":"React",)"
                                R"("description":"UI","totalSnippets":10,"stars":5}]})",
                                "application/json");
            }
        });
        server_.Get(R"(/api/v1/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            remember(req);
            if (req.path == "/api/v1/missing/lib") {
                res.set_content("No content available", "text/plain");
            } else if (req.path == "/api/v1/gone/lib") {
                res.status = 404;
            } else {
                res.set_content("# Docs for " + req.path, "text/plain");
            }
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        for (int i = 0; i < 100 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    void remember(const httplib::Request& req) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_params_ = req.params;
        last_path_ = req.path;
        last_source_header_ = req.get_header_value("X-Context7-Source");
    }

    std::string param(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_params_.find(key);
        return it == last_params_.end() ? std::string("<absent>") : it->second;
    }

    HttpDocsClient client() {
        return HttpDocsClient({"http://127.0.0.1:" + std::to_string(port_) + "/api", 5, 5});
    }
};

TEST_F(HttpDocsClientTest, SearchDecodesResults) {
    auto c = client();
    auto res = c.search("react hooks");
    ASSERT_TRUE(res.has_value());
    ASSERT_EQ(res->results.size(), 1u);
    EXPECT_EQ(res->results[0].name, "React");
    EXPECT_EQ(param("query"), "react hooks");
    EXPECT_EQ(last_source_header_, "mcp-server");
}

TEST_F(HttpDocsClientTest, SearchEmptyList) {
    auto c = client();
    auto res = c.search("nothing");
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->results.empty());
}

TEST_F(HttpDocsClientTest, SearchWithoutResultsIsAbsent) {
    auto c = client();
    EXPECT_FALSE(c.search("broken").has_value());
    EXPECT_FALSE(c.search("down").has_value());
}

TEST_F(HttpDocsClientTest, FetchSendsOptions) {
    auto c = client();
    FetchOptions opts;
    opts.tokens = 12000;
    opts.topic = "routing";
    opts.folders = "/hooks";
    opts.lang = "python";
    opts.version = "3.11";

    auto text = c.fetch("/vercel/next.js", opts);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "# Docs for /api/v1/vercel/next.js");
    EXPECT_EQ(param("tokens"), "12000");
    EXPECT_EQ(param("topic"), "routing");
    EXPECT_EQ(param("folders"), "/hooks");
    EXPECT_EQ(param("lang"), "python");
    EXPECT_EQ(param("python"), "3.11");
    EXPECT_EQ(param("type"), "txt");
}

TEST_F(HttpDocsClientTest, FetchOmitsEmptyOptions) {
    auto c = client();
    FetchOptions opts;
    opts.tokens = 10000;
    opts.lang = "go";
    ASSERT_TRUE(c.fetch("gin-gonic/gin", opts).has_value());
    EXPECT_EQ(param("topic"), "<absent>");
    EXPECT_EQ(param("folders"), "<absent>");
    EXPECT_EQ(param("python"), "<absent>");
}

TEST_F(HttpDocsClientTest, FetchPlaceholderBodiesAreAbsent) {
    auto c = client();
    EXPECT_FALSE(c.fetch("/missing/lib", FetchOptions{}).has_value());
    EXPECT_FALSE(c.fetch("/gone/lib", FetchOptions{}).has_value());
}

TEST(HttpDocsClient, UnreachableServiceThrows) {
    // Port 1 on loopback has no listener.
    HttpDocsClient client({"http://127.0.0.1:1", 1, 1});
    EXPECT_THROW(client.search("react"), RemoteError);
    EXPECT_THROW(client.fetch("/a/b", FetchOptions{}), RemoteError);
}
