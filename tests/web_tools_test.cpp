#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

#include "agent/tools/tool_registry.hpp"
#include "agent/tools/web.hpp"
#include "test_support.hpp"

namespace {

using namespace rampart::agent::tools;
using rampart::testing::ScopedEnv;

TEST(StripHtmlTest, DropsMarkupScriptsAndStyles) {
    const std::string html =
        "<html><head><style>.a { color: red; }</style><script>alert('x')</script></head>"
        "<body><p>Hello <b>world</b></p>\n\n<div>Second   line</div><SCRIPT type=\"t\">bad()</SCRIPT>Tail</body></html>";
    EXPECT_EQ(StripHtml(html), "Hello world Second line Tail");
    EXPECT_EQ(StripHtml("no markup"), "no markup");
    EXPECT_EQ(StripHtml("<script>never closed"), "");
}

TEST(WebSearchToolTest, RequiresApiKeyAndQuery) {
    WebSearchTool search("", std::nullopt);
    const auto missing_key = search.Execute({{"query", "rust"}});
    EXPECT_FALSE(missing_key["success"].get<bool>());
    EXPECT_EQ(missing_key["error"], "Brave web search requires BRAVE_API_KEY");
    EXPECT_TRUE(missing_key["results"].empty());

    WebSearchTool keyed("key", std::nullopt);
    EXPECT_EQ(keyed.Execute(nlohmann::json::object())["error"], "query is required");
}

TEST(WebFetchToolTest, RejectsNonHttpUrls) {
    WebFetchTool fetch(std::nullopt);
    const auto result = fetch.Execute({{"url", "ftp://example.com/file"}});
    EXPECT_FALSE(result["success"].get<bool>());
    EXPECT_EQ(result["error"], "Invalid URL: ftp://example.com/file");
    EXPECT_FALSE(fetch.Execute({{"url", "http://"}})["success"].get<bool>());
}

class WebFetchServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
            cleared_.push_back(std::make_unique<ScopedEnv>(name, ""));
        }
        server_.Get("/page", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("<html><body><h1>Title</h1><p>Body text</p></body></html>", "text/html");
        });
        server_.Get("/big", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(std::string(30000, 'z'), "text/plain");
        });
        server_.Get("/missing", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string Url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    rampart::testing::TempDir dir_;
    std::vector<std::unique_ptr<ScopedEnv>> cleared_;
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

TEST_F(WebFetchServerTest, FetchesAndStripsHtml) {
    WebFetchTool fetch(std::nullopt);
    const auto raw = fetch.Execute({{"url", Url("/page")}});
    ASSERT_TRUE(raw["success"].get<bool>()) << raw.dump();
    EXPECT_EQ(raw["status"], 200);
    EXPECT_NE(raw["content"].get<std::string>().find("<h1>"), std::string::npos);

    const auto text = fetch.Execute({{"url", Url("/page")}, {"textOnly", true}});
    EXPECT_EQ(text["content"], "Title Body text");
}

TEST_F(WebFetchServerTest, ReportsHttpErrors) {
    WebFetchTool fetch(std::nullopt);
    const auto result = fetch.Execute({{"url", Url("/missing")}});
    EXPECT_FALSE(result["success"].get<bool>());
    EXPECT_EQ(result["error"], "HTTP 404");
    EXPECT_EQ(result["status"], 404);
}

TEST_F(WebFetchServerTest, TruncatesLargeBodies) {
    WebFetchTool fetch(dir_.Path());
    const auto result = fetch.Execute({{"url", Url("/big")}});
    ASSERT_TRUE(result["success"].get<bool>());
    EXPECT_TRUE(result["truncated"].get<bool>());
    EXPECT_EQ(result["content"].get<std::string>().size(), 20000u);
    ASSERT_TRUE(result.contains("savedPath"));
    EXPECT_TRUE(std::filesystem::exists(result["savedPath"].get<std::string>()));
}

TEST(RegisterWebToolsTest, AddsBothTools) {
    ToolRegistry registry;
    RegisterWebTools(registry, "", std::nullopt);
    EXPECT_TRUE(registry.Has("webSearch"));
    EXPECT_TRUE(registry.Has("webFetch"));
}

}  // namespace
