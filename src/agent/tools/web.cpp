#include "agent/tools/web.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

#include "httplib.h"
#include "agent/tools/tool_registry.hpp"
#include "output/truncation.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rampart::agent::tools {
namespace {

constexpr int kMaxSearchResults = 10;

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string path;
};

std::optional<ParsedUrl> ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working;
    if (utils::StartsWith(url, "https://")) {
        working = url.substr(8);
    } else if (utils::StartsWith(url, "http://")) {
        parsed.https = false;
        parsed.port = 80;
        working = url.substr(7);
    } else {
        return std::nullopt;
    }

    const auto slash_pos = working.find_first_of("/?#");
    std::string host_port = working;
    parsed.path = "/";
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.path = working.substr(slash_pos);
        if (parsed.path.front() != '/') {
            parsed.path.insert(0, "/");
        }
        if (const auto hash = parsed.path.find('#'); hash != std::string::npos) {
            parsed.path.erase(hash);
        }
    }
    if (const auto at = host_port.rfind('@'); at != std::string::npos) {
        host_port.erase(0, at + 1);
    }

    const auto colon_pos = host_port.rfind(':');
    if (colon_pos != std::string::npos && host_port.find(']', colon_pos) == std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        parsed.host = host_port;
    }
    if (parsed.host.empty() || parsed.port <= 0 || parsed.port > 65535) {
        return std::nullopt;
    }
    return parsed;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

// Inside the sandbox these point at the filtering proxy.
void ApplyProxy(httplib::Client& client) {
    for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
        std::string host;
        int port = 0;
        if (ParseProxyHostPort(utils::GetEnv(name), host, port)) {
            client.set_proxy(host, port);
            return;
        }
    }
}

httplib::Client MakeClient(const ParsedUrl& url, int timeout_seconds) {
    std::string scheme_host_port = url.https ? "https://" : "http://";
    scheme_host_port += url.host + ":" + std::to_string(url.port);
    httplib::Client client(scheme_host_port);
    client.set_connection_timeout(timeout_seconds);
    client.set_read_timeout(timeout_seconds);
    client.set_follow_location(true);
    ApplyProxy(client);
    return client;
}

std::string HostOf(const std::string& url) {
    const auto parsed = ParseUrl(url);
    return parsed ? parsed->host : std::string();
}

nlohmann::json TruncatedContent(const std::string& content,
                                const std::optional<std::filesystem::path>& output_dir,
                                nlohmann::json metadata) {
    output::TruncateStringOptions truncate;
    truncate.max_chars = output::limits::kWebContentChars;
    truncate.max_lines = std::numeric_limits<std::size_t>::max();
    truncate.output_dir = output_dir;
    truncate.metadata = std::move(metadata);
    const auto truncation = output::TruncateString(content, truncate);
    nlohmann::json result = {{"content", truncation.data}};
    output::AnnotateTruncation(result, truncation);
    return result;
}

}  // namespace

std::string StripHtml(const std::string& input) {
    const auto lowered = utils::ToLower(input);
    std::string output;
    output.reserve(input.size());
    bool in_tag = false;
    bool last_space = true;
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if (!in_tag && ch == '<') {
            for (const char* block : {"script", "style"}) {
                const std::string open = std::string("<") + block;
                if (lowered.compare(i, open.size(), open) == 0) {
                    const auto close = lowered.find(std::string("</") + block, i);
                    if (close == std::string::npos) {
                        i = input.size();
                    } else {
                        i = close;
                    }
                    break;
                }
            }
            if (i >= input.size()) {
                break;
            }
            in_tag = true;
            continue;
        }
        if (in_tag) {
            if (ch == '>') {
                in_tag = false;
                if (!last_space) {
                    output.push_back(' ');
                    last_space = true;
                }
            }
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (!last_space) {
                output.push_back(' ');
                last_space = true;
            }
        } else {
            output.push_back(ch);
            last_space = false;
        }
    }
    return utils::Trim(output);
}

WebSearchTool::WebSearchTool(std::string api_key, std::optional<std::filesystem::path> output_dir)
    : api_key_(std::move(api_key))
    , output_dir_(std::move(output_dir)) {}

nlohmann::json WebSearchTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"query", {{"type", "string"}, {"description", "The search query"}}},
            {"limit", {{"type", "integer"}, {"minimum", 1}, {"maximum", kMaxSearchResults},
                       {"description", "Number of results (1-10, default 10)"}}},
        }},
        {"required", {"query"}},
    };
}

nlohmann::json WebSearchTool::Execute(const nlohmann::json& input) {
    const auto query = GetString(input, "query");
    if (query.empty()) {
        return ErrorResult("query is required", {{"results", nlohmann::json::array()}});
    }
    if (api_key_.empty()) {
        return ErrorResult("Brave web search requires BRAVE_API_KEY",
                           {{"results", nlohmann::json::array()}});
    }
    const auto limit = static_cast<int>(
        std::clamp<long long>(GetInteger(input, "limit").value_or(kMaxSearchResults), 1, kMaxSearchResults));

    const auto base = ParseUrl("https://api.search.brave.com");
    auto client = MakeClient(*base, 15);
    const std::string path = "/res/v1/web/search?q=" + UrlEncode(query) + "&count=" + std::to_string(limit);
    httplib::Headers headers{{"Accept", "application/json"}, {"X-Subscription-Token", api_key_}};
    auto response = client.Get(path.c_str(), headers);
    if (!response) {
        return ErrorResult("Web search request failed: " + httplib::to_string(response.error()),
                           {{"results", nlohmann::json::array()}});
    }
    if (response->status >= 400) {
        return ErrorResult("Brave Search API error: " + std::to_string(response->status) + " - " +
                               utils::SanitizeUtf8(output::Utf8Prefix(response->body, 500)),
                           {{"results", nlohmann::json::array()}});
    }
    const auto doc = nlohmann::json::parse(response->body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return ErrorResult("Brave Search API returned invalid JSON", {{"results", nlohmann::json::array()}});
    }

    nlohmann::json results = nlohmann::json::array();
    if (doc.contains("web") && doc["web"].is_object() && doc["web"].contains("results") &&
        doc["web"]["results"].is_array()) {
        for (const auto& item : doc["web"]["results"]) {
            if (static_cast<int>(results.size()) >= limit) {
                break;
            }
            if (!item.is_object()) {
                continue;
            }
            const auto url = item.value("url", "");
            nlohmann::json entry = {
                {"title", item.value("title", "")},
                {"link", url},
                {"snippet", item.value("description", "")},
                {"siteName", HostOf(url)},
            };
            if (item.contains("age") && item["age"].is_string()) {
                entry["published"] = item["age"];
            }
            results.push_back(std::move(entry));
        }
    }

    nlohmann::json result = {{"success", true}, {"provider", "brave"}, {"query", query}};
    const auto serialized = results.dump();
    if (serialized.size() > output::limits::kWebContentChars) {
        auto truncated = TruncatedContent(results.dump(2), output_dir_, {{"tool", Name()}, {"query", query}});
        result.update(truncated);
        result["results"] = nlohmann::json::array();
        return result;
    }
    result["results"] = std::move(results);
    return result;
}

WebFetchTool::WebFetchTool(std::optional<std::filesystem::path> output_dir)
    : output_dir_(std::move(output_dir)) {}

nlohmann::json WebFetchTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"url", {{"type", "string"}, {"description", "http:// or https:// URL to fetch"}}},
            {"textOnly", {{"type", "boolean"}, {"default", false},
                          {"description", "Strip HTML markup and return plain text"}}},
        }},
        {"required", {"url"}},
    };
}

nlohmann::json WebFetchTool::Execute(const nlohmann::json& input) {
    const auto url = GetString(input, "url");
    const auto parsed = ParseUrl(url);
    if (!parsed) {
        return ErrorResult("Invalid URL: " + url, {{"url", url}});
    }
    auto client = MakeClient(*parsed, 20);
    auto response = client.Get(parsed->path.c_str());
    if (!response) {
        return ErrorResult("Request failed: " + httplib::to_string(response.error()), {{"url", url}});
    }
    if (response->status >= 400) {
        return ErrorResult("HTTP " + std::to_string(response->status), {{"url", url}, {"status", response->status}});
    }

    auto body = utils::SanitizeUtf8(response->body);
    if (GetBool(input, "textOnly")) {
        body = StripHtml(body);
    }
    nlohmann::json result = {
        {"success", true},
        {"url", url},
        {"status", response->status},
        {"contentType", utils::SanitizeUtf8(response->get_header_value("Content-Type"))},
    };
    result.update(TruncatedContent(body, output_dir_, {{"tool", Name()}, {"url", url}}));
    return result;
}

void RegisterWebTools(ToolRegistry& registry,
                      const std::string& brave_api_key,
                      const std::optional<std::filesystem::path>& output_dir) {
    registry.Register(ToolKind::kWebSearch, std::make_shared<WebSearchTool>(brave_api_key, output_dir));
    registry.Register(ToolKind::kWebFetch, std::make_shared<WebFetchTool>(output_dir));
    utils::LogDebug("tool", "web tools registered");
}

}  // namespace rampart::agent::tools
