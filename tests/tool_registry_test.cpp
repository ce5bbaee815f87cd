#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "agent/tools/tool_registry.hpp"
#include "test_support.hpp"

namespace {

using namespace rampart::agent::tools;
using nlohmann::json;

class ThrowingReadTool : public Tool {
public:
    std::string Name() const override { return "readFile"; }
    std::string Description() const override { return "always fails"; }
    json InputSchema() const override { return {{"type", "object"}}; }
    json Execute(const json& /*input*/) override { throw std::runtime_error("disk on fire"); }
};

class ToolRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        home_ = std::make_unique<rampart::testing::ScopedEnv>("HOME", (dir_.Path() / "home").string());
        std::filesystem::create_directories(dir_.Path() / "ws");
        config_.tools.base_path = (dir_.Path() / "ws").string();
        config_.tools.output_dir = (dir_.Path() / "out").string();
        config_.tools.command_timeout_ms = 5000;
        registry_ = CreateToolRegistry(config_, nullptr, std::make_shared<PortableSearchBackend>());
    }

    void Rebuild() {
        registry_ = CreateToolRegistry(config_, nullptr, std::make_shared<PortableSearchBackend>());
    }

    rampart::testing::TempDir dir_;
    std::unique_ptr<rampart::testing::ScopedEnv> home_;
    rampart::config::Config config_;
    std::unique_ptr<ToolRegistry> registry_;
};

TEST(ToolKindTest, NamesRoundTrip) {
    EXPECT_STREQ(ToString(ToolKind::kGlobFileSearch), "globFileSearch");
    EXPECT_EQ(ParseToolKind("runCommand"), ToolKind::kRunCommand);
    EXPECT_FALSE(ParseToolKind("spawn").has_value());
}

TEST_F(ToolRegistryTest, RegistersCoreTools) {
    const auto names = registry_->List();
    EXPECT_EQ(names.size(), 10u);
    for (const char* name : {"readFile", "writeFile", "editFile", "deleteFile", "listDirectory", "fileExists",
                             "grep", "globFileSearch", "runCommand", "readToolOutput"}) {
        EXPECT_TRUE(registry_->Has(name)) << name;
    }
    EXPECT_FALSE(registry_->Has("webFetch"));

    const auto defs = registry_->GetDefinitions();
    ASSERT_EQ(defs.size(), 10u);
    for (const auto& def : defs) {
        EXPECT_FALSE(def.description.empty()) << def.name;
        EXPECT_EQ(def.parameters["type"], "object") << def.name;
    }
}

TEST_F(ToolRegistryTest, UnknownToolIsReportedNotThrown) {
    const auto result = registry_->Execute("launchMissiles", json::object());
    EXPECT_FALSE(result["success"].get<bool>());
    EXPECT_EQ(result["error"], "Unknown tool: launchMissiles");
    EXPECT_FALSE(registry_->NeedsApproval("launchMissiles", json::object()));
}

TEST_F(ToolRegistryTest, RegisterRejectsMismatchedKind) {
    ToolRegistry registry;
    EXPECT_THROW(registry.Register(ToolKind::kGrep, std::make_shared<ThrowingReadTool>()), std::invalid_argument);
    EXPECT_THROW(registry.Register(ToolKind::kGrep, nullptr), std::invalid_argument);
}

TEST_F(ToolRegistryTest, EscapedExceptionsBecomeErrorResults) {
    ToolRegistry registry;
    registry.Register(ToolKind::kReadFile, std::make_shared<ThrowingReadTool>());
    const auto result = registry.Execute("readFile", {{"path", "x"}});
    EXPECT_FALSE(result["success"].get<bool>());
    EXPECT_EQ(result["error"], "disk on fire");
}

TEST_F(ToolRegistryTest, FileToolsShareTheBoundary) {
    const auto written = registry_->Execute("writeFile", {{"path", "notes/todo.md"}, {"content", "- ship"}});
    ASSERT_TRUE(written["success"].get<bool>()) << written.dump();
    EXPECT_EQ(registry_->Execute("readFile", {{"path", "notes/todo.md"}})["content"], "- ship");

    const auto escaped = registry_->Execute("writeFile", {{"path", "../escape.md"}, {"content", "x"}});
    EXPECT_FALSE(escaped["success"].get<bool>());
    EXPECT_EQ(escaped["error"], "Path traversal not allowed");

    const auto found = registry_->Execute("grep", {{"pattern", "ship"}});
    EXPECT_EQ(found["totalMatches"], 1);
}

TEST_F(ToolRegistryTest, RunCommandUsesWorkspaceAndReportsExit) {
    const auto result = registry_->Execute("runCommand", {{"command", "pwd; echo done"}});
    ASSERT_TRUE(result["success"].get<bool>()) << result.dump();
    EXPECT_NE(result["stdout"].get<std::string>().find("done"), std::string::npos);
    EXPECT_EQ(result["exitCode"], 0);
    EXPECT_FALSE(result["sandboxed"].get<bool>());
    EXPECT_FALSE(result["stdoutTruncated"].get<bool>());
    EXPECT_EQ(result["command"], "pwd; echo done");

    const auto failed = registry_->Execute("runCommand", {{"command", "echo bad >&2; exit 4"}});
    EXPECT_FALSE(failed["success"].get<bool>());
    EXPECT_EQ(failed["exitCode"], 4);
    EXPECT_EQ(failed["stderr"], "bad");

    const auto outside = registry_->Execute("runCommand", {{"command", "ls"}, {"workingDirectory", "/"}});
    EXPECT_FALSE(outside["success"].get<bool>());

    EXPECT_FALSE(registry_->Execute("runCommand", json::object())["success"].get<bool>());
}

TEST_F(ToolRegistryTest, RunCommandTimesOut) {
    config_.tools.command_timeout_ms = 300;
    Rebuild();
    const auto started = std::chrono::steady_clock::now();
    const auto result = registry_->Execute("runCommand", {{"command", "sleep 20"}});
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_FALSE(result["success"].get<bool>());
    EXPECT_TRUE(result["timedOut"].get<bool>());
    EXPECT_TRUE(result["killed"].get<bool>());
    EXPECT_EQ(result["error"], "Command timed out after 300ms");
}

TEST_F(ToolRegistryTest, LargeOutputIsSavedAndPageable) {
    const auto result = registry_->Execute(
        "runCommand", {{"command", "for i in $(seq 1 12000); do echo \"line $i\"; done"}});
    ASSERT_TRUE(result["success"].get<bool>());
    ASSERT_TRUE(result["stdoutTruncated"].get<bool>());
    EXPECT_LE(result["stdout"].get<std::string>().size(), 50000u);
    ASSERT_TRUE(result.contains("stdoutSavedPath"));
    EXPECT_NE(result["stdoutTruncationMessage"].get<std::string>().find("readToolOutput"), std::string::npos);

    const auto saved = std::filesystem::path(result["stdoutSavedPath"].get<std::string>());
    EXPECT_EQ(saved.parent_path(), dir_.Path() / "out");

    const auto page = registry_->Execute("readToolOutput",
                                         {{"path", saved.filename().string()}, {"offset", 100}, {"limit", 10}});
    ASSERT_TRUE(page["success"].get<bool>()) << page.dump();
    EXPECT_EQ(page["linesReturned"], 10);
    EXPECT_EQ(page["startLine"], 100);
    EXPECT_TRUE(page["hasMore"].get<bool>());
    EXPECT_EQ(page["hint"], "More content available. Use offset=110 to continue reading.");
    EXPECT_GT(page["totalLines"].get<int>(), 12000);
}

TEST_F(ToolRegistryTest, ReadToolOutputReportsMissingFile) {
    const auto result = registry_->Execute("readToolOutput", {{"path", "tool_missing.txt"}});
    EXPECT_FALSE(result["success"].get<bool>());
    EXPECT_NE(result["error"].get<std::string>().find("Tool output file not found"), std::string::npos);
}

TEST_F(ToolRegistryTest, ReadToolOutputStaysInsideOutputDirectory) {
    dir_.Write("secret.txt", "TOPSECRET");
    dir_.Write("out/tool_kept.txt", "kept");

    const auto parent = registry_->Execute("readToolOutput", {{"path", "../secret.txt"}});
    EXPECT_FALSE(parent["success"].get<bool>());
    EXPECT_FALSE(parent.contains("content"));
    EXPECT_NE(parent["error"].get<std::string>().find("outside the tool output directory"), std::string::npos);

    const auto absolute = registry_->Execute("readToolOutput", {{"path", (dir_.Path() / "secret.txt").string()}});
    EXPECT_FALSE(absolute["success"].get<bool>());

    const auto dir_itself = registry_->Execute("readToolOutput", {{"path", "."}});
    EXPECT_FALSE(dir_itself["success"].get<bool>());

    const auto inside = registry_->Execute("readToolOutput", {{"path", (dir_.Path() / "out" / "tool_kept.txt").string()}});
    ASSERT_TRUE(inside["success"].get<bool>()) << inside.dump();
    EXPECT_EQ(inside["content"], "kept");
}

TEST_F(ToolRegistryTest, ReadToolOutputNeedsOutputDirectory) {
    config_.tools.output_dir.clear();
    Rebuild();
    dir_.Write("secret.txt", "TOPSECRET");
    const auto result = registry_->Execute("readToolOutput", {{"path", (dir_.Path() / "secret.txt").string()}});
    EXPECT_FALSE(result["success"].get<bool>());
    EXPECT_EQ(result["error"], "Tool output directory is not configured");
}

TEST_F(ToolRegistryTest, InvalidUtf8FileContentIsReplaced) {
    dir_.Write("ws/latin1.txt", "caf\xE9\n");
    json result;
    ASSERT_NO_THROW(result = registry_->Execute("readFile", {{"path", "latin1.txt"}}));
    ASSERT_TRUE(result["success"].get<bool>()) << result.dump();
    EXPECT_EQ(result["content"], "caf\xEF\xBF\xBD\n");
    EXPECT_NO_THROW(result.dump());

    const auto window = registry_->Execute("readFile", {{"path", "latin1.txt"}, {"offset", 1}, {"limit", 1}});
    EXPECT_EQ(window["content"], "1|caf\xEF\xBF\xBD");
}

TEST_F(ToolRegistryTest, InvalidUtf8CommandOutputIsReplaced) {
    json result;
    ASSERT_NO_THROW(result = registry_->Execute("runCommand", {{"command", "printf 'a\\377b'; printf 'c\\351' >&2"}}));
    ASSERT_TRUE(result["success"].get<bool>()) << result.dump(-1, ' ', false, json::error_handler_t::replace);
    EXPECT_EQ(result["stdout"], "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(result["stderr"], "c\xEF\xBF\xBD");
    EXPECT_NO_THROW(result.dump());
}

TEST_F(ToolRegistryTest, InvalidUtf8SearchAndListingAreReplaced) {
    dir_.Write("ws/menu.txt", "caf\xE9 au lait\n");
    dir_.Write("ws/bad\xFFname.txt", "x");

    json found;
    ASSERT_NO_THROW(found = registry_->Execute("grep", {{"pattern", "au lait"}}));
    ASSERT_TRUE(found["success"].get<bool>());
    ASSERT_EQ(found["matches"].size(), 1u);
    EXPECT_EQ(found["matches"][0]["content"], "caf\xEF\xBF\xBD au lait");
    EXPECT_NO_THROW(found.dump());

    json listing;
    ASSERT_NO_THROW(listing = registry_->Execute("listDirectory", json::object()));
    ASSERT_TRUE(listing["success"].get<bool>());
    EXPECT_NO_THROW(listing.dump());
    const auto dumped = listing.dump();
    EXPECT_NE(dumped.find("bad\xEF\xBF\xBDname.txt"), std::string::npos);

    json files;
    ASSERT_NO_THROW(files = registry_->Execute("globFileSearch", {{"pattern", "*.txt"}}));
    ASSERT_TRUE(files["success"].get<bool>());
    EXPECT_NO_THROW(files.dump());
}

TEST_F(ToolRegistryTest, InvalidUtf8FromAnyToolNeverEscapes) {
    class RawBytesTool : public Tool {
    public:
        std::string Name() const override { return "readFile"; }
        std::string Description() const override { return "returns raw bytes"; }
        json InputSchema() const override { return {{"type", "object"}}; }
        json Execute(const json& /*input*/) override { return {{"success", true}, {"content", "x\xFE"}}; }
    };
    ToolRegistry registry;
    registry.Register(ToolKind::kReadFile, std::make_shared<RawBytesTool>());
    json result;
    ASSERT_NO_THROW(result = registry.Execute("readFile", json::object()));
    EXPECT_EQ(result["content"], "x\xEF\xBF\xBD");
}

TEST_F(ToolRegistryTest, OversizedWindowArgumentsAreClamped) {
    dir_.Write("ws/abc.txt", "a\nb\nc");
    const auto huge = registry_->Execute(
        "readFile", {{"path", "abc.txt"}, {"offset", 2}, {"limit", std::numeric_limits<long long>::max()}});
    ASSERT_TRUE(huge["success"].get<bool>()) << huge.dump();
    EXPECT_EQ(huge["content"], "2|b\n3|c");

    const auto floating = registry_->Execute("readFile", {{"path", "abc.txt"}, {"offset", -1e300}, {"limit", 1e300}});
    ASSERT_TRUE(floating["success"].get<bool>());
    EXPECT_EQ(floating["content"], "1|a\n2|b\n3|c");

    const auto past_end = registry_->Execute(
        "readFile", {{"path", "abc.txt"}, {"offset", std::numeric_limits<long long>::max()}, {"limit", 5}});
    ASSERT_TRUE(past_end["success"].get<bool>());
    EXPECT_EQ(past_end["content"], "");
}

TEST(GetIntegerTest, SaturatesOutOfRangeNumbers) {
    EXPECT_EQ(GetInteger({{"n", 42}}, "n"), 42);
    EXPECT_EQ(GetInteger({{"n", 7.9}}, "n"), 7);
    EXPECT_EQ(GetInteger({{"n", 1e300}}, "n"), std::numeric_limits<long long>::max());
    EXPECT_EQ(GetInteger({{"n", -1e300}}, "n"), std::numeric_limits<long long>::min());
    EXPECT_EQ(GetInteger({{"n", std::numeric_limits<unsigned long long>::max()}}, "n"),
              std::numeric_limits<long long>::max());
    EXPECT_EQ(GetInteger({{"n", std::numeric_limits<double>::infinity()}}, "n"),
              std::numeric_limits<long long>::max());
    EXPECT_FALSE(GetInteger({{"n", std::numeric_limits<double>::quiet_NaN()}}, "n").has_value());
    EXPECT_FALSE(GetInteger({{"n", "12"}}, "n").has_value());
}

TEST_F(ToolRegistryTest, ApprovalForRunCommand) {
    EXPECT_FALSE(registry_->NeedsApproval("runCommand", {{"command", "ls -la"}}));
    EXPECT_TRUE(registry_->NeedsApproval("runCommand", {{"command", "rm -rf node_modules"}}));
    EXPECT_TRUE(registry_->NeedsApproval("runCommand", {{"command", "ls"}, {"sandbox", false}}));
    EXPECT_FALSE(registry_->NeedsApproval("readFile", {{"path", "x"}}));

    config_.tools.require_dangerous_command_approval = false;
    config_.tools.disable_sandbox = true;
    Rebuild();
    EXPECT_FALSE(registry_->NeedsApproval("runCommand", {{"command", "rm -rf node_modules"}}));
    EXPECT_FALSE(registry_->NeedsApproval("runCommand", {{"command", "ls"}, {"sandbox", false}}));
}

}  // namespace
