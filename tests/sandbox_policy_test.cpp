#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "sandbox/sandbox_policy.hpp"

namespace {

using rampart::sandbox::DomainMatches;
using rampart::sandbox::FilesystemPolicy;
using rampart::sandbox::NetworkPolicy;
using rampart::sandbox::PatternRoot;
using rampart::sandbox::SandboxPolicy;

const std::filesystem::path kHome = "/home/tester";

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

TEST(SandboxPolicyTest, BaselineProtectsKeysAndAllowsRegistries) {
    const auto policy = SandboxPolicy::Baseline(kHome);
    EXPECT_TRUE(policy.IsReadDenied(kHome / ".ssh" / "id_ed25519"));
    EXPECT_TRUE(policy.IsReadDenied(kHome / ".gnupg" / "private-keys-v1.d" / "abc.key"));
    EXPECT_FALSE(policy.IsReadDenied(kHome / ".ssh" / "known_hosts"));

    EXPECT_TRUE(policy.IsDomainAllowed("registry.npmjs.org"));
    EXPECT_TRUE(policy.IsDomainAllowed("GitHub.com"));
    EXPECT_FALSE(policy.IsDomainAllowed("example.com"));
}

TEST(SandboxPolicyTest, WriteRulesDenyBeatsAllow) {
    const auto policy = SandboxPolicy::Baseline(kHome);
    EXPECT_TRUE(policy.IsWriteAllowed("/tmp/build/out.o"));
    EXPECT_TRUE(policy.IsWriteAllowed(kHome / ".cache" / "pip" / "x"));
    EXPECT_TRUE(policy.IsWriteAllowed(kHome / ".gitconfig"));
    EXPECT_FALSE(policy.IsWriteAllowed(kHome / ".ssh" / "authorized_keys"));
    EXPECT_FALSE(policy.IsWriteAllowed("/etc/passwd"));
    EXPECT_FALSE(policy.IsWriteAllowed(kHome / "Documents" / "report.txt"));

    FilesystemPolicy extra;
    extra.allow_write.push_back("/etc/**");
    const auto merged = SandboxPolicy::Merge(policy, {}, extra);
    EXPECT_FALSE(merged.IsWriteAllowed("/etc/hosts"));
}

TEST(SandboxPolicyTest, WorkspaceBecomesWritable) {
    const auto policy = SandboxPolicy::Baseline(kHome).ForWorkspace("/srv/project/");
    EXPECT_TRUE(policy.IsWriteAllowed("/srv/project/src/main.cpp"));
    EXPECT_FALSE(policy.IsWriteAllowed("/srv/other/file"));
    EXPECT_TRUE(Contains(policy.Filesystem().allow_write, "/srv/project/**"));
}

TEST(SandboxPolicyTest, MergeConcatenatesLists) {
    const auto base = SandboxPolicy::Baseline(kHome);
    NetworkPolicy network;
    network.allowed_domains = {"*.internal.example"};
    network.denied_domains = {"github.com"};
    FilesystemPolicy filesystem;
    filesystem.deny_read = {"~/secrets"};
    const auto merged = SandboxPolicy::Merge(base, network, filesystem);

    EXPECT_EQ(merged.Network().allowed_domains.size(), base.Network().allowed_domains.size() + 1);
    EXPECT_EQ(merged.Filesystem().deny_read.size(), base.Filesystem().deny_read.size() + 1);
    EXPECT_TRUE(merged.IsDomainAllowed("api.internal.example"));
    EXPECT_FALSE(merged.IsDomainAllowed("github.com"));
    EXPECT_TRUE(merged.IsReadDenied(kHome / "secrets" / "token"));
    EXPECT_TRUE(base.IsDomainAllowed("github.com"));
}

TEST(SandboxPolicyTest, PolicyFromConfigAppliesAllLayers) {
    rampart::config::SandboxConfig config;
    config.network.allowed_domains = {"example.org"};
    config.filesystem.deny_write = {"/srv/project/secrets"};
    const auto policy = rampart::sandbox::PolicyFromConfig(config, kHome, "/srv/project");
    EXPECT_TRUE(policy.IsDomainAllowed("example.org"));
    EXPECT_TRUE(policy.IsDomainAllowed("pypi.org"));
    EXPECT_TRUE(policy.IsWriteAllowed("/srv/project/a.txt"));
    EXPECT_FALSE(policy.IsWriteAllowed("/srv/project/secrets/key"));
}

TEST(DomainMatchesTest, WildcardCoversSubdomainsOnly) {
    EXPECT_TRUE(DomainMatches("*.example.com", "api.example.com"));
    EXPECT_TRUE(DomainMatches("*.example.com", "a.b.example.com"));
    EXPECT_FALSE(DomainMatches("*.example.com", "example.com"));
    EXPECT_FALSE(DomainMatches("*.example.com", "badexample.com"));
    EXPECT_TRUE(DomainMatches("Example.com", "example.COM"));
}

TEST(PatternRootTest, StopsAtFirstWildcard) {
    EXPECT_EQ(PatternRoot("/home/u/.ssh/id_*"), std::filesystem::path("/home/u/.ssh"));
    EXPECT_EQ(PatternRoot("/tmp/**"), std::filesystem::path("/tmp"));
    EXPECT_EQ(PatternRoot("/etc"), std::filesystem::path("/etc"));
}

TEST(SandboxPolicyTest, ToJsonListsAllRules) {
    const auto json = SandboxPolicy::Baseline(kHome).ToJson();
    EXPECT_TRUE(json["network"]["allowedDomains"].is_array());
    EXPECT_TRUE(json["network"]["deniedDomains"].empty());
    EXPECT_FALSE(json["filesystem"]["denyWrite"].empty());
}

}  // namespace
