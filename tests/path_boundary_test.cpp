#include <gtest/gtest.h>

#include "security/path_boundary.hpp"
#include "test_support.hpp"

namespace {

using rampart::security::BoundaryOptions;
using rampart::security::IsWithin;
using rampart::security::NormalizeAbsolute;
using rampart::security::PathTraversalError;
using rampart::security::SecurityBoundary;

class PathBoundaryTest : public ::testing::Test {
protected:
    void SetUp() override {
        workspace_ = NormalizeAbsolute(dir_.Path() / "workspace");
        home_ = NormalizeAbsolute(dir_.Path() / "home");
        std::filesystem::create_directories(workspace_);
        std::filesystem::create_directories(home_);
    }

    SecurityBoundary Sandboxed() const {
        BoundaryOptions options;
        options.base_path = workspace_;
        options.home_dir = home_;
        return SecurityBoundary(options);
    }

    rampart::testing::TempDir dir_;
    std::filesystem::path workspace_;
    std::filesystem::path home_;
};

TEST(IsWithinTest, HandlesEqualNestedAndSiblingPaths) {
    EXPECT_TRUE(IsWithin("/a/b", "/a/b"));
    EXPECT_TRUE(IsWithin("/a/b", "/a/b/c/d.txt"));
    EXPECT_FALSE(IsWithin("/a/b", "/a/bc"));
    EXPECT_FALSE(IsWithin("/a/b", "/a"));
    EXPECT_FALSE(IsWithin("/a/b", "/x/y"));
}

TEST(NormalizeAbsoluteTest, CollapsesDotsAndTrailingSeparator) {
    EXPECT_EQ(NormalizeAbsolute("/a/b/../c/./d/"), std::filesystem::path("/a/c/d"));
    EXPECT_EQ(NormalizeAbsolute("/"), std::filesystem::path("/"));
}

TEST_F(PathBoundaryTest, ResolvesRelativePathsAgainstBase) {
    const auto boundary = Sandboxed();
    EXPECT_EQ(boundary.Resolve("src/main.cpp"), workspace_ / "src" / "main.cpp");
    EXPECT_EQ(boundary.Resolve("."), workspace_);
    EXPECT_EQ(boundary.Resolve("a/../b"), workspace_ / "b");
}

TEST_F(PathBoundaryTest, RejectsEscapesFromBase) {
    const auto boundary = Sandboxed();
    EXPECT_THROW(boundary.Resolve("../outside.txt"), PathTraversalError);
    EXPECT_THROW(boundary.Resolve("sub/../../../etc/passwd"), PathTraversalError);
    try {
        boundary.Resolve("../x");
        FAIL() << "expected PathTraversalError";
    } catch (const PathTraversalError& ex) {
        EXPECT_STREQ(ex.what(), "Path traversal not allowed");
        EXPECT_EQ(ex.Requested(), "../x");
    }
}

TEST_F(PathBoundaryTest, RejectsAbsolutePathsOutsideAllowedRoots) {
    const auto boundary = Sandboxed();
    EXPECT_THROW(boundary.Resolve((dir_.Path() / "elsewhere" / "f").string()), PathTraversalError);
    EXPECT_EQ(boundary.Resolve((workspace_ / "f").string()), workspace_ / "f");
}

TEST_F(PathBoundaryTest, HomeDirectoryIsAllowedRoot) {
    const auto boundary = Sandboxed();
    EXPECT_EQ(boundary.Resolve("~/notes.md"), home_ / "notes.md");
    EXPECT_EQ(boundary.Resolve("~"), home_);
    EXPECT_EQ(boundary.Resolve((home_ / "deep" / "file").string()), home_ / "deep" / "file");
}

TEST_F(PathBoundaryTest, ExtraRootsAreAllowed) {
    BoundaryOptions options;
    options.base_path = workspace_;
    options.home_dir = home_;
    options.extra_allowed_roots.push_back(dir_.Path() / "shared");
    const SecurityBoundary boundary(options);
    EXPECT_NO_THROW(boundary.Resolve((dir_.Path() / "shared" / "lib.h").string()));
    EXPECT_THROW(boundary.Resolve((dir_.Path() / "sharedx").string()), PathTraversalError);
}

TEST_F(PathBoundaryTest, NoBaseAllowsEverything) {
    BoundaryOptions options;
    options.home_dir = home_;
    const SecurityBoundary boundary(options);
    EXPECT_FALSE(boundary.IsSandboxed());
    EXPECT_EQ(boundary.Resolve("/etc/hosts"), std::filesystem::path("/etc/hosts"));
    EXPECT_EQ(boundary.DefaultDirectory(), std::filesystem::current_path());
}

TEST_F(PathBoundaryTest, DefaultDirectoryIsBase) {
    EXPECT_EQ(Sandboxed().DefaultDirectory(), workspace_);
}

}  // namespace
