#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rampart::security {

class PathTraversalError : public std::runtime_error {
public:
    explicit PathTraversalError(const std::string& requested)
        : std::runtime_error("Path traversal not allowed")
        , requested_(requested) {}

    const std::string& Requested() const { return requested_; }

private:
    std::string requested_;
};

struct BoundaryOptions {
    // Absent disables sandboxing entirely.
    std::optional<std::filesystem::path> base_path;
    // Defaults to $HOME (or %USERPROFILE%) when empty.
    std::filesystem::path home_dir;
    std::vector<std::filesystem::path> extra_allowed_roots;
};

// Every filesystem and search tool resolves its path arguments through one of
// these; no tool does its own path arithmetic. Resolution is lexical: ".." is
// collapsed but symlinks are not followed.
class SecurityBoundary {
public:
    explicit SecurityBoundary(BoundaryOptions options = {});

    std::filesystem::path Resolve(const std::string& path) const;
    bool IsAllowed(const std::filesystem::path& absolute) const;

    bool IsSandboxed() const { return base_path_.has_value(); }
    const std::optional<std::filesystem::path>& BasePath() const { return base_path_; }
    const std::filesystem::path& HomeDir() const { return home_dir_; }
    const std::vector<std::filesystem::path>& AllowedRoots() const { return allowed_roots_; }

    // Working directory for tools that default to "the workspace".
    std::filesystem::path DefaultDirectory() const;

    std::string ExpandTilde(const std::string& path) const;

private:
    std::optional<std::filesystem::path> base_path_;
    std::filesystem::path home_dir_;
    std::vector<std::filesystem::path> allowed_roots_;
};

std::filesystem::path NormalizeAbsolute(const std::filesystem::path& path);

// True when `child` equals `parent` or lies beneath it.
bool IsWithin(const std::filesystem::path& parent, const std::filesystem::path& child);

}  // namespace rampart::security
