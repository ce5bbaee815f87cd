#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace rampart::agent::tools {

// Backends collect this many times the visible ceiling so callers can tell
// whether a result was cut.
inline constexpr std::size_t kSearchOverscan = 2;

class SearchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GrepQuery {
    std::string pattern;
    std::filesystem::path path;
    std::string file_type;
    std::string glob;
    bool case_insensitive = false;
    int context = 0;
    std::size_t limit = 0;
};

struct GrepMatch {
    std::string file;
    std::size_t line = 0;
    std::string content;
};

void to_json(nlohmann::json& j, const GrepMatch& match);

class SearchBackend {
public:
    virtual ~SearchBackend() = default;
    virtual std::string Name() const = 0;

    // No matches is an empty vector. Throws SearchError on invalid patterns or
    // when the search utility fails.
    virtual std::vector<GrepMatch> Grep(const GrepQuery& query) const = 0;

    // Regular files under `directory` whose name or relative path matches
    // `glob`, at most `limit` of them, unordered.
    virtual std::vector<std::filesystem::path> FindFiles(const std::string& glob,
                                                         const std::filesystem::path& directory,
                                                         std::size_t limit) const = 0;

    // Probes the host for rg and fd/fdfind on first call; later calls return
    // the same backend.
    static std::shared_ptr<const SearchBackend> Detect();
};

// In-process walk; skips .git* and node_modules directories.
class PortableSearchBackend : public SearchBackend {
public:
    std::string Name() const override { return "portable"; }
    std::vector<GrepMatch> Grep(const GrepQuery& query) const override;
    std::vector<std::filesystem::path> FindFiles(const std::string& glob,
                                                 const std::filesystem::path& directory,
                                                 std::size_t limit) const override;
};

// ripgrep and fd. A missing utility falls through to the portable walk.
class FastSearchBackend : public SearchBackend {
public:
    FastSearchBackend(std::optional<std::filesystem::path> rg,
                      std::optional<std::filesystem::path> fd);

    std::string Name() const override;
    std::vector<GrepMatch> Grep(const GrepQuery& query) const override;
    std::vector<std::filesystem::path> FindFiles(const std::string& glob,
                                                 const std::filesystem::path& directory,
                                                 std::size_t limit) const override;

private:
    std::optional<std::filesystem::path> rg_;
    std::optional<std::filesystem::path> fd_;
    PortableSearchBackend portable_;
};

// Most recently modified first; ties ordered by path.
void SortByMtime(std::vector<std::filesystem::path>& files);

}  // namespace rampart::agent::tools
