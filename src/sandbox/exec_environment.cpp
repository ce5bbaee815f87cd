#include "sandbox/exec_environment.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "utils/common.hpp"

namespace rampart::sandbox {
namespace {

std::vector<int> ParseVersion(std::string name) {
    if (!name.empty() && (name.front() == 'v' || name.front() == 'V')) {
        name.erase(0, 1);
    }
    std::vector<int> parts;
    std::stringstream stream(name);
    std::string item;
    while (std::getline(stream, item, '.')) {
        try {
            parts.push_back(std::stoi(item));
        } catch (const std::exception&) {
            parts.push_back(0);
        }
    }
    return parts;
}

std::vector<std::string> SplitPath(const std::string& value) {
    std::vector<std::string> entries;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ':')) {
        if (!item.empty()) {
            entries.push_back(item);
        }
    }
    return entries;
}

}  // namespace

std::filesystem::path NewestNvmNodeBin(const std::filesystem::path& home_dir) {
    const auto root = home_dir / ".nvm" / "versions" / "node";
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return {};
    }
    std::filesystem::path best;
    std::vector<int> best_version;
    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
        if (!entry.is_directory(ec)) {
            continue;
        }
        const auto version = ParseVersion(entry.path().filename().string());
        if (best.empty() || version > best_version) {
            best = entry.path();
            best_version = version;
        }
    }
    if (best.empty()) {
        return {};
    }
    return best / "bin";
}

std::vector<std::filesystem::path> CandidateBinDirectories(const std::filesystem::path& home_dir) {
    std::vector<std::filesystem::path> dirs = {
        "/opt/homebrew/bin",
        "/usr/local/bin",
    };
    if (home_dir.empty()) {
        return dirs;
    }
    const auto nvm = NewestNvmNodeBin(home_dir);
    if (!nvm.empty()) {
        dirs.push_back(nvm);
    }
    const char* kHomeRelative[] = {
        ".local/share/fnm/aliases/default/bin",
        ".fnm/aliases/default/bin",
        ".volta/bin",
        ".asdf/shims",
        ".local/share/mise/shims",
        ".n/bin",
        ".nodenv/shims",
        ".bun/bin",
        ".cargo/bin",
        ".pyenv/shims",
        ".local/bin",
        "go/bin",
        ".deno/bin",
    };
    for (const auto* relative : kHomeRelative) {
        dirs.push_back(home_dir / relative);
    }
    return dirs;
}

std::string BuildAugmentedPath(const std::filesystem::path& home_dir, const std::string& current_path) {
    const auto existing = SplitPath(current_path);
    std::set<std::string> seen(existing.begin(), existing.end());
    std::vector<std::string> prefix;
    for (const auto& dir : CandidateBinDirectories(home_dir)) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            continue;
        }
        const auto value = dir.string();
        if (seen.insert(value).second) {
            prefix.push_back(value);
        }
    }
    if (prefix.empty()) {
        return current_path;
    }
    const auto head = utils::Join(prefix, ":");
    return current_path.empty() ? head : head + ":" + current_path;
}

}  // namespace rampart::sandbox
