#include "security/path_boundary.hpp"

#include "utils/common.hpp"

namespace rampart::security {

std::filesystem::path NormalizeAbsolute(const std::filesystem::path& path) {
    auto absolute = path.is_absolute() ? path : std::filesystem::current_path() / path;
    auto normal = absolute.lexically_normal();
    // "/a/b/" normalizes to "/a/b/" with an empty filename; drop the separator.
    if (!normal.has_filename() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

bool IsWithin(const std::filesystem::path& parent, const std::filesystem::path& child) {
    const auto rel = child.lexically_relative(parent);
    if (rel.empty()) {
        return false;
    }
    if (rel == ".") {
        return true;
    }
    if (rel.is_absolute()) {
        return false;
    }
    return *rel.begin() != "..";
}

SecurityBoundary::SecurityBoundary(BoundaryOptions options)
    : home_dir_(options.home_dir.empty() ? utils::GetHomePath() : options.home_dir) {
    home_dir_ = NormalizeAbsolute(home_dir_);
    if (options.base_path.has_value() && !options.base_path->empty()) {
        base_path_ = NormalizeAbsolute(*options.base_path);
        allowed_roots_.push_back(home_dir_);
        for (const auto& root : options.extra_allowed_roots) {
            if (!root.empty()) {
                allowed_roots_.push_back(NormalizeAbsolute(root));
            }
        }
    }
}

std::string SecurityBoundary::ExpandTilde(const std::string& path) const {
    if (path == "~") {
        return home_dir_.string();
    }
    if (utils::StartsWith(path, "~/") || utils::StartsWith(path, "~\\")) {
        return (home_dir_ / path.substr(2)).string();
    }
    return path;
}

std::filesystem::path SecurityBoundary::DefaultDirectory() const {
    if (base_path_.has_value()) {
        return *base_path_;
    }
    return std::filesystem::current_path();
}

bool SecurityBoundary::IsAllowed(const std::filesystem::path& absolute) const {
    if (!base_path_.has_value()) {
        return true;
    }
    if (IsWithin(*base_path_, absolute)) {
        return true;
    }
    for (const auto& root : allowed_roots_) {
        if (IsWithin(root, absolute)) {
            return true;
        }
    }
    return false;
}

std::filesystem::path SecurityBoundary::Resolve(const std::string& path) const {
    const std::filesystem::path expanded(ExpandTilde(path));
    std::filesystem::path resolved;
    if (base_path_.has_value()) {
        resolved = NormalizeAbsolute(expanded.is_absolute() ? expanded : *base_path_ / expanded);
    } else {
        resolved = NormalizeAbsolute(expanded);
    }
    if (!IsAllowed(resolved)) {
        throw PathTraversalError(path);
    }
    return resolved;
}

}  // namespace rampart::security
