#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace rampart::sandbox {

// Install locations of version and package managers that a process launched
// outside a login shell would not have on PATH.
std::vector<std::filesystem::path> CandidateBinDirectories(const std::filesystem::path& home_dir);

// Prepends the existing candidate directories to current_path, skipping
// entries already present.
std::string BuildAugmentedPath(const std::filesystem::path& home_dir, const std::string& current_path);

// Highest "vX.Y.Z" directory under ~/.nvm/versions/node, empty when none.
std::filesystem::path NewestNvmNodeBin(const std::filesystem::path& home_dir);

}  // namespace rampart::sandbox
