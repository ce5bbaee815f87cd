#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace rampart::sandbox {

struct NetworkPolicy {
    std::vector<std::string> allowed_domains;
    std::vector<std::string> denied_domains;
};

// Patterns are globs; a leading "~" expands against the home directory and a
// pattern without wildcards covers the path and everything beneath it.
struct FilesystemPolicy {
    std::vector<std::string> deny_read;
    std::vector<std::string> allow_write;
    std::vector<std::string> deny_write;
};

class SandboxPolicy {
public:
    SandboxPolicy() = default;
    SandboxPolicy(NetworkPolicy network, FilesystemPolicy filesystem, std::filesystem::path home_dir);

    // Hard-coded defaults: package registries reachable, private keys
    // unreadable, writes limited to temp, caches and toolchain homes.
    static SandboxPolicy Baseline(const std::filesystem::path& home_dir);

    // Lists are concatenated, never replaced.
    static SandboxPolicy Merge(const SandboxPolicy& base,
                               const NetworkPolicy& network,
                               const FilesystemPolicy& filesystem);

    // Copy with "<workspace>/**" appended to allow-write.
    SandboxPolicy ForWorkspace(const std::filesystem::path& workspace) const;

    bool IsReadDenied(const std::filesystem::path& path) const;
    // Explicit deny wins over allow, which wins over the default deny.
    bool IsWriteAllowed(const std::filesystem::path& path) const;
    bool IsDomainAllowed(const std::string& host) const;

    const NetworkPolicy& Network() const { return network_; }
    const FilesystemPolicy& Filesystem() const { return filesystem_; }
    const std::filesystem::path& HomeDir() const { return home_dir_; }

    std::string ExpandPattern(const std::string& pattern) const;

    nlohmann::json ToJson() const;

private:
    bool MatchesAny(const std::vector<std::string>& patterns, const std::filesystem::path& path) const;

    NetworkPolicy network_;
    FilesystemPolicy filesystem_;
    std::filesystem::path home_dir_;
};

// Literal root of a pattern: the leading path components before any wildcard.
std::filesystem::path PatternRoot(const std::string& expanded_pattern);

bool DomainMatches(const std::string& entry, const std::string& host);

// Baseline merged with the configured lists, with `workspace` writable.
SandboxPolicy PolicyFromConfig(const config::SandboxConfig& config,
                               const std::filesystem::path& home_dir,
                               const std::filesystem::path& workspace);

}  // namespace rampart::sandbox
