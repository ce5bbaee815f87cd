#include "sandbox/sandbox_policy.hpp"

#include <algorithm>
#include <regex>

#include "security/path_boundary.hpp"
#include "utils/common.hpp"
#include "utils/glob.hpp"
#include "utils/logging.hpp"

namespace rampart::sandbox {
namespace {

const std::vector<std::string> kBaselineDomains = {
    // npm / yarn / pnpm
    "registry.npmjs.org",
    "registry.yarnpkg.com",
    "registry.npmmirror.com",
    // Python
    "pypi.org",
    "files.pythonhosted.org",
    // Rust
    "crates.io",
    "static.crates.io",
    "index.crates.io",
    // Go
    "proxy.golang.org",
    "sum.golang.org",
    "storage.googleapis.com",
    // Ruby
    "rubygems.org",
    "index.rubygems.org",
    // Java
    "repo.maven.apache.org",
    "repo1.maven.org",
    "plugins.gradle.org",
    "services.gradle.org",
    // Deno and ESM CDNs
    "deno.land",
    "esm.sh",
    "cdn.esm.sh",
    "cdn.jsdelivr.net",
    "unpkg.com",
    // Code hosts
    "github.com",
    "api.github.com",
    "raw.githubusercontent.com",
    "objects.githubusercontent.com",
    "github-releases.githubusercontent.com",
    "codeload.github.com",
    "gitlab.com",
    "ghcr.io",
    // CDNs
    "cdnjs.cloudflare.com",
    "cdn.skypack.dev",
    "www.googleapis.com",
};

const std::vector<std::string> kBaselineDenyRead = {
    "~/.ssh/id_*",
    "~/.ssh/*_rsa",
    "~/.ssh/*_ed25519",
    "~/.ssh/*_ecdsa",
    "~/.gnupg/private-keys-v1.d",
};

const std::vector<std::string> kBaselineHomeWritable = {
    ".rampart",
    ".cache",
    ".npm",
    ".pnpm-store",
    ".local/share/pnpm",
    ".yarn",
    ".bun",
    ".nvm",
    ".fnm",
    ".volta",
    ".n",
    ".pyenv",
    ".local/lib",
    ".local/bin",
    ".virtualenvs",
    ".venv",
    ".cargo",
    ".rustup",
    "go",
    ".rbenv",
    ".rvm",
    ".gem",
    ".bundle",
    ".m2",
    ".gradle",
    ".sdkman",
    ".deno",
    ".turbo",
};

const std::vector<std::string> kBaselineDenyWrite = {
    "~/.ssh",
    "~/.gnupg",
    "~/.aws",
    "~/.config/gcloud",
    "~/.kube",
    "/etc",
    "/usr",
    "/bin",
    "/sbin",
};

void Append(std::vector<std::string>& target, const std::vector<std::string>& extra) {
    target.insert(target.end(), extra.begin(), extra.end());
}

}  // namespace

SandboxPolicy::SandboxPolicy(NetworkPolicy network,
                             FilesystemPolicy filesystem,
                             std::filesystem::path home_dir)
    : network_(std::move(network))
    , filesystem_(std::move(filesystem))
    , home_dir_(std::move(home_dir)) {}

SandboxPolicy SandboxPolicy::Baseline(const std::filesystem::path& home_dir) {
    NetworkPolicy network;
    network.allowed_domains = kBaselineDomains;

    FilesystemPolicy filesystem;
    filesystem.deny_read = kBaselineDenyRead;
    filesystem.allow_write.push_back("/tmp/**");
    std::error_code ec;
    const auto temp = std::filesystem::temp_directory_path(ec);
    if (!ec && temp != "/tmp") {
        filesystem.allow_write.push_back(security::NormalizeAbsolute(temp).string() + "/**");
    }
    for (const auto& relative : kBaselineHomeWritable) {
        filesystem.allow_write.push_back("~/" + relative + "/**");
    }
    filesystem.allow_write.push_back("~/.yarnrc.yml");
    filesystem.allow_write.push_back("~/.gitconfig");
    filesystem.deny_write = kBaselineDenyWrite;

    return SandboxPolicy(std::move(network), std::move(filesystem), home_dir);
}

SandboxPolicy SandboxPolicy::Merge(const SandboxPolicy& base,
                                   const NetworkPolicy& network,
                                   const FilesystemPolicy& filesystem) {
    auto merged = base;
    Append(merged.network_.allowed_domains, network.allowed_domains);
    Append(merged.network_.denied_domains, network.denied_domains);
    Append(merged.filesystem_.deny_read, filesystem.deny_read);
    Append(merged.filesystem_.allow_write, filesystem.allow_write);
    Append(merged.filesystem_.deny_write, filesystem.deny_write);
    return merged;
}

SandboxPolicy SandboxPolicy::ForWorkspace(const std::filesystem::path& workspace) const {
    auto copy = *this;
    if (!workspace.empty()) {
        copy.filesystem_.allow_write.push_back(security::NormalizeAbsolute(workspace).string() + "/**");
    }
    return copy;
}

std::string SandboxPolicy::ExpandPattern(const std::string& pattern) const {
    if (pattern == "~") {
        return home_dir_.string();
    }
    if (utils::StartsWith(pattern, "~/")) {
        return (home_dir_ / pattern.substr(2)).string();
    }
    return pattern;
}

bool SandboxPolicy::MatchesAny(const std::vector<std::string>& patterns,
                               const std::filesystem::path& path) const {
    const auto target = security::NormalizeAbsolute(path).string();
    for (const auto& raw : patterns) {
        const auto pattern = ExpandPattern(raw);
        if (!utils::HasGlobMeta(pattern)) {
            if (security::IsWithin(security::NormalizeAbsolute(pattern), target)) {
                return true;
            }
            continue;
        }
        try {
            if (utils::GlobMatch(pattern, target)) {
                return true;
            }
        } catch (const std::regex_error& ex) {
            utils::LogWarn("sandbox", "ignoring invalid pattern " + raw + ": " + ex.what());
        }
    }
    return false;
}

bool SandboxPolicy::IsReadDenied(const std::filesystem::path& path) const {
    return MatchesAny(filesystem_.deny_read, path);
}

bool SandboxPolicy::IsWriteAllowed(const std::filesystem::path& path) const {
    if (MatchesAny(filesystem_.deny_write, path)) {
        return false;
    }
    return MatchesAny(filesystem_.allow_write, path);
}

bool DomainMatches(const std::string& entry, const std::string& host) {
    const auto pattern = utils::ToLower(entry);
    const auto target = utils::ToLower(host);
    if (utils::StartsWith(pattern, "*.")) {
        const auto suffix = pattern.substr(1);
        return target.size() > suffix.size() && utils::EndsWith(target, suffix);
    }
    return pattern == target;
}

bool SandboxPolicy::IsDomainAllowed(const std::string& host) const {
    for (const auto& entry : network_.denied_domains) {
        if (DomainMatches(entry, host)) {
            return false;
        }
    }
    return std::any_of(network_.allowed_domains.begin(), network_.allowed_domains.end(),
                       [&](const std::string& entry) { return DomainMatches(entry, host); });
}

std::filesystem::path PatternRoot(const std::string& expanded_pattern) {
    std::filesystem::path root;
    for (const auto& part : std::filesystem::path(expanded_pattern)) {
        if (utils::HasGlobMeta(part.string())) {
            break;
        }
        root /= part;
    }
    return root;
}

nlohmann::json SandboxPolicy::ToJson() const {
    return {
        {"network", {
            {"allowedDomains", network_.allowed_domains},
            {"deniedDomains", network_.denied_domains},
        }},
        {"filesystem", {
            {"denyRead", filesystem_.deny_read},
            {"allowWrite", filesystem_.allow_write},
            {"denyWrite", filesystem_.deny_write},
        }},
    };
}

SandboxPolicy PolicyFromConfig(const config::SandboxConfig& config,
                               const std::filesystem::path& home_dir,
                               const std::filesystem::path& workspace) {
    NetworkPolicy network{config.network.allowed_domains, config.network.denied_domains};
    FilesystemPolicy filesystem{config.filesystem.deny_read,
                                config.filesystem.allow_write,
                                config.filesystem.deny_write};
    return SandboxPolicy::Merge(SandboxPolicy::Baseline(home_dir), network, filesystem).ForWorkspace(workspace);
}

}  // namespace rampart::sandbox
