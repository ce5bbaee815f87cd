#include "sandbox/sandbox_wrapper.hpp"

#include <regex>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/glob.hpp"
#include "utils/logging.hpp"
#include "utils/process.hpp"

namespace rampart::sandbox {
namespace {

constexpr int kSocatPort = 3128;
constexpr std::size_t kMaxMaskScan = 2000;

bool ContainsAny(const std::string& text, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool IsUsableRoot(const std::filesystem::path& root) {
    std::error_code ec;
    return root.is_absolute() && std::filesystem::exists(root, ec);
}

std::vector<std::filesystem::path> ExpandDenyRead(const std::string& expanded) {
    std::vector<std::filesystem::path> matches;
    if (!utils::HasGlobMeta(expanded)) {
        if (IsUsableRoot(expanded)) {
            matches.push_back(expanded);
        }
        return matches;
    }
    const auto root = PatternRoot(expanded);
    std::error_code ec;
    if (!root.is_absolute() || !std::filesystem::is_directory(root, ec)) {
        return matches;
    }
    std::regex matcher;
    try {
        matcher = utils::GlobToRegex(expanded);
    } catch (const std::regex_error& ex) {
        utils::LogWarn("sandbox", "ignoring invalid deny-read pattern " + expanded + ": " + ex.what());
        return matches;
    }
    std::size_t visited = 0;
    auto it = std::filesystem::recursive_directory_iterator(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (++visited > kMaxMaskScan) {
            break;
        }
        const auto candidate = it->path().string();
        if (std::regex_match(candidate, matcher)) {
            matches.push_back(it->path());
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
        }
    }
    return matches;
}

}  // namespace

WrappedCommand ShellCommand(const std::string& command) {
    return WrappedCommand{{"/bin/bash", "-c", command}, {}};
}

std::string AnnotateSandboxFailure(const std::string& stderr_text) {
    static const std::vector<std::string> kNetwork = {
        kBlockedByAllowlist,
        "Could not resolve host",
        "Temporary failure in name resolution",
        "getaddrinfo",
        "ENOTFOUND",
        "Network is unreachable",
        "403 Forbidden",
    };
    static const std::vector<std::string> kReadOnly = {
        "Read-only file system",
        "EROFS",
    };
    static const std::vector<std::string> kPermission = {
        "Permission denied",
        "Operation not permitted",
        "EACCES",
        "EPERM",
    };

    std::string reason;
    if (ContainsAny(stderr_text, kNetwork)) {
        reason = "Network access was blocked: the host is not in the sandbox network allowlist.";
    } else if (ContainsAny(stderr_text, kReadOnly)) {
        reason = "A write was blocked: the path is outside the sandbox's writable directories.";
    } else if (ContainsAny(stderr_text, kPermission)) {
        reason = "Access was denied, possibly by the sandbox filesystem policy.";
    } else {
        return stderr_text;
    }
    std::string annotated = stderr_text;
    if (!annotated.empty()) {
        annotated += "\n\n";
    }
    annotated += "<sandbox_violations>\n" + reason +
                 "\nIf this command legitimately needs that access, rerun it with sandbox: false"
                 " (requires user approval).\n</sandbox_violations>";
    return annotated;
}

BubblewrapWrapper::BubblewrapWrapper(SandboxPolicy policy,
                                     std::filesystem::path bwrap,
                                     std::optional<std::filesystem::path> socat)
    : policy_(std::move(policy))
    , bwrap_(std::move(bwrap))
    , socat_(std::move(socat)) {}

std::vector<std::string> BubblewrapWrapper::FilesystemArgs() const {
    std::vector<std::string> args = {
        "--die-with-parent",
        "--unshare-pid",
        "--ro-bind", "/", "/",
        "--dev", "/dev",
        "--proc", "/proc",
        "--tmpfs", "/tmp",
    };
    const auto& fs = policy_.Filesystem();
    for (const auto& pattern : fs.allow_write) {
        const auto root = PatternRoot(policy_.ExpandPattern(pattern));
        if (IsUsableRoot(root)) {
            args.insert(args.end(), {"--bind", root.string(), root.string()});
        }
    }
    for (const auto& pattern : fs.deny_write) {
        const auto root = PatternRoot(policy_.ExpandPattern(pattern));
        if (IsUsableRoot(root)) {
            args.insert(args.end(), {"--ro-bind", root.string(), root.string()});
        }
    }
    for (const auto& pattern : fs.deny_read) {
        for (const auto& path : ExpandDenyRead(policy_.ExpandPattern(pattern))) {
            std::error_code ec;
            if (std::filesystem::is_directory(path, ec)) {
                args.insert(args.end(), {"--tmpfs", path.string()});
            } else {
                args.insert(args.end(), {"--ro-bind", "/dev/null", path.string()});
            }
        }
    }
    return args;
}

void BubblewrapWrapper::EnsureProxy() {
    if (proxy_ && proxy_->IsRunning()) {
        return;
    }
    proxy_ = std::make_unique<NetworkProxy>(policy_);
    try {
        proxy_->Start();
    } catch (const std::exception& ex) {
        proxy_.reset();
        throw std::runtime_error(std::string("failed to start network proxy: ") + ex.what());
    }
}

WrappedCommand BubblewrapWrapper::Wrap(const std::string& command, const std::filesystem::path& cwd) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bwrap_.empty()) {
        throw std::runtime_error("bubblewrap is not available");
    }
    EnsureProxy();

    WrappedCommand wrapped;
    wrapped.argv.push_back(bwrap_.string());
    const auto fs_args = FilesystemArgs();
    wrapped.argv.insert(wrapped.argv.end(), fs_args.begin(), fs_args.end());

    std::string script = command;
    std::string proxy_url;
    if (socat_) {
        const auto sock = proxy_->SocketPath().string();
        wrapped.argv.insert(wrapped.argv.end(), {"--unshare-net", "--bind", sock, sock});
        proxy_url = "http://127.0.0.1:" + std::to_string(kSocatPort);
        script = socat_->string() + " TCP-LISTEN:" + std::to_string(kSocatPort) +
                 ",fork,reuseaddr,bind=127.0.0.1 UNIX-CONNECT:" + sock +
                 " >/dev/null 2>&1 &\nsleep 0.1\n" + command;
    } else {
        if (!warned_shared_network_) {
            utils::LogWarn("sandbox", "socat not found; network namespace is shared and egress relies on proxy variables");
            warned_shared_network_ = true;
        }
        proxy_url = "http://127.0.0.1:" + std::to_string(proxy_->TcpPort());
    }
    if (!cwd.empty()) {
        wrapped.argv.insert(wrapped.argv.end(), {"--chdir", cwd.string()});
    }
    wrapped.argv.insert(wrapped.argv.end(), {"--", "/bin/bash", "-c", script});

    for (const char* key : {"HTTP_PROXY", "HTTPS_PROXY", "ALL_PROXY", "http_proxy", "https_proxy", "all_proxy"}) {
        wrapped.env[key] = proxy_url;
    }
    wrapped.env["NO_PROXY"] = "localhost,127.0.0.1";
    wrapped.env["no_proxy"] = "localhost,127.0.0.1";
    return wrapped;
}

std::unique_ptr<SandboxWrapper> CreateSandboxWrapper(const SandboxPolicy& policy) {
#if defined(__linux__)
    const auto bwrap = utils::bp::search_path("bwrap");
    if (bwrap.empty()) {
        utils::LogWarn("sandbox", "bwrap not found on PATH; commands run unsandboxed");
        return nullptr;
    }
    std::optional<std::filesystem::path> socat;
    const auto socat_path = utils::bp::search_path("socat");
    if (!socat_path.empty()) {
        socat = std::filesystem::path(socat_path.string());
    }
    utils::Log(utils::LogLevel::kInfo, "sandbox", "initialized",
               {{"wrapper", "bubblewrap"}, {"bwrap", bwrap.string()}, {"socat", socat ? socat->string() : "none"}});
    return std::make_unique<BubblewrapWrapper>(policy, std::filesystem::path(bwrap.string()), socat);
#else
    (void)policy;
    utils::LogWarn("sandbox", "command sandboxing is not supported on this platform");
    return nullptr;
#endif
}

}  // namespace rampart::sandbox
