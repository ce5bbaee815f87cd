#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/network_proxy.hpp"
#include "sandbox/sandbox_policy.hpp"

namespace rampart::sandbox {

struct WrappedCommand {
    // argv[0] is the program to launch.
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
};

// Unwrapped invocation: /bin/bash -c <command>.
WrappedCommand ShellCommand(const std::string& command);

// Appends an explanation to stderr when it carries a known sandbox-denial
// signature. Returns stderr unchanged otherwise.
std::string AnnotateSandboxFailure(const std::string& stderr_text);

class SandboxWrapper {
public:
    virtual ~SandboxWrapper() = default;

    virtual std::string Name() const = 0;
    virtual bool IsSupported() const = 0;

    // Throws std::runtime_error when the command cannot be wrapped.
    virtual WrappedCommand Wrap(const std::string& command, const std::filesystem::path& cwd) = 0;

    virtual std::string AnnotateFailure(const std::string& /*command*/, const std::string& stderr_text) const {
        return AnnotateSandboxFailure(stderr_text);
    }
};

// bubblewrap: read-only root, writable allow-write roots, masked secrets, and
// network egress through the filtering proxy.
class BubblewrapWrapper : public SandboxWrapper {
public:
    BubblewrapWrapper(SandboxPolicy policy,
                      std::filesystem::path bwrap,
                      std::optional<std::filesystem::path> socat);

    std::string Name() const override { return "bubblewrap"; }
    bool IsSupported() const override { return !bwrap_.empty(); }
    WrappedCommand Wrap(const std::string& command, const std::filesystem::path& cwd) override;

    // Mount arguments only; exposed for inspection.
    std::vector<std::string> FilesystemArgs() const;

    const SandboxPolicy& Policy() const { return policy_; }

private:
    void EnsureProxy();

    SandboxPolicy policy_;
    std::filesystem::path bwrap_;
    std::optional<std::filesystem::path> socat_;
    std::unique_ptr<NetworkProxy> proxy_;
    std::mutex mutex_;
    bool warned_shared_network_ = false;
};

// Probes for bwrap (and socat) once. Returns nullptr, after logging, when the
// host cannot sandbox commands.
std::unique_ptr<SandboxWrapper> CreateSandboxWrapper(const SandboxPolicy& policy);

}  // namespace rampart::sandbox
