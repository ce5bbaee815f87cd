#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include "sandbox/sandbox_policy.hpp"

namespace rampart::sandbox {

inline constexpr const char* kBlockedByAllowlist = "Connection blocked by network allowlist";

struct ProxyTarget {
    std::string host;
    std::string port;
    // Request target rewritten to origin form ("/path?query"); empty for CONNECT.
    std::string origin_form;
    bool tunnel = false;
};

// Extracts the upstream host from a CONNECT authority or an absolute-form
// HTTP request target, falling back to the Host header.
std::optional<ProxyTarget> ParseProxyTarget(const std::string& method,
                                            const std::string& target,
                                            const std::string& host_header);

// HTTP/CONNECT proxy that admits only hosts allowed by the sandbox policy.
// Listens on a Unix socket (bound into the sandbox) and on a loopback TCP
// port. Each accepted connection is served on its own thread.
class NetworkProxy {
public:
    explicit NetworkProxy(SandboxPolicy policy);
    ~NetworkProxy();

    NetworkProxy(const NetworkProxy&) = delete;
    NetworkProxy& operator=(const NetworkProxy&) = delete;

    // Throws boost::system::system_error when a listener cannot be bound.
    void Start();
    void Stop();
    bool IsRunning() const { return running_; }

    const std::filesystem::path& SocketPath() const { return socket_path_; }
    unsigned short TcpPort() const { return tcp_port_; }

private:
    void AcceptUnix();
    void AcceptTcp();

    std::shared_ptr<const SandboxPolicy> policy_;
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> unix_acceptor_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> tcp_acceptor_;
    std::thread thread_;
    std::filesystem::path socket_path_;
    unsigned short tcp_port_ = 0;
    std::atomic<bool> running_{false};
};

}  // namespace rampart::sandbox
