#include "sandbox/network_proxy.hpp"

#include <array>
#include <chrono>
#include <sstream>

#include <unistd.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rampart::sandbox {
namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

std::pair<std::string, std::string> SplitHostPort(const std::string& authority,
                                                  const std::string& default_port) {
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close != std::string::npos) {
            const auto host = authority.substr(1, close - 1);
            if (close + 1 < authority.size() && authority[close + 1] == ':') {
                return {host, authority.substr(close + 2)};
            }
            return {host, default_port};
        }
    }
    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        return {authority, default_port};
    }
    return {authority.substr(0, colon), authority.substr(colon + 1)};
}

std::string ToStdString(beast::string_view view) {
    return std::string(view.data(), view.size());
}

template <typename From, typename To>
void Pump(From& from, To& to) {
    std::array<char, 16384> data{};
    boost::system::error_code ec;
    while (true) {
        const auto n = from.read_some(asio::buffer(data), ec);
        if (ec || n == 0) {
            break;
        }
        asio::write(to, asio::buffer(data.data(), n), ec);
        if (ec) {
            break;
        }
    }
    to.shutdown(asio::socket_base::shutdown_send, ec);
}

template <typename Socket>
void WriteStatus(Socket& socket, http::status status, const std::string& body) {
    http::response<http::string_body> res{status, 11};
    res.set(http::field::content_type, "text/plain");
    res.set(http::field::connection, "close");
    res.body() = body;
    res.prepare_payload();
    boost::system::error_code ec;
    http::write(socket, res, ec);
}

template <typename Socket>
void ServeClient(asio::io_context& ctx, Socket client, const SandboxPolicy& policy) {
    beast::flat_buffer buffer;
    http::request_parser<http::empty_body> parser;
    parser.eager(false);
    boost::system::error_code ec;
    http::read_header(client, buffer, parser, ec);
    if (ec) {
        return;
    }
    auto& req = parser.get();
    const auto method = ToStdString(req.method_string());
    const auto host_header = ToStdString(req[http::field::host]);
    const auto target = ParseProxyTarget(method, ToStdString(req.target()), host_header);
    if (!target) {
        WriteStatus(client, http::status::bad_request, "Malformed proxy request");
        return;
    }
    if (!policy.IsDomainAllowed(target->host)) {
        utils::Log(utils::LogLevel::kWarn, "proxy", "blocked",
                   {{"host", target->host}, {"method", method}});
        WriteStatus(client, http::status::forbidden, kBlockedByAllowlist);
        return;
    }
    utils::Log(utils::LogLevel::kDebug, "proxy", "allowed",
               {{"host", target->host}, {"method", method}});

    asio::ip::tcp::socket upstream(ctx);
    asio::ip::tcp::resolver resolver(ctx);
    const auto results = resolver.resolve(target->host, target->port, ec);
    if (!ec) {
        asio::connect(upstream, results, ec);
    }
    if (ec) {
        WriteStatus(client, http::status::bad_gateway, "Upstream connection failed: " + ec.message());
        return;
    }

    if (target->tunnel) {
        static const std::string kEstablished = "HTTP/1.1 200 Connection Established\r\n\r\n";
        asio::write(client, asio::buffer(kEstablished), ec);
    } else {
        req.target(target->origin_form);
        req.erase(http::field::proxy_connection);
        req.erase(http::field::proxy_authorization);
        req.set(http::field::connection, "close");
        std::ostringstream head;
        head << req.base();
        asio::write(upstream, asio::buffer(head.str()), ec);
    }
    if (ec) {
        return;
    }
    // Bytes read past the header belong to the upstream stream.
    if (buffer.size() > 0) {
        asio::write(upstream, buffer.data(), ec);
        buffer.consume(buffer.size());
        if (ec) {
            return;
        }
    }

    std::thread downstream([&] { Pump(upstream, client); });
    Pump(client, upstream);
    downstream.join();
}

std::filesystem::path MakeSocketPath() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return dir / ("rampart-proxy-" + std::to_string(::getpid()) + "-" + std::to_string(stamp % 1000000) + ".sock");
}

}  // namespace

std::optional<ProxyTarget> ParseProxyTarget(const std::string& method,
                                            const std::string& target,
                                            const std::string& host_header) {
    ProxyTarget result;
    if (method == "CONNECT") {
        auto [host, port] = SplitHostPort(target, "443");
        if (host.empty() || port.empty()) {
            return std::nullopt;
        }
        result.host = utils::ToLower(host);
        result.port = port;
        result.tunnel = true;
        return result;
    }

    std::string authority;
    std::string default_port = "80";
    std::string rest = "/";
    const auto scheme_end = target.find("://");
    if (scheme_end != std::string::npos) {
        const auto scheme = utils::ToLower(target.substr(0, scheme_end));
        if (scheme == "https") {
            default_port = "443";
        } else if (scheme != "http") {
            return std::nullopt;
        }
        const auto authority_start = scheme_end + 3;
        const auto path_start = target.find('/', authority_start);
        if (path_start == std::string::npos) {
            authority = target.substr(authority_start);
        } else {
            authority = target.substr(authority_start, path_start - authority_start);
            rest = target.substr(path_start);
        }
    } else {
        authority = host_header;
        if (!target.empty()) {
            rest = target;
        }
    }
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    auto [host, port] = SplitHostPort(authority, default_port);
    if (host.empty() || port.empty()) {
        return std::nullopt;
    }
    result.host = utils::ToLower(host);
    result.port = port;
    result.origin_form = rest;
    return result;
}

NetworkProxy::NetworkProxy(SandboxPolicy policy)
    : policy_(std::make_shared<const SandboxPolicy>(std::move(policy))) {}

NetworkProxy::~NetworkProxy() {
    Stop();
}

void NetworkProxy::Start() {
    if (running_) {
        return;
    }
    socket_path_ = MakeSocketPath();
    std::error_code remove_ec;
    std::filesystem::remove(socket_path_, remove_ec);

    unix_acceptor_ = std::make_unique<asio::local::stream_protocol::acceptor>(
        ioc_, asio::local::stream_protocol::endpoint(socket_path_.string()));
    tcp_acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(
        ioc_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    tcp_port_ = tcp_acceptor_->local_endpoint().port();

    ioc_.restart();
    AcceptUnix();
    AcceptTcp();
    running_ = true;
    thread_ = std::thread([this] { ioc_.run(); });
    utils::Log(utils::LogLevel::kInfo, "proxy", "listening",
               {{"socket", socket_path_.string()}, {"port", std::to_string(tcp_port_)}});
}

void NetworkProxy::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    ioc_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    boost::system::error_code ec;
    if (unix_acceptor_) {
        unix_acceptor_->close(ec);
    }
    if (tcp_acceptor_) {
        tcp_acceptor_->close(ec);
    }
    std::error_code remove_ec;
    std::filesystem::remove(socket_path_, remove_ec);
}

void NetworkProxy::AcceptUnix() {
    auto ctx = std::make_shared<asio::io_context>();
    unix_acceptor_->async_accept(*ctx, [this, ctx](const boost::system::error_code& ec, auto peer) {
        if (ec) {
            return;
        }
        std::thread([ctx, policy = policy_, peer = std::move(peer)]() mutable {
            ServeClient(*ctx, std::move(peer), *policy);
        }).detach();
        AcceptUnix();
    });
}

void NetworkProxy::AcceptTcp() {
    auto ctx = std::make_shared<asio::io_context>();
    tcp_acceptor_->async_accept(*ctx, [this, ctx](const boost::system::error_code& ec, auto peer) {
        if (ec) {
            return;
        }
        std::thread([ctx, policy = policy_, peer = std::move(peer)]() mutable {
            ServeClient(*ctx, std::move(peer), *policy);
        }).detach();
        AcceptTcp();
    });
}

}  // namespace rampart::sandbox
