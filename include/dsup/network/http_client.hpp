#pragma once

#include "dsup/core/result.hpp"
#include "http_types.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace dsup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct HttpClientOptions {
    std::string host;
    uint16_t port = 80;
    std::string user_agent = "dsup/1.0";
    std::string username;   ///< Basic auth; sent only when non-empty
    std::string password;
    std::string app_token;  ///< Sent as X-App-Token when non-empty
    bool https = false;     ///< TLS over the connection; callers usually also set port 443
    bool verify_peer = true;
    std::string ca_file;    ///< PEM trust anchors; the system store when empty
};

/**
 * @brief Blocking HTTP/1.1 client over Boost.Asio
 *
 * Every call opens its own connection (Connection: close) on a private
 * io_context, so one client can be shared by concurrent upload workers.
 *
 * With options.https the socket is wrapped in an OpenSSL stream: the peer
 * certificate is checked against the system store (or ca_file) and the host
 * name unless verify_peer is off.
 *
 * Failures to resolve, connect, handshake, write or read, malformed replies
 * and non-2xx statuses are all reported as ErrorCode::Transport; for the
 * latter the error carries the status code. An absolute URL naming a host
 * other than options.host is refused with ErrorCode::Protocol.
 *
 * Usage:
 * ```cpp
 * HttpClient client({"localhost", 8080});
 * auto res = client.get("/api/publishing/v1/source/7");
 * if (res.is_ok()) { spdlog::info("{}", res.value().body_as_string()); }
 * ```
 */
class HttpClient {
public:
    explicit HttpClient(HttpClientOptions options);

    Result<HttpResponse> send(HttpRequest request) const;

    Result<HttpResponse> get(const std::string& target) const;

    Result<HttpResponse> post(const std::string& target,
                              const std::string& content_type,
                              std::vector<uint8_t> body) const;

    Result<HttpResponse> post(const std::string& target,
                              const std::string& content_type,
                              const std::string& body) const;

    const HttpClientOptions& options() const { return options_; }

    /**
     * @brief Reduce an absolute URL ("http://host/path") to its request target
     */
    static std::string request_target(const std::string& url);

    /// Host part of an absolute URL; empty for a bare request target
    static std::string url_host(const std::string& url);

    static std::string base64_encode(const std::string& input);

private:
    Result<HttpResponse> exchange(const HttpRequest& request) const;

    HttpClientOptions options_;
};

} // namespace network
} // namespace dsup
