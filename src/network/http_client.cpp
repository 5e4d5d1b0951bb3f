#include "dsup/network/http_client.hpp"
#include "dsup/network/http_parser.hpp"

#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include <strings.h>

#include <array>

namespace dsup {
namespace network {
namespace {

constexpr std::size_t kErrorBodyExcerpt = 256;

Error transport_error(const std::string& what, const boost::system::error_code& ec) {
    return Error{ErrorCode::Transport, what + ": " + ec.message()};
}

// Writes the request and reads until the parser has a whole response
template<typename Stream>
Result<HttpResponse> transact(Stream& stream, const HttpRequest& request) {
    boost::system::error_code ec;
    const std::vector<uint8_t> wire = request.serialize();
    asio::write(stream, asio::buffer(wire), ec);
    if (ec) {
        return Err<HttpResponse>(transport_error("Failed to send request", ec));
    }

    HttpParser parser(MessageKind::Response);
    std::array<char, 8192> buffer;
    while (true) {
        const std::size_t bytes_read = stream.read_some(asio::buffer(buffer), ec);
        // Peers that close without close_notify end the body like a plain eof
        if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err<HttpResponse>(ErrorCode::Transport, finished.error().message);
            }
            break;
        }
        if (ec) {
            return Err<HttpResponse>(transport_error("Failed to read response", ec));
        }

        auto parsed = parser.parse(buffer.data(), bytes_read);
        if (parsed.is_error()) {
            return Err<HttpResponse>(ErrorCode::Transport, parsed.error().message);
        }
        if (parsed.value()) {
            break;
        }
    }
    return Ok(parser.get_response());
}

} // namespace

HttpClient::HttpClient(HttpClientOptions options)
    : options_(std::move(options)) {
}

Result<HttpResponse> HttpClient::send(HttpRequest request) const {
    const std::string host = url_host(request.url);
    if (!host.empty() && strcasecmp(host.c_str(), options_.host.c_str()) != 0) {
        return Err<HttpResponse>(ErrorCode::Protocol,
            "URL " + request.url + " names host " + host + ", client is bound to " + options_.host);
    }
    request.url = request_target(request.url);
    request.version = HttpVersion::HTTP_1_1;

    const uint16_t default_port = options_.https ? 443 : 80;
    request.set_header("Host", options_.port == default_port
        ? options_.host
        : options_.host + ":" + std::to_string(options_.port));
    request.set_header("User-Agent", options_.user_agent);
    request.set_header("Connection", "close");
    if (!request.has_header("Accept")) {
        request.set_header("Accept", "application/json");
    }
    if (!options_.username.empty()) {
        request.set_header("Authorization",
                           "Basic " + base64_encode(options_.username + ":" + options_.password));
    }
    if (!options_.app_token.empty()) {
        request.set_header("X-App-Token", options_.app_token);
    }

    Result<HttpResponse> result = Err<HttpResponse>(ErrorCode::Transport, "no response");
    try {
        result = exchange(request);
    } catch (const std::exception& e) {
        result = Err<HttpResponse>(ErrorCode::Transport, std::string("Request aborted: ") + e.what());
    }
    if (result.is_error()) {
        spdlog::warn("{} {} failed: {}", HttpMethodUtils::to_string(request.method),
                     request.url, result.error().describe());
        return result;
    }

    const auto& response = result.value();
    spdlog::debug("{} {} -> {} ({} bytes)", HttpMethodUtils::to_string(request.method),
                  request.url, response.status_code, response.body.size());

    if (!response.is_success()) {
        auto body = response.body_as_string();
        if (body.size() > kErrorBodyExcerpt) {
            body.resize(kErrorBodyExcerpt);
        }
        return Err<HttpResponse>(Error{ErrorCode::Transport,
            HttpMethodUtils::to_string(request.method) + " " + request.url + " returned " +
            std::to_string(response.status_code) + " " + response.reason_phrase +
            (body.empty() ? "" : ": " + body),
            response.status_code});
    }
    return result;
}

Result<HttpResponse> HttpClient::get(const std::string& target) const {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = target;
    return send(std::move(request));
}

Result<HttpResponse> HttpClient::post(const std::string& target,
                                      const std::string& content_type,
                                      std::vector<uint8_t> body) const {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = target;
    request.set_header("Content-Type", content_type);
    request.set_body(std::move(body));
    return send(std::move(request));
}

Result<HttpResponse> HttpClient::post(const std::string& target,
                                      const std::string& content_type,
                                      const std::string& body) const {
    return post(target, content_type, std::vector<uint8_t>(body.begin(), body.end()));
}

Result<HttpResponse> HttpClient::exchange(const HttpRequest& request) const {
    asio::io_context io_context;
    boost::system::error_code ec;

    tcp::resolver resolver(io_context);
    const auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port), ec);
    if (ec) {
        return Err<HttpResponse>(transport_error("Failed to resolve " + options_.host, ec));
    }

    tcp::socket socket(io_context);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        return Err<HttpResponse>(transport_error(
            "Failed to connect to " + options_.host + ":" + std::to_string(options_.port), ec));
    }

    if (!options_.https) {
        auto result = transact(socket, request);
        boost::system::error_code shutdown_ec;
        socket.shutdown(tcp::socket::shutdown_both, shutdown_ec);
        return result;
    }

    asio::ssl::context tls(asio::ssl::context::tls_client);
    if (options_.ca_file.empty()) {
        tls.set_default_verify_paths(ec);
    } else {
        tls.load_verify_file(options_.ca_file, ec);
    }
    if (ec) {
        return Err<HttpResponse>(transport_error("Failed to load trust anchors", ec));
    }
    tls.set_verify_mode(options_.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);

    asio::ssl::stream<tcp::socket> stream(std::move(socket), tls);
    // SNI
    if (!SSL_set_tlsext_host_name(stream.native_handle(), options_.host.c_str())) {
        return Err<HttpResponse>(ErrorCode::Transport, "Failed to set TLS server name " + options_.host);
    }
    if (options_.verify_peer) {
        stream.set_verify_callback(asio::ssl::host_name_verification(options_.host));
    }
    stream.handshake(asio::ssl::stream_base::client, ec);
    if (ec) {
        return Err<HttpResponse>(transport_error("TLS handshake with " + options_.host + " failed", ec));
    }

    auto result = transact(stream, request);
    boost::system::error_code shutdown_ec;
    stream.shutdown(shutdown_ec);
    stream.lowest_layer().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    return result;
}

std::string HttpClient::request_target(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return url.empty() ? "/" : url;
    }
    const auto path_start = url.find('/', scheme_end + 3);
    return path_start == std::string::npos ? "/" : url.substr(path_start);
}

std::string HttpClient::url_host(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return "";
    }
    const auto authority_start = scheme_end + 3;
    auto authority = url.substr(authority_start, url.find('/', authority_start) - authority_start);
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        return authority.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    }
    return authority.substr(0, authority.find(':'));
}

std::string HttpClient::base64_encode(const std::string& input) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < input.size()) {
        const uint32_t triple = (static_cast<uint8_t>(input[i]) << 16) |
                                (static_cast<uint8_t>(input[i + 1]) << 8) |
                                static_cast<uint8_t>(input[i + 2]);
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += kAlphabet[(triple >> 6) & 0x3F];
        out += kAlphabet[triple & 0x3F];
        i += 3;
    }

    const std::size_t remaining = input.size() - i;
    if (remaining == 1) {
        const uint32_t value = static_cast<uint8_t>(input[i]) << 16;
        out += kAlphabet[(value >> 18) & 0x3F];
        out += kAlphabet[(value >> 12) & 0x3F];
        out += "==";
    } else if (remaining == 2) {
        const uint32_t value = (static_cast<uint8_t>(input[i]) << 16) |
                               (static_cast<uint8_t>(input[i + 1]) << 8);
        out += kAlphabet[(value >> 18) & 0x3F];
        out += kAlphabet[(value >> 12) & 0x3F];
        out += kAlphabet[(value >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace network
} // namespace dsup
