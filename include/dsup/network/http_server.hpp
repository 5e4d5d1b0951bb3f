#pragma once

#include "dsup/core/result.hpp"
#include "http_parser.hpp"
#include "http_types.hpp"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace dsup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/// What every connection of one server shares
struct ServerState {
    HttpRequestHandler handler;
    std::size_t max_request_bytes = 64 * 1024 * 1024;
    std::atomic<std::uint64_t> requests_served{0};
};

/**
 * @brief One request/response exchange on an accepted socket
 *
 * Reads until the parser has a full request (or the request grows past
 * max_request_bytes, answered with 413), runs the handler, writes the
 * response with "Connection: close" and shuts the socket down. Kept alive
 * by the shared_ptr captured in each pending async operation.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, std::shared_ptr<ServerState> state);

    void start();

private:
    void read_more();
    void on_read(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void dispatch(const HttpRequest& request);
    void reply(HttpResponse response);

    tcp::socket socket_;
    std::shared_ptr<ServerState> state_;
    HttpParser parser_;
    std::size_t bytes_received_ = 0;
    std::array<char, 16384> buffer_;
};

/**
 * @brief Event-driven HTTP server on a caller-owned io_context
 *
 * Binds to loopback unless told otherwise. Port 0 binds an ephemeral
 * port; port() reports the bound one.
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServer server(io_context, 0);
 * server.set_handler([&router](const HttpRequest& r) { return router.handle_request(r); });
 * io_context.run();
 * ```
 */
class HttpServer {
public:
    HttpServer(asio::io_context& io_context, uint16_t port, const std::string& address = "127.0.0.1");

    /// Must be called before io_context.run()
    void set_handler(HttpRequestHandler handler);

    /// Requests whose head plus body exceed this are refused with 413
    void set_max_request_bytes(std::size_t limit);

    /// Stops accepting; open connections finish on their own. Call on the io_context thread.
    void stop();

    uint16_t port() const { return port_; }

    std::uint64_t requests_served() const { return state_->requests_served.load(); }

private:
    void accept_next();

    tcp::acceptor acceptor_;
    std::shared_ptr<ServerState> state_;
    uint16_t port_;
};

} // namespace network
} // namespace dsup
