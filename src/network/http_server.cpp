#include "dsup/network/http_server.hpp"

#include <spdlog/spdlog.h>

namespace dsup {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, std::shared_ptr<ServerState> state)
    : socket_(std::move(socket))
    , state_(std::move(state))
    , parser_(MessageKind::Request) {
    parser_.set_max_body_bytes(state_->max_request_bytes);
}

void HttpConnection::start() {
    read_more();
}

void HttpConnection::read_more() {
    socket_.async_read_some(
        asio::buffer(buffer_),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t n) {
            self->on_read(ec, n);
        });
}

void HttpConnection::on_read(const boost::system::error_code& ec, std::size_t bytes_transferred) {
    if (ec) {
        if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
            spdlog::debug("Read error: {}", ec.message());
        }
        return;
    }

    bytes_received_ += bytes_transferred;
    if (bytes_received_ > state_->max_request_bytes) {
        spdlog::warn("Refusing request larger than {} bytes", state_->max_request_bytes);
        reply(HttpResponse(HttpStatus::PAYLOAD_TOO_LARGE));
        return;
    }

    auto complete = parser_.parse(buffer_.data(), bytes_transferred);
    if (complete.is_error() && parser_.body_too_large()) {
        spdlog::warn("Refusing request: {}", complete.error().message);
        reply(HttpResponse(HttpStatus::PAYLOAD_TOO_LARGE));
        return;
    }
    if (complete.is_error()) {
        spdlog::warn("Malformed request: {}", complete.error().message);
        HttpResponse bad_request(HttpStatus::BAD_REQUEST);
        bad_request.set_header("Content-Type", "text/plain");
        bad_request.set_body(complete.error().message);
        reply(std::move(bad_request));
        return;
    }

    if (complete.value()) {
        dispatch(parser_.get_request());
    } else {
        read_more();
    }
}

void HttpConnection::dispatch(const HttpRequest& request) {
    spdlog::debug("{} {} ({} body bytes)",
                  HttpMethodUtils::to_string(request.method), request.url, request.body.size());

    if (!state_->handler) {
        reply(HttpResponse(HttpStatus::SERVICE_UNAVAILABLE));
        return;
    }

    try {
        reply(state_->handler(request));
    } catch (const std::exception& e) {
        spdlog::error("Handler for {} threw: {}", request.url, e.what());
        reply(HttpResponse(HttpStatus::INTERNAL_SERVER_ERROR));
    }
    state_->requests_served++;
}

void HttpConnection::reply(HttpResponse response) {
    response.set_header("Connection", "close");
    auto wire = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*wire),
        [self = shared_from_this(), wire](const boost::system::error_code& ec, std::size_t written) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }
            spdlog::trace("Sent {} bytes", written);
            boost::system::error_code ignored;
            self->socket_.shutdown(tcp::socket::shutdown_both, ignored);
        });
}

// ──────────────────────────────────────────────────────────
// HttpServer
// ──────────────────────────────────────────────────────────

HttpServer::HttpServer(asio::io_context& io_context, uint16_t port, const std::string& address)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(address), port))
    , state_(std::make_shared<ServerState>())
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server listening on {}:{}", address, port_);
    accept_next();
}

void HttpServer::set_handler(HttpRequestHandler handler) {
    state_->handler = std::move(handler);
}

void HttpServer::set_max_request_bytes(std::size_t limit) {
    state_->max_request_bytes = limit;
}

void HttpServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Failed to close acceptor: {}", ec.message());
    }
}

void HttpServer::accept_next() {
    acceptor_.async_accept(
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                spdlog::error("Accept error: {}", ec.message());
            } else {
                std::make_shared<HttpConnection>(std::move(socket), state_)->start();
            }
            accept_next();
        });
}

} // namespace network
} // namespace dsup
