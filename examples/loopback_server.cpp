/**
 * @file loopback_server.cpp
 * @brief In-memory publishing service for trying the uploader locally
 *
 * Run with:
 *   ./build/examples/loopback_server --port 8080 --chunk-size 1048576 --parallelism 4
 *
 * Then:
 *   ./build/examples/upload_file --host localhost --port 8080 data.csv
 */

#include "dsup/network/http_router.hpp"
#include "dsup/network/http_server.hpp"
#include "dsup/server/publishing_service.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <string>

using dsup::network::HttpContext;
using dsup::network::HttpMethodUtils;
using dsup::network::HttpRequest;
using dsup::network::HttpResponse;
using dsup::network::HttpRouter;
using dsup::network::HttpServer;

namespace asio = boost::asio;

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    uint16_t port = 8080;
    std::string address = "127.0.0.1";
    std::size_t max_request_bytes = 0;
    dsup::server::PublishingOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if ((arg == "-a" || arg == "--address") && i + 1 < argc) {
            address = argv[++i];
        } else if ((arg == "-c" || arg == "--chunk-size") && i + 1 < argc) {
            options.chunk_size = std::stoll(argv[++i]);
        } else if ((arg == "-j" || arg == "--parallelism") && i + 1 < argc) {
            options.upload_parallelism = std::stoll(argv[++i]);
        } else if (arg == "--user" && i + 1 < argc) {
            options.username = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            options.password = argv[++i];
        } else if (arg == "--fail-chunk" && i + 1 < argc) {
            options.fail_chunk_seq = std::stoull(argv[++i]);
        } else if (arg == "--max-request" && i + 1 < argc) {
            max_request_bytes = std::stoull(argv[++i]);
        } else if (arg == "--fail-processing") {
            options.fail_processing = true;
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            spdlog::info("Usage: {} [--port N] [--address A] [--chunk-size N] [--parallelism N] "
                         "[--user U --password P] [--fail-chunk SEQ] [--fail-processing] [--max-request BYTES] [-v]", argv[0]);
            return 0;
        }
    }

    dsup::server::PublishingService service(options);

    HttpRouter router;
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::info("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });
    service.register_routes(router);

    try {
        asio::io_context io_context;
        HttpServer server(io_context, port, address);
        server.set_handler([&router](const HttpRequest& request) {
            return router.handle_request(request);
        });
        if (max_request_bytes > 0) {
            server.set_max_request_bytes(max_request_bytes);
        }

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            spdlog::info("Shutting down...");
            server.stop();
            spdlog::info("Served {} requests", server.requests_served());
            io_context.stop();
        });

        spdlog::info("Publishing service ready: chunk_size={} parallelism={}",
                     options.chunk_size, options.upload_parallelism);
        io_context.run();
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }
    return 0;
}
