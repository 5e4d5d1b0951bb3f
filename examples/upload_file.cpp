/**
 * @file upload_file.cpp
 * @brief Command-line uploader: create a source, upload a file, wait for it
 *
 * Usage:
 *   upload_file [--config client.json] [--host H] [--port N] [--https] [--ca-file PEM]
 *               [--user U --password P] [--app-token T] [--kind csv|xls|xlsx|tsv|shapefile|kml|geojson|blob]
 *               [--source-id ID] [--no-wait] [-v] FILE
 *
 * Without --source-id a new upload source named after FILE is created.
 */

#include "dsup/api/http_source_api.hpp"
#include "dsup/core/config.hpp"
#include "dsup/events/components.hpp"
#include "dsup/events/event_bus.hpp"
#include "dsup/upload/uploader.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> app_token;
    std::optional<std::string> kind_name;
    std::optional<std::int64_t> source_id;
    std::optional<std::string> ca_file;
    bool https = false;
    bool wait = true;
    bool verbose = false;
    std::string file;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
                host = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--https") {
                https = true;
            } else if (arg == "--ca-file" && i + 1 < argc) {
                ca_file = argv[++i];
            } else if ((arg == "-u" || arg == "--user") && i + 1 < argc) {
                username = argv[++i];
            } else if (arg == "--password" && i + 1 < argc) {
                password = argv[++i];
            } else if (arg == "--app-token" && i + 1 < argc) {
                app_token = argv[++i];
            } else if ((arg == "-k" || arg == "--kind") && i + 1 < argc) {
                kind_name = argv[++i];
            } else if (arg == "--source-id" && i + 1 < argc) {
                source_id = std::stoll(argv[++i]);
            } else if (arg == "--no-wait") {
                wait = false;
            } else if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (arg == "-h" || arg == "--help") {
                spdlog::info("Usage: {} [--config F] [--host H] [--port N] [--https] [--ca-file PEM] [--user U --password P] "
                             "[--app-token T] [--kind K] [--source-id ID] [--no-wait] [-v] FILE", argv[0]);
                return 0;
            } else {
                file = arg;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Invalid argument: {}", e.what());
        return 2;
    }

    if (file.empty()) {
        spdlog::error("No file given (see --help)");
        return 2;
    }

    dsup::ClientConfig config;
    if (config_path) {
        auto loaded = dsup::load_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return 2;
        }
        config = loaded.value();
    }
    config.apply_env();
    if (host) config.host = *host;
    if (https) {
        config.https = true;
        if (!port) config.port = 443;
    }
    if (port) config.port = *port;
    if (ca_file) config.ca_file = *ca_file;
    if (username) config.username = *username;
    if (password) config.password = *password;
    if (app_token) config.app_token = *app_token;
    if (verbose) config.log_level = "debug";

    if (auto valid = config.validate(); valid.is_error()) {
        spdlog::error("{}", valid.error().describe());
        return 2;
    }
    spdlog::set_level(dsup::parse_log_level(config.log_level).value());

    std::optional<dsup::upload::UploadKind> kind;
    if (kind_name) {
        auto parsed = dsup::upload::parse_upload_kind(*kind_name);
        if (parsed.is_error()) {
            spdlog::error("{}", parsed.error().describe());
            return 2;
        }
        kind = parsed.value();
    }

    dsup::events::EventBus event_bus;
    dsup::events::LoggerComponent logger(event_bus);
    dsup::events::MetricsComponent metrics(event_bus);

    dsup::network::HttpClient client(config.to_client_options());

    auto snapshot = source_id
        ? dsup::api::HttpSourceApi::lookup(client, *source_id)
        : dsup::api::HttpSourceApi::create_upload(client, fs::path(file).filename().string());
    if (snapshot.is_error()) {
        spdlog::error("Could not open source: {}", snapshot.error().describe());
        return 1;
    }

    dsup::api::HttpSourceApi api(client, snapshot.value());
    dsup::upload::CoordinatorOptions coordinator_options;
    coordinator_options.max_parallelism = config.max_parallelism;
    dsup::upload::SourceUploader uploader(api, &event_bus, coordinator_options);

    auto report = uploader.upload_file(file, kind);
    if (report.is_error()) {
        spdlog::error("Upload failed: {}", report.error().describe());
        return 1;
    }

    const auto& stats = metrics.stats();
    spdlog::info("Uploaded {} bytes in {} chunks to source {}",
                 stats.bytes_sent.load(), stats.chunks_sent.load(), report.value().source.id);

    if (!wait) {
        return 0;
    }

    dsup::api::WaitOptions wait_options;
    wait_options.sleep_interval = config.poll_interval();
    wait_options.timeout = config.wait_timeout();
    wait_options.progress = [](const dsup::api::SourceSnapshot& s) {
        spdlog::debug("Source {} still processing", s.id);
    };

    auto outcome = uploader.wait_for_finish(wait_options);
    if (outcome.is_error()) {
        spdlog::error("Waiting for source failed: {}", outcome.error().describe());
        return 1;
    }
    if (!outcome.value().ok()) {
        spdlog::error("Source {} failed: {}", outcome.value().snapshot.id,
                      outcome.value().snapshot.failure_details.dump());
        return 1;
    }

    spdlog::info("Source {} finished at {}", outcome.value().snapshot.id,
                 outcome.value().snapshot.finished_at.value_or(""));
    return 0;
}
