#include "dsup/core/config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

namespace dsup {
namespace {

using json = nlohmann::json;

Result<std::uint64_t> parse_unsigned(const char* name, const std::string& text) {
    try {
        std::size_t consumed = 0;
        const auto value = std::stoull(text, &consumed, 10);
        if (consumed != text.size() || text.front() == '-') {
            return Err<std::uint64_t>(ErrorCode::InvalidArgument,
                                      std::string(name) + " is not a number: " + text);
        }
        return Ok(static_cast<std::uint64_t>(value));
    } catch (const std::exception&) {
        return Err<std::uint64_t>(ErrorCode::InvalidArgument,
                                  std::string(name) + " is not a number: " + text);
    }
}

Result<bool> parse_flag(const char* name, const std::string& text) {
    if (text == "1" || text == "true" || text == "yes") {
        return Ok(true);
    }
    if (text == "0" || text == "false" || text == "no") {
        return Ok(false);
    }
    return Err<bool>(ErrorCode::InvalidArgument, std::string(name) + " is not a boolean: " + text);
}

} // namespace

Result<ClientConfig> ClientConfig::from_json(const json& document) {
    if (!document.is_object()) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, "Config root must be an object");
    }

    ClientConfig config;
    try {
        config.host = document.value("host", config.host);
        const auto port = document.value("port", static_cast<std::uint64_t>(config.port));
        if (port > std::numeric_limits<uint16_t>::max()) {
            return Err<ClientConfig>(ErrorCode::InvalidArgument, "port out of range: " + std::to_string(port));
        }
        config.port = static_cast<uint16_t>(port);
        config.username = document.value("username", config.username);
        config.password = document.value("password", config.password);
        config.app_token = document.value("app_token", config.app_token);
        config.https = document.value("https", config.https);
        config.verify_peer = document.value("verify_peer", config.verify_peer);
        config.ca_file = document.value("ca_file", config.ca_file);
        config.user_agent = document.value("user_agent", config.user_agent);
        config.max_parallelism = document.value("max_parallelism", config.max_parallelism);
        config.poll_interval_ms = document.value("poll_interval_ms", config.poll_interval_ms);
        config.wait_timeout_s = document.value("wait_timeout_s", config.wait_timeout_s);
        config.log_level = document.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, std::string("Invalid config: ") + e.what());
    }
    return Ok(std::move(config));
}

void ClientConfig::apply_env() {
    auto result = apply_env([](const char* name) { return std::getenv(name); });
    if (result.is_error()) {
        spdlog::warn("Ignoring environment override: {}", result.error().message);
    }
}

Result<void> ClientConfig::apply_env(const std::function<const char*(const char*)>& lookup) {
    if (const char* value = lookup("DSUP_HOST")) {
        host = value;
    }
    if (const char* value = lookup("DSUP_PORT")) {
        auto port_value = parse_unsigned("DSUP_PORT", value);
        if (port_value.is_error()) {
            return Err<void>(port_value.error());
        }
        if (port_value.value() > std::numeric_limits<uint16_t>::max()) {
            return Err<void>(ErrorCode::InvalidArgument, std::string("DSUP_PORT out of range: ") + value);
        }
        port = static_cast<uint16_t>(port_value.value());
    }
    if (const char* value = lookup("DSUP_USERNAME")) {
        username = value;
    }
    if (const char* value = lookup("DSUP_PASSWORD")) {
        password = value;
    }
    if (const char* value = lookup("DSUP_APP_TOKEN")) {
        app_token = value;
    }
    if (const char* value = lookup("DSUP_HTTPS")) {
        auto flag = parse_flag("DSUP_HTTPS", value);
        if (flag.is_error()) {
            return Err<void>(flag.error());
        }
        https = flag.value();
    }
    if (const char* value = lookup("DSUP_CA_FILE")) {
        ca_file = value;
    }
    if (const char* value = lookup("DSUP_LOG_LEVEL")) {
        log_level = value;
    }
    return Ok();
}

Result<void> ClientConfig::validate() const {
    if (host.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "host is required");
    }
    if (port == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "port must be non-zero");
    }
    if (max_parallelism == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "max_parallelism must be at least 1");
    }
    if (poll_interval_ms <= 0) {
        return Err<void>(ErrorCode::InvalidArgument, "poll_interval_ms must be positive");
    }
    if (wait_timeout_s < 0) {
        return Err<void>(ErrorCode::InvalidArgument, "wait_timeout_s must not be negative");
    }
    if (auto level = parse_log_level(log_level); level.is_error()) {
        return Err<void>(level.error());
    }
    return Ok();
}

network::HttpClientOptions ClientConfig::to_client_options() const {
    network::HttpClientOptions options;
    options.host = host;
    options.port = port;
    options.user_agent = user_agent;
    options.username = username;
    options.password = password;
    options.app_token = app_token;
    options.https = https;
    options.verify_peer = verify_peer;
    options.ca_file = ca_file;
    return options;
}

std::optional<std::chrono::milliseconds> ClientConfig::wait_timeout() const {
    if (wait_timeout_s <= 0) {
        return std::nullopt;
    }
    return std::chrono::seconds(wait_timeout_s);
}

Result<ClientConfig> load_config(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, "Cannot open config file: " + path);
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, "Config file is not valid JSON: " + path);
    }
    return ClientConfig::from_json(document);
}

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "trace") return Ok(spdlog::level::trace);
    if (name == "debug") return Ok(spdlog::level::debug);
    if (name == "info") return Ok(spdlog::level::info);
    if (name == "warn" || name == "warning") return Ok(spdlog::level::warn);
    if (name == "error") return Ok(spdlog::level::err);
    if (name == "critical") return Ok(spdlog::level::critical);
    if (name == "off") return Ok(spdlog::level::off);
    return Err<spdlog::level::level_enum>(ErrorCode::InvalidArgument, "Unknown log level: " + name);
}

} // namespace dsup
