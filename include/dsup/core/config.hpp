#pragma once

#include "dsup/core/result.hpp"
#include "dsup/network/http_client.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace dsup {

/**
 * @brief Connection and tuning settings for the upload client
 *
 * Layered in this order, later layers winning:
 * 1. Defaults below
 * 2. A JSON file (load_config / from_json)
 * 3. DSUP_* environment variables (apply_env)
 * 4. Command-line flags, applied by the executable
 */
struct ClientConfig {
    std::string host;
    uint16_t port = 80;
    std::string username;
    std::string password;
    std::string app_token;
    bool https = false;
    bool verify_peer = true;
    std::string ca_file;
    std::string user_agent = "dsup/1.0";
    std::size_t max_parallelism = 16;
    std::int64_t poll_interval_ms = 1000;
    std::int64_t wait_timeout_s = 0;  ///< 0 waits forever
    std::string log_level = "info";

    static Result<ClientConfig> from_json(const nlohmann::json& document);

    /// Reads variables from the process environment
    void apply_env();

    /// `lookup` returns nullptr for unset variables
    Result<void> apply_env(const std::function<const char*(const char*)>& lookup);

    Result<void> validate() const;

    network::HttpClientOptions to_client_options() const;

    std::chrono::milliseconds poll_interval() const { return std::chrono::milliseconds(poll_interval_ms); }

    std::optional<std::chrono::milliseconds> wait_timeout() const;
};

Result<ClientConfig> load_config(const std::string& path);

/**
 * @brief Map "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off"
 */
Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace dsup
