#include "dsup/core/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace fs = std::filesystem;

using dsup::ClientConfig;
using dsup::ErrorCode;
using dsup::load_config;
using dsup::parse_log_level;

namespace {

fs::path write_config(const std::string& content) {
    static std::atomic<uint64_t> counter{0};
    auto path = fs::temp_directory_path() / ("dsup_config_test" + std::to_string(counter.fetch_add(1)) + ".json");
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

} // namespace

TEST(ClientConfigTest, DefaultsNeedOnlyAHost) {
    ClientConfig config;
    EXPECT_EQ(config.port, 80);
    EXPECT_EQ(config.user_agent, "dsup/1.0");
    EXPECT_EQ(config.max_parallelism, 16u);
    EXPECT_EQ(config.poll_interval().count(), 1000);
    EXPECT_FALSE(config.wait_timeout().has_value());

    auto invalid = config.validate();
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidArgument);

    config.host = "data.example.org";
    EXPECT_TRUE(config.validate().is_ok());
}

TEST(ClientConfigTest, LoadsJsonFile) {
    auto path = write_config(R"({
        "host": "localhost",
        "port": 8080,
        "username": "alice",
        "password": "secret",
        "app_token": "tok",
        "max_parallelism": 4,
        "poll_interval_ms": 250,
        "wait_timeout_s": 30,
        "log_level": "debug"
    })");

    auto loaded = load_config(path.string());
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();
    const auto& config = loaded.value();
    EXPECT_EQ(config.host, "localhost");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.max_parallelism, 4u);
    EXPECT_EQ(config.poll_interval().count(), 250);
    ASSERT_TRUE(config.wait_timeout().has_value());
    EXPECT_EQ(config.wait_timeout()->count(), 30000);
    EXPECT_TRUE(config.validate().is_ok());

    auto options = config.to_client_options();
    EXPECT_EQ(options.host, "localhost");
    EXPECT_EQ(options.port, 8080);
    EXPECT_EQ(options.username, "alice");
    EXPECT_EQ(options.password, "secret");
    EXPECT_EQ(options.app_token, "tok");

    fs::remove(path);
}

TEST(ClientConfigTest, RejectsBadFiles) {
    auto missing = load_config("/nonexistent/dsup.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidArgument);

    auto garbage = write_config("{not json");
    EXPECT_TRUE(load_config(garbage.string()).is_error());
    fs::remove(garbage);

    auto wrong_type = write_config(R"({"host": "x", "port": "eighty"})");
    EXPECT_TRUE(load_config(wrong_type.string()).is_error());
    fs::remove(wrong_type);

    auto too_big = write_config(R"({"host": "x", "port": 70000})");
    EXPECT_TRUE(load_config(too_big.string()).is_error());
    fs::remove(too_big);
}

TEST(ClientConfigTest, EnvironmentOverridesFileValues) {
    ClientConfig config;
    config.host = "from-file";
    config.port = 8080;

    const std::map<std::string, std::string> env = {
        {"DSUP_HOST", "from-env"},
        {"DSUP_PORT", "9090"},
        {"DSUP_APP_TOKEN", "env-token"},
        {"DSUP_LOG_LEVEL", "warn"},
    };
    auto result = config.apply_env([&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(config.host, "from-env");
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.app_token, "env-token");
    EXPECT_EQ(config.log_level, "warn");
    EXPECT_TRUE(config.username.empty());
}

TEST(ClientConfigTest, MalformedEnvironmentPortIsRejected) {
    ClientConfig config;
    auto result = config.apply_env([](const char* name) -> const char* {
        return std::strcmp(name, "DSUP_PORT") == 0 ? "http" : nullptr;
    });
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(config.port, 80);
}

TEST(ClientConfigTest, TlsSettingsReachClientOptions) {
    auto path = write_config(R"({"host": "data.example.org", "port": 443, "https": true, "verify_peer": false})");
    auto loaded = load_config(path.string());
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();
    fs::remove(path);

    auto config = loaded.value();
    const std::map<std::string, std::string> env = {{"DSUP_CA_FILE", "/etc/dsup/ca.pem"}};
    ASSERT_TRUE(config.apply_env([&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    }).is_ok());

    auto options = config.to_client_options();
    EXPECT_TRUE(options.https);
    EXPECT_FALSE(options.verify_peer);
    EXPECT_EQ(options.ca_file, "/etc/dsup/ca.pem");
    EXPECT_EQ(options.port, 443);
}

TEST(ClientConfigTest, EnvironmentHttpsFlagMustBeBoolean) {
    ClientConfig config;
    auto on = config.apply_env([](const char* name) -> const char* {
        return std::strcmp(name, "DSUP_HTTPS") == 0 ? "true" : nullptr;
    });
    ASSERT_TRUE(on.is_ok());
    EXPECT_TRUE(config.https);

    auto bad = config.apply_env([](const char* name) -> const char* {
        return std::strcmp(name, "DSUP_HTTPS") == 0 ? "sometimes" : nullptr;
    });
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(config.https);
}

TEST(ClientConfigTest, ValidateChecksTuningValues) {
    ClientConfig config;
    config.host = "h";

    config.max_parallelism = 0;
    EXPECT_TRUE(config.validate().is_error());
    config.max_parallelism = 1;

    config.poll_interval_ms = 0;
    EXPECT_TRUE(config.validate().is_error());
    config.poll_interval_ms = 10;

    config.port = 0;
    EXPECT_TRUE(config.validate().is_error());
    config.port = 80;

    config.log_level = "chatty";
    EXPECT_TRUE(config.validate().is_error());
    config.log_level = "info";

    EXPECT_TRUE(config.validate().is_ok());
}

TEST(ClientConfigTest, ParsesLogLevels) {
    EXPECT_EQ(parse_log_level("debug").value(), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("warn").value(), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error").value(), spdlog::level::err);
    EXPECT_TRUE(parse_log_level("loud").is_error());
}
