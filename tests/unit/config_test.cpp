#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace mup1gw::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
                   ("mup1gw_config_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string &name, const std::string &content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    GatewayConfig config;
    std::string error;

    EXPECT_TRUE(validate_config(config, error)) << error;
    EXPECT_EQ(config.http.bind, "0.0.0.0");
    EXPECT_EQ(config.http.port, 8000);
    EXPECT_EQ(config.tool.command, "dr");
    EXPECT_EQ(config.tool.subcommand, "mup1cc");
    EXPECT_EQ(config.tool.timeout_ms, 30000);
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 1u);
    EXPECT_EQ(config.http.cors_allowed_origins[0], "*");
}

TEST_F(ConfigTest, ValidFullConfig) {
    std::string config_content = R"(
http:
  bind: 127.0.0.1
  port: 9000
  thread_pool_size: 4
  read_timeout_s: 10
  write_timeout_s: 20
  max_upload_bytes: 1024
  cors_allowed_origins:
    - http://localhost:3000
    - https://*.example.com

tool:
  command: /opt/velocitydrive/bin/dr
  subcommand: mup1cc
  timeout_ms: 5000
  temp_dir: /var/tmp

logging:
  level: debug
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    GatewayConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.http.bind, "127.0.0.1");
    EXPECT_EQ(config.http.port, 9000);
    EXPECT_EQ(config.http.thread_pool_size, 4);
    EXPECT_EQ(config.http.read_timeout_s, 10);
    EXPECT_EQ(config.http.write_timeout_s, 20);
    EXPECT_EQ(config.http.max_upload_bytes, 1024u);
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 2u);
    EXPECT_EQ(config.http.cors_allowed_origins[1], "https://*.example.com");
    EXPECT_EQ(config.tool.command, "/opt/velocitydrive/bin/dr");
    EXPECT_EQ(config.tool.timeout_ms, 5000);
    EXPECT_EQ(config.tool.temp_dir, "/var/tmp");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    std::string config_path = create_config_file("partial.yaml", "tool:\n  timeout_ms: 1500\n");
    GatewayConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.tool.timeout_ms, 1500);
    EXPECT_EQ(config.tool.command, "dr");
    EXPECT_EQ(config.http.port, 8000);
}

TEST_F(ConfigTest, EmptyFileUsesDefaults) {
    std::string config_path = create_config_file("empty.yaml", "");
    GatewayConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.tool.subcommand, "mup1cc");
}

TEST_F(ConfigTest, ScalarCorsOriginAccepted) {
    std::string config_path = create_config_file("cors.yaml", "http:\n  cors_allowed_origins: http://panel.local\n");
    GatewayConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 1u);
    EXPECT_EQ(config.http.cors_allowed_origins[0], "http://panel.local");
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    std::string config_path = create_config_file("unknown.yaml", "polling:\n  interval_ms: 5\nhttp:\n  colour: blue\n");
    GatewayConfig config;
    std::string error;

    EXPECT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
}

TEST_F(ConfigTest, InvalidPortRejected) {
    std::string config_path = create_config_file("port.yaml", "http:\n  port: 70000\n");
    GatewayConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("port"), std::string::npos);
}

TEST_F(ConfigTest, ToolTimeoutTooShortRejected) {
    std::string config_path = create_config_file("timeout.yaml", "tool:\n  timeout_ms: 10\n");
    GatewayConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("timeout_ms"), std::string::npos);
}

TEST_F(ConfigTest, EmptyToolCommandRejected) {
    std::string config_path = create_config_file("command.yaml", "tool:\n  command: \"\"\n");
    GatewayConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("tool.command"), std::string::npos);
}

TEST_F(ConfigTest, EmptyCorsListRejected) {
    std::string config_path = create_config_file("nocors.yaml", "http:\n  cors_allowed_origins: []\n");
    GatewayConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("cors_allowed_origins"), std::string::npos);
}

TEST_F(ConfigTest, InvalidLogLevelRejected) {
    std::string config_path = create_config_file("log.yaml", "logging:\n  level: verbose\n");
    GatewayConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("verbose"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlReportsParseError) {
    std::string config_path = create_config_file("broken.yaml", "http: [unterminated\n");
    GatewayConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("YAML"), std::string::npos);
}

TEST_F(ConfigTest, WrongValueTypeReportsError) {
    std::string config_path = create_config_file("type.yaml", "http:\n  port: eighty\n");
    GatewayConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, MissingFileReportsError) {
    GatewayConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "does_not_exist.yaml").string(), config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, NonMappingRootRejected) {
    std::string config_path = create_config_file("list.yaml", "- a\n- b\n");
    GatewayConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("mapping"), std::string::npos);
}

TEST_F(ConfigTest, ShippedExampleConfigLoads) {
    GatewayConfig config;
    std::string error;

    ASSERT_TRUE(load_config(std::string(MUP1GW_SOURCE_DIR) + "/config/mup1-gateway.yaml", config, error))
        << "Error: " << error;

    GatewayConfig defaults;
    EXPECT_EQ(config.http.port, defaults.http.port);
    EXPECT_EQ(config.http.max_upload_bytes, defaults.http.max_upload_bytes);
    EXPECT_EQ(config.tool.command, defaults.tool.command);
    EXPECT_EQ(config.tool.timeout_ms, defaults.tool.timeout_ms);
    EXPECT_EQ(config.logging.level, defaults.logging.level);
}
