#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace timestamp::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "timestamp_config_test";
        fs::create_directories(temp_dir);
        unsetenv(kLogLevelEnvVar);
    }

    void TearDown() override {
        unsetenv(kLogLevelEnvVar);
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    ServiceConfig config;
    std::string error;

    EXPECT_TRUE(validate_config(config, error)) << error;
    EXPECT_EQ("127.0.0.1", config.http.bind);
    EXPECT_EQ(3000, config.http.port);
    EXPECT_EQ("debug", config.logging.level);
}

TEST_F(ConfigTest, ValidFullConfig) {
    std::string config_path = create_config_file("full.yaml", R"(
http:
  bind: 0.0.0.0
  port: 8080
  thread_pool_size: 16
  read_timeout_s: 10
  write_timeout_s: 15

logging:
  level: WARN
)");
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ("0.0.0.0", config.http.bind);
    EXPECT_EQ(8080, config.http.port);
    EXPECT_EQ(16, config.http.thread_pool_size);
    EXPECT_EQ(10, config.http.read_timeout_s);
    EXPECT_EQ(15, config.http.write_timeout_s);
    EXPECT_EQ("warn", config.logging.level);
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    std::string config_path = create_config_file("partial.yaml", R"(
http:
  port: 4000
)");
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(4000, config.http.port);
    EXPECT_EQ("127.0.0.1", config.http.bind);
    EXPECT_EQ("debug", config.logging.level);
}

TEST_F(ConfigTest, UnknownTopLevelKeyIsIgnored) {
    std::string config_path = create_config_file("unknown.yaml", R"(
metrics:
  enabled: true
http:
  port: 4001
)");
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(4001, config.http.port);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_path = create_config_file("bad_level.yaml", R"(
logging:
  level: verbose
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("Invalid log level"), std::string::npos) << error;
}

TEST_F(ConfigTest, InvalidPort) {
    std::string config_path = create_config_file("bad_port.yaml", R"(
http:
  port: 70000
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("port"), std::string::npos) << error;
}

TEST_F(ConfigTest, InvalidThreadPoolSize) {
    std::string config_path = create_config_file("bad_pool.yaml", R"(
http:
  thread_pool_size: 0
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("thread_pool_size"), std::string::npos) << error;
}

TEST_F(ConfigTest, WrongValueType) {
    std::string config_path = create_config_file("bad_type.yaml", R"(
http:
  port: not-a-number
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("Config load error"), std::string::npos) << error;
}

TEST_F(ConfigTest, MalformedYaml) {
    std::string config_path = create_config_file("malformed.yaml", "http: [port: 1\n");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos) << error;
}

TEST_F(ConfigTest, MissingFile) {
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "missing.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos) << error;
}

TEST_F(ConfigTest, EnvironmentOverridesLogLevel) {
    setenv(kLogLevelEnvVar, "ERROR", 1);
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(apply_environment(config, error)) << error;
    EXPECT_EQ("error", config.logging.level);
}

TEST_F(ConfigTest, EnvironmentUnsetKeepsLevel) {
    ServiceConfig config;
    config.logging.level = "info";
    std::string error;

    ASSERT_TRUE(apply_environment(config, error)) << error;
    EXPECT_EQ("info", config.logging.level);
}

TEST_F(ConfigTest, EnvironmentRejectsUnknownLevel) {
    setenv(kLogLevelEnvVar, "loud", 1);
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(apply_environment(config, error));
    EXPECT_NE(error.find(kLogLevelEnvVar), std::string::npos) << error;
    EXPECT_EQ("debug", config.logging.level);
}
