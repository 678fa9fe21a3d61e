#pragma once

#include <string>

namespace timestamp {
namespace runtime {

// Environment variable that overrides logging.level
constexpr const char *kLogLevelEnvVar = "TIMESTAMP_LOG";

struct LoggingConfig {
    std::string level = "debug";  // debug, info, warn, error
};

struct HttpConfig {
    std::string bind = "127.0.0.1";  // Bind address
    int port = 3000;                 // HTTP port (0 = ephemeral)
    int thread_pool_size = 8;        // Worker thread pool size
    int read_timeout_s = 5;          // Socket read timeout
    int write_timeout_s = 5;         // Socket write timeout
};

struct ServiceConfig {
    HttpConfig http;
    LoggingConfig logging;
};

// Loads configuration from a YAML file on top of the defaults already in config
bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ServiceConfig &config, std::string &error);

// Applies TIMESTAMP_LOG if set. Returns false (with error) on an unknown level.
bool apply_environment(ServiceConfig &config, std::string &error);

}  // namespace runtime
}  // namespace timestamp
