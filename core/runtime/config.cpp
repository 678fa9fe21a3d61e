#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>

#include "../logging/logger.hpp"

namespace timestamp {
namespace runtime {

namespace {
std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_known_level(const std::string &level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}
}  // namespace

bool validate_config(const ServiceConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "HTTP bind address must not be empty";
        return false;
    }
    if (config.http.port < 0 || config.http.port > 65535) {
        error = "HTTP port must be between 0 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.read_timeout_s < 1 || config.http.write_timeout_s < 1) {
        error = "HTTP read/write timeouts must be at least 1 second";
        return false;
    }

    // Validate Logging settings
    if (!is_known_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (!yaml.IsNull() && !yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
            if (http["read_timeout_s"]) {
                config.http.read_timeout_s = http["read_timeout_s"].as<int>();
            }
            if (http["write_timeout_s"]) {
                config.http.write_timeout_s = http["write_timeout_s"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = to_lower(yaml["logging"]["level"].as<std::string>());
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                 << config.http.thread_pool_size << " threads)";
        LOG_INFO(http_msg.str());
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool apply_environment(ServiceConfig &config, std::string &error) {
    const char *level_env = std::getenv(kLogLevelEnvVar);
    if (level_env == nullptr || *level_env == '\0') {
        return true;
    }

    std::string level = to_lower(level_env);
    if (!is_known_level(level)) {
        error = std::string("Invalid log level in ") + kLogLevelEnvVar + ": " + level_env;
        return false;
    }

    config.logging.level = level;
    return true;
}

}  // namespace runtime
}  // namespace timestamp
