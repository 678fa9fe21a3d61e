// Timestamp Service
// Date/time conversion over HTTP

#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path; // Optional

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: timestamp-service [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to YAML config file (optional)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  " << timestamp::runtime::kLogLevelEnvVar << "    Log level (debug, info, warn, error)\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    timestamp::runtime::ServiceConfig config;
    std::string error;

    if (!timestamp::runtime::apply_environment(config, error))
    {
        // Logger is not configured yet
        std::cerr << "ERROR: " << error << "\n";
        return 1;
    }
    timestamp::logging::Logger::set_level(timestamp::logging::string_to_level(config.logging.level));

    if (!config_path.empty())
    {
        LOG_INFO("Loading config: " << config_path);
        if (!timestamp::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }

        // Environment takes precedence over the file
        if (!timestamp::runtime::apply_environment(config, error))
        {
            LOG_ERROR(error);
            return 1;
        }
        timestamp::logging::Logger::set_level(timestamp::logging::string_to_level(config.logging.level));
    }

    LOG_INFO("Timestamp service starting...");

    timestamp::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    // Install signal handler for graceful shutdown
    timestamp::runtime::SignalHandler::install();

    LOG_INFO("Service Ready");
    LOG_INFO("  Listening: " << config.http.bind << ":" << runtime.http_port());
    LOG_INFO("  Log level: " << config.logging.level);

    // Run main loop (blocking)
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
