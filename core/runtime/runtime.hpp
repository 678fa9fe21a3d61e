#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "date/date_conversion.hpp"
#include "http/server.hpp"

namespace timestamp {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const ServiceConfig &config, date::Clock clock = nullptr);
    ~Runtime();

    // Starts the HTTP server
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stops the HTTP server
    void shutdown();

    int http_port() const { return http_server_ ? http_server_->get_port() : 0; }

private:
    ServiceConfig config_;
    date::Clock clock_;
    std::unique_ptr<http::HttpServer> http_server_;
    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace timestamp
