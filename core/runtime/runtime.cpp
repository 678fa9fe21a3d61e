#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace timestamp {
namespace runtime {

namespace {
constexpr auto kLoopInterval = std::chrono::milliseconds(100);
}  // namespace

Runtime::Runtime(const ServiceConfig &config, date::Clock clock) : config_(config), clock_(std::move(clock)) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing timestamp service");
    SignalHandler::reset();

    http_server_ = std::make_unique<http::HttpServer>(config_.http, clock_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        http_server_.reset();
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Press Ctrl+C to exit");
    running_ = true;

    while (running_) {
        std::this_thread::sleep_for(kLoopInterval);

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    shutdown();
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Shutting down");
        http_server_->stop();
        http_server_.reset();
    }
}

}  // namespace runtime
}  // namespace timestamp
