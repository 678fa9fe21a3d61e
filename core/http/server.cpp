#include "server.hpp"

#include <chrono>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace timestamp {
namespace http {

namespace {
constexpr int kNoMilliseconds = 0;
constexpr auto kReadyPollInterval = std::chrono::milliseconds(1);
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, date::Clock clock)
    : config_(config), clock_(std::move(clock)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(config_.read_timeout_s, kNoMilliseconds);
    server_->set_write_timeout(config_.write_timeout_s, kNoMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    setup_routes();

    // Request trace: one line per request/response pair
    server_->set_logger([](const httplib::Request &req, const httplib::Response &res) {
        LOG_DEBUG("[HTTP] " << req.method << " " << req.path << " -> " << res.status << " (" << res.body.size()
                            << " bytes)");
    });

    // Unmatched routes keep httplib's empty-bodied 404; handlers set their own bodies
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (res.status == status_code_to_http(StatusCode::NOT_FOUND) && res.body.empty()) {
            LOG_DEBUG("[HTTP] Route not found: " << req.method << " " << req.path);
        }
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception on " << req.path << ": " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception on " << req.path);
        }

        res.status = status_code_to_http(StatusCode::INTERNAL);
        res.set_content(make_error_response(msg).dump(), "application/json");
    });

    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind);
        if (port_ < 0) {
            error = "Failed to bind to " + config_.bind + " (ephemeral port)";
            server_.reset();
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind, config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            server_.reset();
            return false;
        }
        port_ = config_.port;
    }

    listen_finished_.store(false);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Server thread started");
        server_->listen_after_bind();
        listen_finished_.store(true);
        LOG_DEBUG("[HTTP] Server thread exiting");
    });

    // httplib::Server::stop() is a no-op until the listen loop is entered
    while (!server_->is_running() && !listen_finished_.load()) {
        std::this_thread::sleep_for(kReadyPollInterval);
    }

    if (listen_finished_.load()) {
        server_thread_->join();
        server_thread_.reset();
        server_.reset();
        error = "Listen loop exited on " + config_.bind + ":" + std::to_string(port_);
        return false;
    }

    running_.store(true);

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // GET / - Greeting page
    server_->Get("/", [this](const httplib::Request &req, httplib::Response &res) { handle_get_root(req, res); });

    // GET /api - Current time
    server_->Get("/api", [this](const httplib::Request &req, httplib::Response &res) { handle_get_now(req, res); });

    // GET /api/:date - Date or Unix timestamp conversion
    server_->Get(R"(/api/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_date(req, res); });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET  /");
    LOG_INFO("[HTTP]   GET  /api");
    LOG_INFO("[HTTP]   GET  /api/{date}");
}

}  // namespace http
}  // namespace timestamp
