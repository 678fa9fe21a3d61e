#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>
#include "date/date_conversion.hpp"
#include "runtime/config.hpp"

namespace timestamp {
namespace http {

/**
 * @brief HTTP server exposing the date conversion routes
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - Handlers share no mutable state; each request is converted independently
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @brief Construct HTTP server
     *
     * @param config HTTP configuration (bind address, port, pool, timeouts)
     * @param clock Source of "now" for GET /api; system clock when empty
     */
    explicit HttpServer(const runtime::HttpConfig& config, date::Clock clock = nullptr);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     * Returns once the listen loop is accepting, so stop() may follow
     * immediately. A configured port of 0 binds an ephemeral port, see get_port().
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string& error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Get the port server is listening on (valid after start())
     */
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    date::Clock clock_;
    int port_ = 0;

    // Server state
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> listen_finished_{false};

    void setup_routes();

    // Route handlers (implemented in handlers/date_handlers.cpp)
    void handle_get_root(const httplib::Request& req, httplib::Response& res);
    void handle_get_now(const httplib::Request& req, httplib::Response& res);
    void handle_get_date(const httplib::Request& req, httplib::Response& res);
};

} // namespace http
} // namespace timestamp
