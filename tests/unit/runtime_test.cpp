#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <csignal>
#include <future>
#include <nlohmann/json.hpp>

using namespace timestamp::runtime;

#if !defined(__SANITIZE_THREAD__)

TEST(RuntimeTest, ServesCurrentTimeFromSystemClock) {
    ServiceConfig config;
    config.http.port = 0;
    config.http.thread_pool_size = 1;

    Runtime runtime(config);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;
    ASSERT_GT(runtime.http_port(), 0);

    const auto before =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

    httplib::Client client("127.0.0.1", runtime.http_port());
    auto res = client.Get("/api");

    const auto after =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);
    auto json = nlohmann::json::parse(res->body);
    EXPECT_GE(json["unix"].get<int64_t>(), before);
    EXPECT_LE(json["unix"].get<int64_t>(), after);
    EXPECT_TRUE(json["utc"].is_string());

    runtime.shutdown();
    EXPECT_EQ(0, runtime.http_port());
}

TEST(RuntimeTest, InitializeFailsOnUnusableBindAddress) {
    ServiceConfig config;
    config.http.bind = "192.0.2.1";  // TEST-NET-1, not assigned locally
    config.http.port = 0;

    Runtime runtime(config);
    std::string error;
    EXPECT_FALSE(runtime.initialize(error));
    EXPECT_NE(error.find("HTTP server failed to start"), std::string::npos) << error;
    EXPECT_EQ(0, runtime.http_port());
}

TEST(RuntimeTest, TerminationSignalEndsRunLoop) {
    ServiceConfig config;
    config.http.port = 0;
    config.http.thread_pool_size = 1;

    Runtime runtime(config);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;
    EXPECT_FALSE(SignalHandler::is_shutdown_requested());

    SignalHandler::install();
    auto loop = std::async(std::launch::async, [&runtime] { runtime.run(); });

    ASSERT_EQ(0, std::raise(SIGTERM));
    EXPECT_TRUE(SignalHandler::is_shutdown_requested());
    ASSERT_EQ(std::future_status::ready, loop.wait_for(std::chrono::seconds(5)));
    EXPECT_EQ(0, runtime.http_port());

    SignalHandler::reset();
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGINT, SIG_DFL);
}

#endif
