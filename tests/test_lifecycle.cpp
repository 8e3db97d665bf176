// ═══════════════════════════════════════════════════════════════════
//  test_lifecycle.cpp — Tests for signal-driven shutdown
// ═══════════════════════════════════════════════════════════════════
//
//  Signal handlers are process-wide, so this file holds a single test.
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "dlproxy/lifecycle.h"

#include <csignal>
#include <future>
#include <thread>

using namespace dlproxy;

TEST(LifecycleTest, SigtermStopsListeningServer) {
    console::setLevel(console::Level::Silent);

    auto app = http::createServer({.threads = 2});
    app.get("/ok", [](auto&, auto& res) { res.send("ok"); });

    int shutdownSignal = 0;
    lifecycle::onShutdown([&shutdownSignal](int sig) { shutdownSignal = sig; });
    lifecycle::enableGracefulShutdown(app);
    EXPECT_FALSE(lifecycle::isShuttingDown());

    std::promise<void> ready;
    auto listening = ready.get_future();
    std::thread server([&] {
        app.listen("127.0.0.1", 0, [&ready] { ready.set_value(); });
    });
    listening.wait();
    EXPECT_TRUE(app.listening());
    EXPECT_GT(app.port(), 0);

    std::raise(SIGTERM);
    server.join();

    EXPECT_TRUE(lifecycle::isShuttingDown());
    EXPECT_EQ(shutdownSignal, SIGTERM);
    EXPECT_FALSE(app.listening());

    // A second signal is ignored once shutdown has begun
    shutdownSignal = 0;
    std::raise(SIGINT);
    EXPECT_EQ(shutdownSignal, 0);

    console::setLevel(console::Level::Info);
}
