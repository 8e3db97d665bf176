#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/lifecycle.h — Graceful shutdown, signal handling
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto app = http::createServer();
//    lifecycle::enableGracefulShutdown(app);
//    app.listen(8080);   // returns after SIGINT or SIGTERM
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <vector>

namespace dlproxy::lifecycle {

namespace detail {
    inline std::mutex& handlersMutex() {
        static std::mutex m;
        return m;
    }
    inline std::vector<std::function<void(int)>>& shutdownHandlers() {
        static std::vector<std::function<void(int)>> handlers;
        return handlers;
    }
    inline std::atomic<bool>& shuttingDown() {
        static std::atomic<bool> v{false};
        return v;
    }
    inline void signalHandler(int sig) {
        if (shuttingDown().exchange(true)) return; // Already shutting down
        console::info("Received signal", sig, "- shutting down");
        std::lock_guard<std::mutex> lock(handlersMutex());
        for (auto& handler : shutdownHandlers()) {
            handler(sig);
        }
    }
} // namespace detail

// ── Register a shutdown handler ──
inline void onShutdown(std::function<void(int)> handler) {
    std::lock_guard<std::mutex> lock(detail::handlersMutex());
    detail::shutdownHandlers().push_back(std::move(handler));
}

// ── Stop `server` on SIGINT and SIGTERM ──
//    listen() returns once every loop thread has stopped; relays
//    still in flight are cut off.
inline void enableGracefulShutdown(http::Server& server) {
    std::signal(SIGINT, detail::signalHandler);
    std::signal(SIGTERM, detail::signalHandler);

    onShutdown([&server](int) {
        console::info("Stopping HTTP server...");
        server.close();
    });
}

// ── Check if shutdown is in progress ──
inline bool isShuttingDown() {
    return detail::shuttingDown().load();
}

} // namespace dlproxy::lifecycle
