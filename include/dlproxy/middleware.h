#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/middleware.h — Express-style middleware
// ═══════════════════════════════════════════════════════════════════
//
//  Included middleware:
//    • requestLogger()    Request logging (like Morgan)
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include <chrono>
#include <string>

namespace dlproxy::middleware {

// ═══════════════════════════════════════════
//  requestLogger — Morgan-style request logging
// ═══════════════════════════════════════════
//  The line is written when the response finishes, so
//  deferred responses and streamed relays are timed
//  to their end.
//
inline http::MiddlewareFunction requestLogger() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        auto start = std::chrono::steady_clock::now();
        console::debug(req.method, req.path, "from", req.ip);

        res.onFinish([&res, method = req.method, path = req.path, ip = req.ip, start] {
            auto elapsed = std::chrono::steady_clock::now() - start;
            auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;

            int status = res.getStatusCode();
            std::string statusStr = std::to_string(status);
            std::string timing = std::to_string(ms) + "ms";

            if (status >= 400) {
                console::error(method, path, statusStr, timing, "from", ip);
            } else {
                console::success(method, path, statusStr, timing,
                                 res.streamed() ? "(streamed)" : "", "from", ip);
            }
        });

        next();
    };
}

} // namespace dlproxy::middleware
