#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/proxy.h — Download proxy handler and link builder
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto app = http::createServer();
//    app.all("*", proxy::createHandler({.defaultName = "download"}));
//
//    // GET /?u=https%3A%2F%2Ffiles.example%2Ft%2F8f3a&name=report.pdf
//    //   -> upstream status, upstream headers,
//    //      Content-Disposition: attachment; filename*=UTF-8''report.pdf
//    //      Cache-Control: no-store
//    //      body relayed as it arrives
//
//    proxy::buildLink("https://dl.example/", upstreamUrl, "report.pdf");
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "fetch.h"
#include <functional>
#include <string>
#include <string_view>

namespace dlproxy::proxy {

// Performs the upstream GET on the given executor; swapped out in tests
using Fetcher = std::function<void(const fetch::RequestOptions&,
                                   boost::asio::any_io_executor,
                                   fetch::StreamHandler)>;

struct Options {
    std::string defaultName = "download";   // Used when `name` is missing or empty
    fetch::RequestOptions upstream;         // Timeouts, caps, TLS; url is set per request
    Fetcher fetcher;                        // Empty means fetch::asyncStream
};

// ── Header fields that describe a single connection ──
bool isHopByHop(std::string_view name);

// ── Validate, fetch, rewrite headers, relay the body ──
//    Rejections are sent at once; otherwise the response is deferred
//    until the upstream head arrives.
void handle(const http::Request& req, http::Response& res, const Options& opts);

// ── Route handler bound to `opts` ──
http::RouteHandler createHandler(Options opts);

// ── <base>?u=<upstream>&name=<name>, both encodeURIComponent-encoded ──
//    `&name=` is left out when name is empty.
std::string buildLink(std::string_view base, std::string_view upstream,
                      std::string_view name = {});

} // namespace dlproxy::proxy
