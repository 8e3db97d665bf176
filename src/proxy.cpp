// ═══════════════════════════════════════════════════════════════════
//  src/proxy.cpp — Download proxy handler
// ═══════════════════════════════════════════════════════════════════

#include "dlproxy/proxy.h"
#include "dlproxy/console.h"
#include "dlproxy/encoding.h"
#include "dlproxy/url.h"

#include <array>

namespace dlproxy::proxy {

namespace detail {

inline void reject(http::Response& res, int status, const std::string& message) {
    res.status(status)
       .type("text/plain; charset=utf-8")
       .send(message);
}

inline void relay(http::Response& res, fetch::StreamResponse upstreamRes,
                  const std::string& url, const std::string& filename) {
    if (upstreamRes.status == 0) {
        console::warn("Upstream unreachable:", upstreamRes.statusText);
        reject(res, 502, "Upstream error: " + upstreamRes.statusText);
        return;
    }
    if (!upstreamRes.ok() || !upstreamRes.hasBody()) {
        console::warn("Upstream answered", upstreamRes.status);
        upstreamRes.body.close();
        reject(res, 502, "Upstream error: " + std::to_string(upstreamRes.status));
        return;
    }

    // ── Rewrite headers ──
    for (auto& [key, value] : upstreamRes.headers) {
        if (!isHopByHop(key)) res.append(key, value);
    }
    res.set("Content-Disposition", encoding::attachment(filename));
    res.set("Cache-Control", "no-store");

    // ── Relay ──
    auto body = std::make_shared<fetch::Body>(std::move(upstreamRes.body));
    res.status(upstreamRes.status).pipe(body, [body, url](boost::system::error_code ec) {
        if (ec) {
            console::debug("Relay of", url, "stopped after", body->bytesRead(),
                           "bytes:", ec.message());
        }
        body->close();
    });
}

} // namespace detail

bool isHopByHop(std::string_view name) {
    static constexpr std::array<std::string_view, 9> fields = {
        "Connection", "Keep-Alive", "Transfer-Encoding", "TE", "Trailer",
        "Upgrade", "Proxy-Authenticate", "Proxy-Authorization", "Proxy-Connection",
    };
    for (auto field : fields) {
        if (http::iequals(field, name)) return true;
    }
    return false;
}

void handle(const http::Request& req, http::Response& res, const Options& opts) {
    // ── Validate input ──
    auto upstream = req.queryParam("u");
    if (!upstream || upstream->empty()) {
        detail::reject(res, 400, "Missing query param: u");
        return;
    }

    auto target = url::parse(*upstream);
    if (!target) {
        detail::reject(res, 400, "Invalid upstream URL");
        return;
    }
    if (!target->isHttp()) {
        detail::reject(res, 400, "Upstream must be http/https");
        return;
    }

    auto name = req.queryParam("name");
    std::string filename = (name && !name->empty()) ? *name : opts.defaultName;

    // ── Fetch ──
    auto request = opts.upstream;
    request.url = target->href();
    console::debug("Fetching", request.url);

    auto onUpstream = [&res, anchor = res.defer(), url = request.url, filename](
                          fetch::StreamResponse upstreamRes) {
        detail::relay(res, std::move(upstreamRes), url, filename);
    };
    if (opts.fetcher) {
        opts.fetcher(request, res.executor(), std::move(onUpstream));
    } else {
        fetch::asyncStream(request, res.executor(), std::move(onUpstream));
    }
}

http::RouteHandler createHandler(Options opts) {
    return [opts = std::move(opts)](http::Request& req, http::Response& res) {
        handle(req, res, opts);
    };
}

std::string buildLink(std::string_view base, std::string_view upstream,
                      std::string_view name) {
    std::string link(base);
    link += "?u=" + encoding::encodeURIComponent(upstream);
    if (!name.empty()) {
        link += "&name=" + encoding::encodeURIComponent(name);
    }
    return link;
}

} // namespace dlproxy::proxy
