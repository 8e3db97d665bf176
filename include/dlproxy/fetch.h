#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/fetch.h — Streaming HTTP(S) client (fetch equivalent)
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    fetch::asyncStream({.url = "https://files.example/t/8f3a"}, res.executor(),
//        [&res, anchor = res.defer()](fetch::StreamResponse up) {
//            auto body = std::make_shared<fetch::Body>(std::move(up.body));
//            res.status(up.status).pipe(body);     // relay without buffering
//        });
//
//    auto resp  = fetch::stream({.url = url});        // blocking, same result
//    auto small = fetch::get("http://127.0.0.1:9000/ping");   // buffered
//    small.body == "pong";
//
//  Redirects are followed up to maxRedirects hops. Network failures
//  never throw: the response comes back with status 0 and the error
//  message in statusText.
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace dlproxy::fetch {

// ── Request options ──
struct RequestOptions {
    std::string url;
    std::unordered_map<std::string, std::string> headers;
    int connectTimeoutMs = 15000;       // Resolve + connect + TLS handshake
    int idleTimeoutMs = 60000;          // Per read; 0 disables
    int maxRedirects = 10;
    std::uint64_t maxBodyBytes = 0;     // 0 = unlimited
    std::uint32_t maxHeaderBytes = 64 * 1024;   // Status line plus fields
    std::string userAgent = "dlproxy/1.0";
    bool verifyTls = true;
    std::string caFile;                 // Extra CA bundle (PEM)
};

struct StreamResponse;
StreamResponse stream(const RequestOptions& opts);

// ═══════════════════════════════════════════════════════════════════
//  class Body
//  The upstream body as an incremental stream. Shares its source (the
//  upstream connection for fetched responses); closing the Body, or
//  dropping the last reference, releases it.
// ═══════════════════════════════════════════════════════════════════
class Body : public http::BodySource {
public:
    Body();
    explicit Body(std::shared_ptr<http::BodySource> source);
    ~Body() override;
    Body(Body&&) noexcept;
    Body& operator=(Body&&) noexcept;

    Body(const Body&) = delete;
    Body& operator=(const Body&) = delete;

    void asyncRead(char* buf, std::size_t size, ReadHandler handler) override;
    bool done() const override;

    // Drop the upstream connection now
    void close() override;

    // ── Blocking read, for bodies returned by stream() ──
    std::size_t read(char* buf, std::size_t size, boost::system::error_code& ec);

    // Bytes delivered so far
    std::uint64_t bytesRead() const { return bytesRead_; }

private:
    friend StreamResponse stream(const RequestOptions& opts);

    // Loop that drives the source for read(); must outlive it
    std::shared_ptr<boost::asio::io_context> ioc_;
    std::shared_ptr<http::BodySource> source_;
    std::uint64_t bytesRead_ = 0;
};

// ── Streamed response ──
struct StreamResponse {
    int status = 0;                 // 0 when the request never got a response
    std::string statusText;         // Reason phrase, or the failure message
    http::Fields headers;           // Upstream header fields, in order
    std::string url;                // Final URL after redirects
    int redirects = 0;
    Body body;

    bool ok() const { return status >= 200 && status < 300; }

    // Statuses whose responses never carry a body
    bool hasBody() const {
        return status != 0 && status != 101 && status != 103 &&
               status != 204 && status != 205 && status != 304;
    }

    std::string header(const std::string& name) const {
        auto* value = http::findField(headers, name);
        return value ? *value : "";
    }
};

// ── Buffered response ──
struct FetchResponse {
    int status = 0;
    std::string statusText;
    http::Fields headers;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }

    std::string header(const std::string& name) const {
        auto* value = http::findField(headers, name);
        return value ? *value : "";
    }
};

using StreamHandler = std::function<void(StreamResponse)>;

// ── Issue a GET; `handler` runs on `executor` with the final response head ──
//    The body is read through the same executor.
void asyncStream(const RequestOptions& opts, boost::asio::any_io_executor executor,
                 StreamHandler handler);

// ── Blocking asyncStream on a private event loop ──
StreamResponse stream(const RequestOptions& opts);

// ── Issue a GET and read the whole body ──
FetchResponse request(const RequestOptions& opts);

inline FetchResponse get(const std::string& url,
                         const std::unordered_map<std::string, std::string>& headers = {}) {
    return request({.url = url, .headers = headers});
}

} // namespace dlproxy::fetch
