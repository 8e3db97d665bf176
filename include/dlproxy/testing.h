#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/testing.h — TestClient (supertest equivalent), mock factories
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    testing::TestClient client(app);
//    auto r = client.get("/").query("u", "https://a.example/f").exec();
//    EXPECT_EQ(r.status, 200);
//    EXPECT_EQ(r.header("cache-control"), "no-store");
//
//  Requests never touch a socket. Deferred work runs on the client's
//  own io_context before exec() returns, and streamed bodies are
//  drained into TestResult::body.
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "json_utils.h"
#include "url.h"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace dlproxy::testing {

// ── Create a mock Request; a query string in `target` is parsed ──
inline http::Request createRequest(
    const std::string& method = "GET",
    const std::string& target = "/",
    const std::string& body = "",
    const std::unordered_map<std::string, std::string>& headers = {}) {
    http::Request req;
    req.method = method;
    req.url = target;
    auto [path, queryString] = url::splitTarget(target);
    req.path = path;
    req.query = url::parseQuery(queryString);
    req.rawBody = body;
    req.ip = "127.0.0.1";
    req.protocol = "http";
    req.hostname = "localhost";
    // Lowercase all header keys
    for (auto& [k, v] : headers) {
        req.headers[http::toLower(k)] = v;
    }
    return req;
}

// ── Create a capture-mode Response ──
inline http::Response createResponse() {
    return http::Response([](int, const http::Fields&, const std::string&) {});
}

// ── Test Result ──
struct TestResult {
    int status = 0;
    std::string body;
    http::Fields headers;
    bool streamed = false;

    std::string header(const std::string& name) const {
        auto* value = http::findField(headers, name);
        return value ? *value : "";
    }

    bool hasHeader(const std::string& name) const {
        return http::findField(headers, name) != nullptr;
    }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// ═══════════════════════════════════════════
//  TestClient: supertest-style API
// ═══════════════════════════════════════════
class TestClient {
public:
    explicit TestClient(http::Server& app)
        : app_(app), ioc_(std::make_shared<boost::asio::io_context>(1)) {}

    // ── Fluent request builder ──
    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, std::shared_ptr<boost::asio::io_context> ioc,
                       const std::string& method, const std::string& path)
            : app_(app), ioc_(std::move(ioc)), method_(method), path_(path) {}

        RequestBuilder& set(const std::string& key, const std::string& value) {
            headers_[key] = value;
            return *this;
        }

        // Overrides any same-named key from the path's query string
        RequestBuilder& query(const std::string& key, const std::string& value) {
            query_[key] = value;
            return *this;
        }

        // ── Execute the request ──
        TestResult expect(int expectedStatus) {
            auto result = exec();
            if (result.status != expectedStatus) {
                throw std::runtime_error(
                    "Expected status " + std::to_string(expectedStatus) +
                    " but got " + std::to_string(result.status));
            }
            return result;
        }

        TestResult exec() {
            auto req = createRequest(method_, path_, "", headers_);
            for (auto& [key, value] : query_) {
                req.query[key] = value;
            }

            TestResult result;
            http::Response res([&result](int status,
                                         const http::Fields& headers,
                                         const std::string& body) {
                result.status = status;
                result.body = body;
                result.headers = headers;
            }, nullptr, ioc_->get_executor());

            app_.handleRequest(req, res);
            ioc_->restart();
            ioc_->run();
            if (!res.headersSent()) {
                result.status = res.getStatusCode();
                result.body = res.getBody();
                result.headers = res.getHeaders();
            }
            result.streamed = res.streamed();
            return result;
        }

    private:
        http::Server& app_;
        std::shared_ptr<boost::asio::io_context> ioc_;
        std::string method_;
        std::string path_;
        std::unordered_map<std::string, std::string> headers_;
        std::unordered_map<std::string, std::string> query_;
    };

    RequestBuilder get(const std::string& path) { return {app_, ioc_, "GET", path}; }
    RequestBuilder head(const std::string& path) { return {app_, ioc_, "HEAD", path}; }
    RequestBuilder post(const std::string& path) { return {app_, ioc_, "POST", path}; }

    // Loop that deferred handlers post to
    boost::asio::io_context& context() { return *ioc_; }

private:
    http::Server& app_;
    std::shared_ptr<boost::asio::io_context> ioc_;
};

} // namespace dlproxy::testing
