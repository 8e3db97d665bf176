// ═══════════════════════════════════════════════════════════════════
//  test_http.cpp — Unit tests for HTTP Request, Response, and routing
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "dlproxy/http.h"
#include "dlproxy/middleware.h"
#include "dlproxy/testing.h"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <stdexcept>

using namespace dlproxy;
using namespace dlproxy::http;

namespace {

// A source that fails after handing out `good` bytes
class BrokenSource : public BodySource {
public:
    explicit BrokenSource(std::size_t good) : good_(good) {}

    void asyncRead(char* buf, std::size_t size, ReadHandler handler) override {
        if (served_ >= good_) {
            handler(boost::asio::error::connection_reset, 0);
            return;
        }
        auto n = std::min(size, good_ - served_);
        std::fill_n(buf, n, 'x');
        served_ += n;
        handler({}, n);
    }

    bool done() const override { return false; }

private:
    std::size_t good_;
    std::size_t served_ = 0;
};

} // namespace

// ═══════════════════════════════════════════
//  Request Tests
// ═══════════════════════════════════════════

TEST(RequestTest, HeaderLookupCaseInsensitive) {
    Request req;
    req.headers["content-type"] = "application/json";
    req.headers["x-custom-header"] = "test-value";

    EXPECT_EQ(req.header("Content-Type"), "application/json");
    EXPECT_EQ(req.header("content-type"), "application/json");
    EXPECT_EQ(req.get("X-Custom-Header"), "test-value");
    EXPECT_EQ(req.header("nonexistent"), "");
}

TEST(RequestTest, QueryParamDistinguishesMissingFromEmpty) {
    Request req;
    req.query["name"] = "";

    EXPECT_FALSE(req.queryParam("u").has_value());
    ASSERT_TRUE(req.queryParam("name").has_value());
    EXPECT_EQ(*req.queryParam("name"), "");
}

TEST(RequestTest, MockRequestParsesTarget) {
    auto req = dlproxy::testing::createRequest("GET", "/dl?u=https%3A%2F%2Fa.example%2Ff&name=x+y");
    EXPECT_EQ(req.path, "/dl");
    EXPECT_EQ(req.url, "/dl?u=https%3A%2F%2Fa.example%2Ff&name=x+y");
    EXPECT_EQ(*req.queryParam("u"), "https://a.example/f");
    EXPECT_EQ(*req.queryParam("name"), "x y");
}

// ═══════════════════════════════════════════
//  Response Tests
// ═══════════════════════════════════════════

TEST(ResponseTest, DefaultStatus200) {
    int sentStatus = 0;
    Response res([&](int s, const auto&, const auto&) { sentStatus = s; });

    res.send("OK");
    EXPECT_EQ(sentStatus, 200);
}

TEST(ResponseTest, StatusChaining) {
    int sentStatus = 0;
    Response res([&](int s, const auto&, const auto&) { sentStatus = s; });

    res.status(404).send("Not Found");
    EXPECT_EQ(sentStatus, 404);
}

TEST(ResponseTest, HeaderChaining) {
    Fields sentHeaders;
    Response res([&](int, const Fields& h, const auto&) { sentHeaders = h; });

    res.set("X-Custom", "value1")
       .header("X-Another", "value2")
       .send("test");

    EXPECT_EQ(*findField(sentHeaders, "X-Custom"), "value1");
    EXPECT_EQ(*findField(sentHeaders, "x-another"), "value2");
}

TEST(ResponseTest, SetReplacesCaseInsensitively) {
    Response res;
    res.append("content-disposition", "inline; filename=token")
       .append("Cache-Control", "max-age=3600")
       .append("cache-control", "public");

    res.set("Content-Disposition", "attachment")
       .set("Cache-Control", "no-store");

    int dispositions = 0, cacheControls = 0;
    for (auto& [key, value] : res.getHeaders()) {
        if (iequals(key, "Content-Disposition")) ++dispositions;
        if (iequals(key, "Cache-Control")) ++cacheControls;
    }
    EXPECT_EQ(dispositions, 1);
    EXPECT_EQ(cacheControls, 1);
    EXPECT_EQ(res.getHeader("content-disposition"), "attachment");
    EXPECT_EQ(res.getHeader("CACHE-CONTROL"), "no-store");
}

TEST(ResponseTest, AppendKeepsDuplicates) {
    Response res;
    res.append("Set-Cookie", "a=1").append("Set-Cookie", "b=2");
    EXPECT_EQ(res.getHeaders().size(), 2u);
}

TEST(ResponseTest, SendDefaultsToPlainText) {
    Response res;
    res.send("hello");
    EXPECT_EQ(res.getHeader("Content-Type"), "text/plain; charset=utf-8");
    EXPECT_EQ(res.getBody(), "hello");
}

TEST(ResponseTest, SendKeepsExplicitContentType) {
    Response res;
    res.type("text/csv").send("a,b");
    EXPECT_EQ(res.getHeader("Content-Type"), "text/csv");
}

TEST(ResponseTest, SendOnlyOnce) {
    int callCount = 0;
    Response res([&](int, const auto&, const auto&) { callCount++; });

    res.send("first");
    res.send("second"); // Should be ignored

    EXPECT_EQ(callCount, 1);
    EXPECT_TRUE(res.headersSent());
}

TEST(ResponseTest, JsonSetsContentType) {
    Response res;
    res.status(500).json({{"error", "Internal Server Error"}});
    EXPECT_EQ(res.getHeader("Content-Type"), "application/json; charset=utf-8");
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["error"], "Internal Server Error");
}

TEST(ResponseTest, SendStatusShorthand) {
    int sentStatus = 0;
    std::string sentBody;
    Response res([&](int s, const auto&, const std::string& b) {
        sentStatus = s;
        sentBody = b;
    });

    res.sendStatus(204);
    EXPECT_EQ(sentStatus, 204);
    EXPECT_EQ(sentBody, "204");
}

// ═══════════════════════════════════════════
//  Streamed Response Tests
// ═══════════════════════════════════════════

TEST(StreamTest, StringSourceHandsOutChunks) {
    StringSource source("abcdefghij", 4);
    char buf[16];
    std::vector<std::size_t> reads;
    auto record = [&](boost::system::error_code ec, std::size_t n) {
        EXPECT_FALSE(ec);
        reads.push_back(n);
    };

    EXPECT_FALSE(source.done());
    source.asyncRead(buf, sizeof(buf), record);
    source.asyncRead(buf, 2, record);
    source.asyncRead(buf, sizeof(buf), record);
    EXPECT_TRUE(source.done());
    source.asyncRead(buf, sizeof(buf), record);

    EXPECT_EQ(reads, (std::vector<std::size_t>{4, 2, 4, 0}));
}

TEST(StreamTest, PipeUsesStreamCallback) {
    int sentStatus = 0;
    std::string relayed;
    bool bufferedCalled = false;
    bool finished = false;

    Response res(
        [&](int, const Fields&, const std::string&) { bufferedCalled = true; },
        [&](int s, const Fields&, std::shared_ptr<BodySource> body,
            Response::RelayCallback done) {
            sentStatus = s;
            char buf[3];
            while (!body->done()) {
                body->asyncRead(buf, sizeof(buf), [&](boost::system::error_code, std::size_t n) {
                    relayed.append(buf, n);
                });
            }
            done({});
        });
    res.onFinish([&] { finished = true; });

    res.status(206).pipe(std::make_shared<StringSource>("streamed payload", 5));

    EXPECT_FALSE(bufferedCalled);
    EXPECT_EQ(sentStatus, 206);
    EXPECT_EQ(relayed, "streamed payload");
    EXPECT_TRUE(res.headersSent());
    EXPECT_TRUE(res.streamed());
    EXPECT_TRUE(finished);
}

TEST(StreamTest, PipeWithoutTransportCapturesBody) {
    std::string sentBody;
    Response res([&](int, const Fields&, const std::string& b) { sentBody = b; });

    std::string payload(100000, 'z');
    res.pipe(std::make_shared<StringSource>(payload, 1000));

    EXPECT_EQ(sentBody, payload);
    EXPECT_EQ(res.getBody().size(), payload.size());
}

TEST(StreamTest, PipeDoesNotAddContentType) {
    Response res;
    res.pipe(std::make_shared<StringSource>("bin"));
    EXPECT_FALSE(res.hasHeader("Content-Type"));
}

TEST(StreamTest, PipeStopsOnSourceError) {
    Response res;
    boost::system::error_code relayError;
    res.pipe(std::make_shared<BrokenSource>(10),
             [&](boost::system::error_code ec) { relayError = ec; });
    EXPECT_EQ(res.getBody(), std::string(10, 'x'));
    EXPECT_EQ(relayError, boost::asio::error::connection_reset);
}

TEST(StreamTest, PipeAfterSendIsIgnored) {
    Response res;
    res.send("first");
    res.pipe(std::make_shared<StringSource>("second"));
    EXPECT_EQ(res.getBody(), "first");
    EXPECT_FALSE(res.streamed());
}

// ═══════════════════════════════════════════
//  Deferred Response Tests
// ═══════════════════════════════════════════

TEST(DeferTest, DeferWithoutOwnerReturnsEmptyAnchor) {
    Response res;
    EXPECT_FALSE(res.deferred());
    EXPECT_EQ(res.defer(), nullptr);
    EXPECT_TRUE(res.deferred());
    EXPECT_FALSE(res.headersSent());
}

TEST(DeferTest, AnchorKeepsOwnerAlive) {
    auto owner = std::make_shared<int>(7);
    Response res([](int, const Fields&, const std::string&) {}, nullptr, {}, owner);

    auto anchor = res.defer();
    std::weak_ptr<int> watch = owner;
    owner.reset();
    EXPECT_FALSE(watch.expired());
    anchor.reset();
    EXPECT_TRUE(watch.expired());
}

TEST(DeferTest, OnFinishRunsAfterSend) {
    Response res;
    int calls = 0;
    res.onFinish([&] { ++calls; });
    EXPECT_EQ(calls, 0);
    res.send("x");
    res.send("y");
    EXPECT_EQ(calls, 1);
}

// ═══════════════════════════════════════════
//  Middleware Tests
// ═══════════════════════════════════════════

TEST(MiddlewareTest, RequestLoggerCallsNext) {
    console::setLevel(console::Level::Silent);

    Request req;
    req.method = "GET";
    req.path = "/";
    Response res;

    bool nextCalled = false;
    auto logger = middleware::requestLogger();
    logger(req, res, [&]() {
        nextCalled = true;
        res.status(204).end();
    });

    EXPECT_TRUE(nextCalled);
    EXPECT_EQ(res.getStatusCode(), 204);
    console::setLevel(console::Level::Info);
}

TEST(MiddlewareTest, RequestLoggerWaitsForDeferredResponse) {
    console::setLevel(console::Level::Info);
    console::setColors(false);

    auto app = createServer();
    app.use(middleware::requestLogger());
    app.get("/late", [](auto&, auto& res) {
        boost::asio::post(res.executor(), [&res, anchor = res.defer()] {
            res.status(201).send("late");
        });
    });

    dlproxy::testing::TestClient client(app);
    ::testing::internal::CaptureStdout();
    auto result = client.get("/late").exec();
    auto output = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(result.status, 201);
    EXPECT_NE(output.find("GET /late 201"), std::string::npos);
    console::setColors(true);
}

// ═══════════════════════════════════════════
//  Server Routing Tests (using handleRequest)
// ═══════════════════════════════════════════

TEST(ServerTest, BasicRouting) {
    auto app = createServer();

    app.get("/hello", [](auto& req, auto& res) {
        res.json({{"message", "Hello, World!"}});
    });

    Request req;
    req.method = "GET";
    req.path = "/hello";

    std::string sentBody;
    Response res([&](int, const auto&, const std::string& b) { sentBody = b; });

    app.handleRequest(req, res);

    auto parsed = nlohmann::json::parse(sentBody);
    EXPECT_EQ(parsed["message"], "Hello, World!");
}

TEST(ServerTest, RouteParameters) {
    auto app = createServer();

    app.get("/files/:token", [](auto& req, auto& res) {
        res.json({{"token", req.params["token"]}});
    });

    Request req;
    req.method = "GET";
    req.path = "/files/8f3a";

    std::string sentBody;
    Response res([&](int, const auto&, const std::string& b) { sentBody = b; });

    app.handleRequest(req, res);

    EXPECT_EQ(nlohmann::json::parse(sentBody)["token"], "8f3a");
}

TEST(ServerTest, GetOnlyMatchesGet) {
    auto app = createServer();
    app.get("/data", [](auto&, auto& res) { res.send("get"); });

    dlproxy::testing::TestClient client(app);
    EXPECT_EQ(client.get("/data").exec().body, "get");
    EXPECT_EQ(client.post("/data").exec().status, 404);
}

TEST(ServerTest, AllMatchesAnyMethodAndPath) {
    auto app = createServer();
    app.all("*", [](auto& req, auto& res) { res.send(req.method + " " + req.path); });

    dlproxy::testing::TestClient client(app);
    EXPECT_EQ(client.get("/").exec().body, "GET /");
    EXPECT_EQ(client.post("/deep/path").exec().body, "POST /deep/path");
    EXPECT_EQ(client.head("/x").exec().body, "HEAD /x");
}

TEST(ServerTest, Returns404ForUnknownRoute) {
    auto app = createServer();

    Request req;
    req.method = "GET";
    req.path = "/nonexistent";

    int sentStatus = 0;
    Response res([&](int s, const auto&, const auto&) { sentStatus = s; });

    app.handleRequest(req, res);
    EXPECT_EQ(sentStatus, 404);
}

TEST(ServerTest, HandlerExceptionBecomes500) {
    console::setLevel(console::Level::Silent);
    auto app = createServer();
    app.get("/boom", [](auto&, auto&) -> void { throw std::runtime_error("kaput"); });

    dlproxy::testing::TestClient client(app);
    auto result = client.get("/boom").exec();

    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.json()["message"], "kaput");
    console::setLevel(console::Level::Info);
}

TEST(ServerTest, MiddlewareExecutionOrder) {
    auto app = createServer();
    std::vector<int> order;

    app.use([&](auto& req, auto& res, auto next) {
        order.push_back(1);
        next();
    });

    app.use([&](auto& req, auto& res, auto next) {
        order.push_back(2);
        next();
    });

    app.get("/test", [&](auto& req, auto& res) {
        order.push_back(3);
        res.send("done");
    });

    Request req;
    req.method = "GET";
    req.path = "/test";
    std::string sentBody;
    Response res([&](int, const auto&, const std::string& b) { sentBody = b; });

    app.handleRequest(req, res);

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(order[2], 3);
}

TEST(ServerTest, MiddlewareCanShortCircuit) {
    auto app = createServer();

    app.use([](auto& req, auto& res, auto next) {
        res.status(401).json({{"error", "Unauthorized"}});
        // Do NOT call next()
    });

    bool reached = false;
    app.get("/protected", [&](auto& req, auto& res) {
        reached = true;
        res.send("secret");
    });

    dlproxy::testing::TestClient client(app);
    auto result = client.get("/protected").exec();

    EXPECT_EQ(result.status, 401);
    EXPECT_FALSE(reached);
}

TEST(ServerTest, TestClientCapturesStreamedBody) {
    auto app = createServer();
    app.get("/stream", [](auto&, auto& res) {
        res.set("Content-Type", "application/octet-stream")
           .pipe(std::make_shared<StringSource>("chunked body", 3));
    });

    dlproxy::testing::TestClient client(app);
    auto result = client.get("/stream").expect(200);

    EXPECT_TRUE(result.streamed);
    EXPECT_EQ(result.body, "chunked body");
    EXPECT_EQ(result.header("content-type"), "application/octet-stream");
}

TEST(ServerTest, TestClientRunsDeferredHandlers) {
    auto app = createServer();
    app.get("/deferred", [](auto&, auto& res) {
        boost::asio::post(res.executor(), [&res, anchor = res.defer()] {
            res.status(202).send("accepted later");
        });
    });

    dlproxy::testing::TestClient client(app);
    auto result = client.get("/deferred").exec();

    EXPECT_EQ(result.status, 202);
    EXPECT_EQ(result.body, "accepted later");
}

TEST(ServerTest, ExpectThrowsOnStatusMismatch) {
    auto app = createServer();
    dlproxy::testing::TestClient client(app);
    EXPECT_THROW(client.get("/missing").expect(200), std::runtime_error);
}
