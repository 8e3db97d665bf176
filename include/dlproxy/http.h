#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/http.h — Express-style HTTP Server, Request, and Response
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto app = http::createServer({.threads = 4});
//    app.all("*", [](auto& req, auto& res) {
//        res.status(400).send("nope");
//    });
//    app.listen("0.0.0.0", 8080, []{ console::info("ready"); });
//
//  Responses carry either a buffered body (send) or a streamed body
//  (pipe). A streamed body is pulled from a BodySource through a
//  fixed-size buffer and never held in memory as a whole.
//
//  Handlers run on the event loop and must not block. A handler that
//  waits on I/O calls res.defer(), starts its work on res.executor(),
//  and sends from the completion:
//
//    app.get("/later", [](auto& req, auto& res) {
//        net::post(res.executor(), [&res, anchor = res.defer()] {
//            res.send("done");
//        });
//    });
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dlproxy::http {

// ── Forward declarations ──
class Request;
class Response;
class Server;

// ── Type aliases ──
using NextFunction       = std::function<void()>;
using MiddlewareFunction = std::function<void(Request&, Response&, NextFunction)>;
using RouteHandler       = std::function<void(Request&, Response&)>;

// Ordered header list; names keep their original case and may repeat.
using Fields = std::vector<std::pair<std::string, std::string>>;

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ── Case-insensitive lookup of the first field named `name` ──
inline const std::string* findField(const Fields& fields, std::string_view name) {
    for (auto& [key, value] : fields) {
        if (iequals(key, name)) return &value;
    }
    return nullptr;
}

// ═══════════════════════════════════════════════════════════════════
//  class BodySource
//  A pull-based, asynchronous body stream. The transport calls
//  asyncRead() until done() reports true. Each call completes exactly
//  once, possibly with 0 bytes and possibly before asyncRead returns.
//  `buf` must stay valid until the handler runs.
// ═══════════════════════════════════════════════════════════════════
class BodySource {
public:
    using ReadHandler = std::function<void(boost::system::error_code, std::size_t)>;

    virtual ~BodySource() = default;

    virtual void asyncRead(char* buf, std::size_t size, ReadHandler handler) = 0;
    virtual bool done() const = 0;

    // Release whatever feeds the stream; called when the relay ends
    virtual void close() {}
};

// ── In-memory BodySource, handed out in chunks of at most chunkSize ──
class StringSource : public BodySource {
public:
    explicit StringSource(std::string data, std::size_t chunkSize = 4096)
        : data_(std::move(data)), chunkSize_(std::max<std::size_t>(1, chunkSize)) {}

    void asyncRead(char* buf, std::size_t size, ReadHandler handler) override {
        auto n = std::min({size, chunkSize_, data_.size() - offset_});
        std::memcpy(buf, data_.data() + offset_, n);
        offset_ += n;
        handler({}, n);
    }

    bool done() const override { return offset_ >= data_.size(); }

private:
    std::string data_;
    std::size_t chunkSize_;
    std::size_t offset_ = 0;
};

// ═══════════════════════════════════════════════════════════════════
//  class Request
//  Represents an incoming HTTP request.
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    // ── Core properties ──
    std::string method;
    std::string url;            // Full target including query string
    std::string path;           // Target path without query string
    std::string rawBody;        // Raw request body
    std::string ip;             // Client IP address
    std::string protocol;       // "http"
    std::string hostname;       // Host header value

    // ── Parsed data ──
    std::unordered_map<std::string, std::string> headers;   // All headers (lowercase keys)
    std::unordered_map<std::string, std::string> params;    // Route parameters (:id -> params["id"])
    std::unordered_map<std::string, std::string> query;     // Query parameters (first occurrence wins)

    // ── Get a header value (case-insensitive) ──
    std::string header(const std::string& name) const {
        auto it = headers.find(toLower(name));
        return it != headers.end() ? it->second : "";
    }

    // ── Alias for header() (Express compatibility) ──
    std::string get(const std::string& name) const {
        return header(name);
    }

    // ── Query parameter, or nullopt when the key is absent ──
    std::optional<std::string> queryParam(const std::string& name) const {
        auto it = query.find(name);
        if (it == query.end()) return std::nullopt;
        return it->second;
    }
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  Represents the HTTP response to send back.
//  SendCallback and StreamCallback decouple it from the transport.
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using SendCallback = std::function<void(
        int statusCode,
        const Fields& headers,
        const std::string& body
    )>;

    // Runs once when a streamed body has been relayed or the relay gave up
    using RelayCallback = std::function<void(boost::system::error_code)>;

    using StreamCallback = std::function<void(
        int statusCode,
        const Fields& headers,
        std::shared_ptr<BodySource> body,
        RelayCallback done
    )>;

    explicit Response(SendCallback cb,
                      StreamCallback stream = nullptr,
                      boost::asio::any_io_executor executor = {},
                      std::weak_ptr<void> owner = {})
        : sendCallback_(std::move(cb))
        , streamCallback_(std::move(stream))
        , executor_(std::move(executor))
        , owner_(std::move(owner)) {}

    // Default constructor for testing: bodies are captured in getBody()
    Response() = default;

    // ── Set status code (chainable) ──
    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    // ── Set a response header, replacing any same-named field (chainable) ──
    Response& set(const std::string& key, const std::string& value) {
        remove(key);
        headers_.emplace_back(key, value);
        return *this;
    }

    // ── Add a header without replacing existing ones (chainable) ──
    Response& append(const std::string& key, const std::string& value) {
        headers_.emplace_back(key, value);
        return *this;
    }

    // ── Alias for set() (Express compatibility) ──
    Response& header(const std::string& key, const std::string& value) {
        return set(key, value);
    }

    Response& remove(const std::string& key) {
        headers_.erase(
            std::remove_if(headers_.begin(), headers_.end(),
                [&](const auto& field) { return iequals(field.first, key); }),
            headers_.end());
        return *this;
    }

    // ── Set Content-Type (chainable) ──
    Response& type(const std::string& contentType) {
        return set("Content-Type", contentType);
    }

    // ── Send a string body ──
    void send(const std::string& body) {
        if (sent_) return;
        sent_ = true;
        if (!hasHeader("Content-Type")) {
            headers_.emplace_back("Content-Type", "text/plain; charset=utf-8");
        }
        body_ = body;
        if (sendCallback_) {
            sendCallback_(statusCode_, headers_, body);
        }
        notifyFinish();
    }

    void send(const char* body) {
        send(std::string(body));
    }

    // ── Stream a body from `source` with the current status and headers ──
    //    Returns at once; `done` runs when the relay has finished, with
    //    the source or client error that stopped it, if any.
    void pipe(std::shared_ptr<BodySource> source, RelayCallback done = nullptr) {
        if (sent_) return;
        sent_ = true;
        streamed_ = true;

        RelayCallback finish = [this, done = std::move(done)](boost::system::error_code ec) {
            if (done) done(ec);
            notifyFinish();
        };
        if (streamCallback_) {
            streamCallback_(statusCode_, headers_, std::move(source), std::move(finish));
            return;
        }
        // No transport: drain into the captured body
        drain(std::move(source), std::make_shared<std::vector<char>>(16 * 1024),
              std::move(finish));
    }

    // ── Send any JSON-serializable type ──
    template <typename T>
        requires JsonSerializable<T>
    void json(const T& data) {
        set("Content-Type", "application/json; charset=utf-8");
        send(nlohmann::json(data).dump());
    }

    // ── Send JSON with initializer list ──
    //    Supports: res.json({{"error", "Bad Gateway"}})
    void json(nlohmann::json::initializer_list_t init) {
        nlohmann::json j(init);
        set("Content-Type", "application/json; charset=utf-8");
        send(j.dump());
    }

    // ── Send with status code shorthand ──
    void sendStatus(int code) {
        status(code);
        send(std::to_string(code));
    }

    // ── End without body ──
    void end() {
        if (!sent_) {
            send("");
        }
    }

    // ── Check if response was already sent ──
    bool headersSent() const { return sent_; }
    bool streamed() const { return streamed_; }

    // ── Finish asynchronously ──
    //    Marks the response as pending after the handler returns. The
    //    returned anchor keeps the connection alive; hold it until
    //    send() or pipe() has been called.
    std::shared_ptr<void> defer() {
        deferred_ = true;
        return owner_.lock();
    }

    bool deferred() const { return deferred_; }

    // Executor of the connection; asynchronous work for this response runs on it
    const boost::asio::any_io_executor& executor() const { return executor_; }

    // ── Run `listener` once the response is complete ──
    //    For pipe() that is when the relay ends.
    void onFinish(std::function<void()> listener) {
        finishListeners_.push_back(std::move(listener));
    }

    // ── Access the sent response (for testing and logging) ──
    const std::string& getBody() const { return body_; }
    int getStatusCode() const { return statusCode_; }
    const Fields& getHeaders() const { return headers_; }

    std::string getHeader(const std::string& key) const {
        auto* value = findField(headers_, key);
        return value ? *value : "";
    }

    bool hasHeader(const std::string& key) const {
        return findField(headers_, key) != nullptr;
    }

private:
    int statusCode_ = 200;
    Fields headers_;
    bool sent_ = false;
    bool streamed_ = false;
    bool deferred_ = false;
    SendCallback sendCallback_;
    StreamCallback streamCallback_;
    boost::asio::any_io_executor executor_;
    std::weak_ptr<void> owner_;
    std::vector<std::function<void()>> finishListeners_;
    std::string body_;

    void notifyFinish() {
        auto listeners = std::move(finishListeners_);
        finishListeners_.clear();
        for (auto& listener : listeners) listener();
    }

    void drain(std::shared_ptr<BodySource> source,
               std::shared_ptr<std::vector<char>> buf,
               RelayCallback finish) {
        if (source->done()) {
            if (sendCallback_) sendCallback_(statusCode_, headers_, body_);
            finish({});
            return;
        }
        auto* data = buf->data();
        auto size = buf->size();
        source->asyncRead(data, size,
            [this, source, buf, finish = std::move(finish)](
                boost::system::error_code ec, std::size_t n) mutable {
                body_.append(buf->data(), n);
                if (ec) {
                    if (sendCallback_) sendCallback_(statusCode_, headers_, body_);
                    finish(ec);
                    return;
                }
                drain(std::move(source), std::move(buf), std::move(finish));
            });
    }
};

// ── Server tuning ──
struct ServerOptions {
    int threads = 4;                     // Threads running the event loop
    std::size_t relayBufferSize = 65536; // Bytes per streamed write
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  Express-style HTTP server with routing and middleware.
//  Every connection lives on the io_context; reads, writes and relays
//  are asynchronous, so a slow transfer holds no thread while it waits.
//  Uses pimpl to hide Boost.Beast implementation details.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    explicit Server(ServerOptions options = {});
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    // Non-copyable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ── Middleware Registration ──
    Server& use(MiddlewareFunction middleware);

    // ── Route Registration ──
    template <typename Handler>
    Server& get(const std::string& path, Handler&& handler) {
        addRoute("GET", path, wrapHandler(std::forward<Handler>(handler)));
        return *this;
    }

    // Any method
    template <typename Handler>
    Server& all(const std::string& path, Handler&& handler) {
        addRoute("*", path, wrapHandler(std::forward<Handler>(handler)));
        return *this;
    }

    // ── Start Listening (blocks until close()) ──
    void listen(int port, std::function<void()> callback = nullptr);
    void listen(const std::string& host, int port, std::function<void()> callback = nullptr);

    // ── Stop the server ──
    void close();

    // ── Bound port; useful after listening on port 0 ──
    int port() const;
    bool listening() const;

    // ── Process a request (used internally and for testing) ──
    void handleRequest(Request& req, Response& res);

private:
    // Allow internal networking classes (defined in http.cpp) to access Impl
    friend class HttpSession;
    friend class HttpListener;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void addRoute(const std::string& method, const std::string& pattern, RouteHandler handler);

    // Wrap any callable into a type-erased RouteHandler
    template <typename Handler>
    static RouteHandler wrapHandler(Handler&& handler) {
        return [h = std::forward<Handler>(handler)](Request& req, Response& res) mutable {
            h(req, res);
        };
    }
};

// ═══════════════════════════════════════════════════════════════════
//  Factory: http::createServer()
// ═══════════════════════════════════════════════════════════════════
inline Server createServer(ServerOptions options = {}) {
    return Server(options);
}

} // namespace dlproxy::http
