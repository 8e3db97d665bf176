// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Boost.Beast-powered HTTP server implementation
// ═══════════════════════════════════════════════════════════════════

#include "dlproxy/http.h"
#include "dlproxy/console.h"
#include "dlproxy/url.h"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <regex>
#include <string>
#include <vector>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <thread>

namespace dlproxy::http {

namespace beast  = boost::beast;
namespace net    = boost::asio;
namespace bhttp  = beast::http;
using tcp        = net::ip::tcp;

// ═══════════════════════════════════════════
//  Internal: Compiled route with regex
// ═══════════════════════════════════════════
struct CompiledRoute {
    std::string method;
    std::string pattern;
    std::regex  regex;
    std::vector<std::string> paramNames;
    RouteHandler handler;
};

namespace detail {

inline CompiledRoute compileRoute(const std::string& method,
                                   const std::string& pattern,
                                   RouteHandler handler) {
    CompiledRoute route;
    route.method  = method;
    route.pattern = pattern;
    route.handler = std::move(handler);

    std::string regexStr;
    std::size_t pos = 0;

    while (pos < pattern.size()) {
        char c = pattern[pos];
        if (c == ':') {
            // Route parameter, e.g. :paramName
            pos++;
            std::string paramName;
            while (pos < pattern.size() && pattern[pos] != '/') {
                paramName += pattern[pos++];
            }
            route.paramNames.push_back(paramName);
            regexStr += "([^/]+)";
        } else if (c == '*') {
            // Wildcard
            regexStr += "(.*)";
            route.paramNames.push_back("*");
            pos++;
        } else {
            // Escape regex special characters
            if (c == '.' || c == '(' || c == ')' ||
                c == '[' || c == ']' || c == '{' ||
                c == '}' || c == '+' || c == '?' ||
                c == '^' || c == '$' || c == '|') {
                regexStr += '\\';
            }
            regexStr += c;
            pos++;
        }
    }

    route.regex = std::regex("^" + regexStr + "$");
    return route;
}

inline bool matchRoute(const CompiledRoute& route,
                        const std::string& method,
                        const std::string& path,
                        Request& req) {
    // Method match: exact match, or wildcard "*"
    if (route.method != method && route.method != "*") return false;

    std::smatch match;
    if (std::regex_match(path, match, route.regex)) {
        for (std::size_t i = 0; i < route.paramNames.size(); ++i) {
            req.params[route.paramNames[i]] = match[i + 1].str();
        }
        return true;
    }
    return false;
}

// Connection-level fields describe the upstream hop and are re-derived here
inline bool isFramingField(const std::string& name) {
    return iequals(name, "Connection") || iequals(name, "Keep-Alive") ||
           iequals(name, "Transfer-Encoding") || iequals(name, "Content-Length");
}

} // namespace detail

// ═══════════════════════════════════════════
//  Server::Impl — Hidden implementation
// ═══════════════════════════════════════════
struct Server::Impl {
    ServerOptions                     options;
    std::vector<MiddlewareFunction>   middlewares;
    std::vector<CompiledRoute>        routes;
    std::unique_ptr<net::io_context>  ioc;
    std::atomic<bool> running{false};
    std::atomic<int>  boundPort{0};

    // ── Middleware chain executor ──
    void executeMiddlewareChain(Request& req, Response& res,
                                std::size_t index,
                                std::function<void()> done) {
        if (res.headersSent()) return;
        if (index >= middlewares.size()) {
            done();
            return;
        }

        auto& mw = middlewares[index];
        mw(req, res, [this, &req, &res, index, done = std::move(done)]() {
            executeMiddlewareChain(req, res, index + 1, std::move(done));
        });
    }

    // ── Request handler: middleware chain → route matching ──
    void handleRequest(Request& req, Response& res) {
        try {
            executeMiddlewareChain(req, res, 0, [this, &req, &res]() {
                if (res.headersSent()) return;

                for (auto& route : routes) {
                    // Reset params for each route attempt
                    auto savedParams = req.params;
                    req.params.clear();

                    if (detail::matchRoute(route, req.method, req.path, req)) {
                        route.handler(req, res);
                        return;
                    }

                    req.params = std::move(savedParams);
                }

                // No route matched → 404
                res.status(404).json(nlohmann::json{
                    {"error", "Not Found"},
                    {"message", "Cannot " + req.method + " " + req.path}
                });
            });
        } catch (const std::exception& e) {
            console::error("Handler failed for", req.method, req.path + ":", e.what());
            if (!res.headersSent()) {
                res.status(500).json(nlohmann::json{
                    {"error", "Internal Server Error"},
                    {"message", e.what()}
                });
            }
        }
    }
};

// ═══════════════════════════════════════════
//  Session — Handles a single HTTP connection
//  Everything runs on the connection's strand. The next request is
//  read only once the current response, relay included, is complete.
// ═══════════════════════════════════════════
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, Server::Impl& server)
        : socket_(std::move(socket))
        , server_(server)
    {}

    void run() {
        readRequest();
    }

private:
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    bhttp::request<bhttp::string_body> beastRequest_;
    Server::Impl& server_;
    std::unique_ptr<Request>  request_;
    std::unique_ptr<Response> response_;
    bool keepAlive_ = false;

    // ── Streamed relay state ──
    std::shared_ptr<bhttp::response<bhttp::buffer_body>> relayHead_;
    std::unique_ptr<bhttp::response_serializer<bhttp::buffer_body>> serializer_;
    std::shared_ptr<BodySource> source_;
    Response::RelayCallback relayDone_;
    std::vector<char> relayBuffer_;

    void readRequest() {
        auto self = shared_from_this();
        beastRequest_ = {};
        bhttp::async_read(
            socket_, buffer_, beastRequest_,
            [self](beast::error_code ec, std::size_t /*bytes_transferred*/) {
                if (!ec) {
                    self->processRequest();
                }
                // On error, session is dropped (shared_ptr ref count -> 0)
            }
        );
    }

    void processRequest() {
        auto self = shared_from_this();

        // ── Build Request from Beast request ──
        request_ = std::make_unique<Request>();
        auto& req = *request_;
        req.method = std::string(beastRequest_.method_string());
        req.url    = std::string(beastRequest_.target());

        auto [path, queryString] = url::splitTarget(req.url);
        req.path     = path;
        req.query    = url::parseQuery(queryString);
        req.rawBody  = beastRequest_.body();
        req.protocol = "http";

        beast::error_code endpointEc;
        auto remote = socket_.remote_endpoint(endpointEc);
        req.ip = endpointEc ? "unknown" : remote.address().to_string();

        // Copy headers (lowercase keys for consistent lookup)
        for (auto& field : beastRequest_) {
            req.headers[toLower(std::string(field.name_string()))]
                = std::string(field.value());
        }

        // Hostname from Host header
        req.hostname = req.header("host");

        // The callbacks run while a handler or a pending operation keeps the session alive
        response_ = std::make_unique<Response>(
            [this](int statusCode, const Fields& headers, const std::string& body) {
                writeBuffered(statusCode, headers, body);
            },
            [this](int statusCode, const Fields& headers, std::shared_ptr<BodySource> body,
                   Response::RelayCallback done) {
                writeStreamed(statusCode, headers, std::move(body), std::move(done));
            },
            socket_.get_executor(),
            self);

        // ── Run the handler ──
        server_.handleRequest(req, *response_);

        // If handler didn't send a response and won't later, send 404
        if (!response_->headersSent() && !response_->deferred()) {
            response_->status(404).json(nlohmann::json{
                {"error", "Not Found"},
                {"message", "No response sent by handler"}
            });
        }
    }

    bool isHead() const {
        return beastRequest_.method() == bhttp::verb::head;
    }

    // Status line and fields; framing fields are re-derived per message
    template <typename Body>
    std::shared_ptr<bhttp::response<Body>> makeHead(int statusCode, const Fields& headers) const {
        auto beastRes = std::make_shared<bhttp::response<Body>>();
        beastRes->result(static_cast<unsigned>(statusCode));
        beastRes->version(beastRequest_.version());
        for (auto& [key, value] : headers) {
            if (!value.empty() && !detail::isFramingField(key)) {
                beastRes->insert(key, value);
            }
        }
        return beastRes;
    }

    void writeBuffered(int statusCode, const Fields& headers, const std::string& body) {
        keepAlive_ = beastRequest_.keep_alive();

        if (isHead()) {
            auto beastRes = makeHead<bhttp::empty_body>(statusCode, headers);
            beastRes->content_length(body.size());
            beastRes->keep_alive(keepAlive_);
            writeMessage(std::move(beastRes));
            return;
        }

        auto beastRes = makeHead<bhttp::string_body>(statusCode, headers);
        beastRes->body() = body;
        beastRes->prepare_payload();
        beastRes->keep_alive(keepAlive_);
        writeMessage(std::move(beastRes));
    }

    template <typename Message>
    void writeMessage(std::shared_ptr<Message> message) {
        bhttp::async_write(
            socket_, *message,
            [self = shared_from_this(), message](beast::error_code ec, std::size_t /*bytes*/) {
                if (ec) {
                    console::debug("Write to", self->socketName(), "failed:", ec.message());
                }
                self->finishResponse(!ec && self->keepAlive_);
            });
    }

    // Relay `body` through a fixed buffer: header first, then one write per read
    void writeStreamed(int statusCode, const Fields& headers, std::shared_ptr<BodySource> body,
                       Response::RelayCallback done) {
        source_ = std::move(body);
        relayDone_ = std::move(done);
        keepAlive_ = beastRequest_.keep_alive();
        const std::string* contentLength = findField(headers, "Content-Length");

        if (isHead()) {
            // Head only; the source is closed unread
            auto beastRes = makeHead<bhttp::empty_body>(statusCode, headers);
            if (contentLength) beastRes->set(bhttp::field::content_length, *contentLength);
            beastRes->keep_alive(keepAlive_);
            bhttp::async_write(
                socket_, *beastRes,
                [self = shared_from_this(), beastRes](beast::error_code ec, std::size_t) {
                    if (ec) {
                        console::debug("Write to", self->socketName(), "failed:", ec.message());
                    }
                    self->endRelay(ec);
                });
            return;
        }

        relayHead_ = makeHead<bhttp::buffer_body>(statusCode, headers);
        if (contentLength) {
            relayHead_->set(bhttp::field::content_length, *contentLength);
        } else if (beastRequest_.version() >= 11) {
            relayHead_->chunked(true);
        } else {
            // HTTP/1.0 without a length: the body ends when the connection does
            keepAlive_ = false;
        }
        relayHead_->keep_alive(keepAlive_);
        relayHead_->body().data = nullptr;
        relayHead_->body().more = true;

        serializer_ = std::make_unique<bhttp::response_serializer<bhttp::buffer_body>>(*relayHead_);
        relayBuffer_.resize(std::max<std::size_t>(1, server_.options.relayBufferSize));

        bhttp::async_write_header(
            socket_, *serializer_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) {
                    console::debug("Write to", self->socketName(), "failed:", ec.message());
                    self->endRelay(ec);
                    return;
                }
                self->relayRead();
            });
    }

    void relayRead() {
        source_->asyncRead(relayBuffer_.data(), relayBuffer_.size(),
            [self = shared_from_this()](boost::system::error_code ec, std::size_t n) {
                self->relayWrite(ec, n);
            });
    }

    void relayWrite(boost::system::error_code readEc, std::size_t n) {
        if (readEc && n == 0) {
            // The status line is gone already; a short body is all the client can see
            console::debug("Body source for", socketName(), "failed:", readEc.message());
            endRelay(readEc);
            return;
        }

        auto& body = relayHead_->body();
        body.data = n > 0 ? relayBuffer_.data() : nullptr;
        body.size = n;
        body.more = readEc || !source_->done();

        bhttp::async_write(
            socket_, *serializer_,
            [self = shared_from_this(), readEc](beast::error_code ec, std::size_t) {
                if (ec == bhttp::error::need_buffer) ec = {};
                if (ec) {
                    console::debug("Client", self->socketName(), "went away:", ec.message());
                    self->endRelay(ec);
                    return;
                }
                if (readEc) {
                    console::debug("Body source for", self->socketName(), "failed:",
                                   readEc.message());
                    self->endRelay(readEc);
                    return;
                }
                if (self->serializer_->is_done()) {
                    self->endRelay({});
                    return;
                }
                self->relayRead();
            });
    }

    void endRelay(boost::system::error_code ec) {
        auto done = std::move(relayDone_);
        relayDone_ = nullptr;
        if (source_) source_->close();
        source_.reset();
        serializer_.reset();
        relayHead_.reset();

        if (done) done(ec);
        finishResponse(!ec && keepAlive_);
    }

    void finishResponse(bool reuse) {
        response_.reset();
        request_.reset();

        if (reuse) {
            readRequest();
        } else {
            beast::error_code shutdownEc;
            socket_.shutdown(tcp::socket::shutdown_send, shutdownEc);
        }
    }

    std::string socketName() const {
        beast::error_code ec;
        auto remote = socket_.remote_endpoint(ec);
        if (ec) return "unknown";
        return remote.address().to_string() + ":" + std::to_string(remote.port());
    }
};

// ═══════════════════════════════════════════
//  Listener — Accepts incoming TCP connections
// ═══════════════════════════════════════════
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(net::io_context& ioc, tcp::endpoint endpoint, Server::Impl& server)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(server)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) throw std::runtime_error("Failed to open acceptor: " + ec.message());

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("Failed to set reuse_address: " + ec.message());

        acceptor_.bind(endpoint, ec);
        if (ec) throw std::runtime_error("Failed to bind to port: " + ec.message());

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("Failed to listen: " + ec.message());

        server_.boundPort = acceptor_.local_endpoint().port();
    }

    void run() {
        doAccept();
    }

private:
    net::io_context& ioc_;
    tcp::acceptor    acceptor_;
    Server::Impl&    server_;

    void doAccept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(&HttpListener::onAccept, shared_from_this())
        );
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), server_)->run();
        } else {
            console::debug("Accept failed:", ec.message());
        }
        // Always continue accepting (unless io_context is stopped)
        doAccept();
    }
};

// ═══════════════════════════════════════════
//  Server — Public API implementation
// ═══════════════════════════════════════════

Server::Server(ServerOptions options)
    : impl_(std::make_unique<Impl>())
{
    impl_->options = options;
}

Server::~Server() {
    if (impl_) close();
}

Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::use(MiddlewareFunction middleware) {
    impl_->middlewares.push_back(std::move(middleware));
    return *this;
}

void Server::addRoute(const std::string& method,
                       const std::string& pattern,
                       RouteHandler handler) {
    impl_->routes.push_back(
        detail::compileRoute(method, pattern, std::move(handler))
    );
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->handleRequest(req, res);
}

void Server::listen(int port, std::function<void()> callback) {
    listen("0.0.0.0", port, std::move(callback));
}

void Server::listen(const std::string& host, int port, std::function<void()> callback) {
    const int threads = std::max(1, impl_->options.threads);
    impl_->ioc = std::make_unique<net::io_context>(threads);

    auto address  = net::ip::make_address(host);
    auto endpoint = tcp::endpoint(address, static_cast<unsigned short>(port));

    // Create and start the listener
    auto httpListener = std::make_shared<HttpListener>(*impl_->ioc, endpoint, *impl_);
    httpListener->run();

    impl_->running = true;

    // Fire the callback before entering the event loop
    if (callback) {
        callback();
    }

    // Block on the event loop; the calling thread is one of the runners
    auto runLoop = [this] {
        for (;;) {
            try {
                impl_->ioc->run();
                break;
            } catch (const std::exception& e) {
                console::error("Event loop error:", e.what());
            }
        }
    };

    std::vector<std::thread> runners;
    runners.reserve(static_cast<std::size_t>(threads - 1));
    for (int i = 1; i < threads; ++i) {
        runners.emplace_back(runLoop);
    }
    runLoop();
    for (auto& t : runners) t.join();
    impl_->running = false;
}

void Server::close() {
    if (impl_->ioc && impl_->running.exchange(false)) {
        impl_->ioc->stop();
    }
}

int Server::port() const {
    return impl_->boundPort.load();
}

bool Server::listening() const {
    return impl_->running.load();
}

} // namespace dlproxy::http
