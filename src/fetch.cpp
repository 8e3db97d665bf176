// ═══════════════════════════════════════════════════════════════════
//  src/fetch.cpp — Boost.Beast streaming HTTP(S) client
// ═══════════════════════════════════════════════════════════════════
//
//  Every step is asynchronous on the caller's executor and bounded by
//  a Beast stream timeout. stream() and request() run the same steps
//  on a private io_context for callers that may block.
// ═══════════════════════════════════════════════════════════════════

#include "dlproxy/fetch.h"
#include "dlproxy/url.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <limits>
#include <stdexcept>
#include <vector>

namespace dlproxy::fetch {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using Parser = bhttp::response_parser<bhttp::buffer_body>;

namespace detail {

inline bool isRedirect(int status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

inline bool isIpLiteral(const std::string& host) {
    beast::error_code ec;
    net::ip::make_address(host, ec);
    return !ec;
}

inline std::shared_ptr<ssl::context> makeTlsContext(const RequestOptions& opts) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    ctx->set_options(ssl::context::default_workarounds |
                     ssl::context::no_sslv2 |
                     ssl::context::no_sslv3);
    if (opts.verifyTls) {
        ctx->set_default_verify_paths();
        if (!opts.caFile.empty()) {
            ctx->load_verify_file(opts.caFile);
        }
        ctx->set_verify_mode(ssl::verify_peer);
    } else {
        ctx->set_verify_mode(ssl::verify_none);
    }
    return ctx;
}

// ═══════════════════════════════════════════
//  Connection: one upstream exchange. After the
//  head has been read it serves as the body source
// ═══════════════════════════════════════════
class Connection : public http::BodySource,
                   public std::enable_shared_from_this<Connection> {
public:
    using Handler = std::function<void(beast::error_code)>;

    Connection(net::any_io_executor executor, std::shared_ptr<ssl::context> tls,
               const RequestOptions& opts)
        : executor_(executor)
        , tls_(std::move(tls))
        , resolver_(executor)
        , timer_(executor)
        , connectTimeout_(opts.connectTimeoutMs)
        , idleTimeout_(opts.idleTimeoutMs)
        , maxBodyBytes_(opts.maxBodyBytes)
        , maxHeaderBytes_(opts.maxHeaderBytes)
        , verifyTls_(opts.verifyTls)
    {}

    ~Connection() override { close(); }

    void asyncOpen(const url::Url& target, Handler handler) {
        // The resolver has no stream timeout; a timer cancels it instead
        resolveTimedOut_ = false;
        if (connectTimeout_.count() > 0) {
            timer_.expires_after(connectTimeout_);
            timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
                if (!ec) {
                    self->resolveTimedOut_ = true;
                    self->resolver_.cancel();
                }
            });
        }
        resolver_.async_resolve(target.host, target.port,
            [self = shared_from_this(), target, handler = std::move(handler)](
                beast::error_code ec, tcp::resolver::results_type endpoints) mutable {
                self->timer_.cancel();
                if (ec && self->resolveTimedOut_) ec = beast::error::timeout;
                if (ec) {
                    handler(ec);
                    return;
                }
                self->connect(target, endpoints, std::move(handler));
            });
    }

    void asyncSend(const url::Url& target, const RequestOptions& opts, Handler handler) {
        request_ = bhttp::request<bhttp::empty_body>{bhttp::verb::get, target.target, 11};
        request_.set(bhttp::field::host, target.hostHeader());
        request_.set(bhttp::field::user_agent, opts.userAgent);
        request_.set(bhttp::field::accept, "*/*");
        // Bytes are relayed as-is; ask for them unencoded
        request_.set(bhttp::field::accept_encoding, "identity");
        for (auto& [key, val] : opts.headers) {
            request_.set(key, val);
        }

        withStream([&](auto& stream) {
            expire(beast::get_lowest_layer(stream), connectTimeout_);
            bhttp::async_write(stream, request_,
                [self = shared_from_this(), handler = std::move(handler)](
                    beast::error_code ec, std::size_t) {
                    handler(ec);
                });
        });
    }

    void asyncReadHeader(Handler handler) {
        parser_.emplace();
        if (maxBodyBytes_ > 0) {
            parser_->body_limit(maxBodyBytes_);
        } else {
            parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
        }
        parser_->header_limit(maxHeaderBytes_);

        withStream([&](auto& stream) {
            expire(beast::get_lowest_layer(stream), idleTimeout_);
            bhttp::async_read_header(stream, buffer_, *parser_,
                [self = shared_from_this(), handler = std::move(handler)](
                    beast::error_code ec, std::size_t) {
                    handler(ec);
                });
        });
    }

    // Completes with whatever the next chunk of the wire yields; may be zero bytes
    void asyncRead(char* buf, std::size_t size, ReadHandler handler) override {
        if (done() || !isOpen()) {
            beast::error_code ec;
            if (!done()) ec = net::error::not_connected;
            net::post(executor_, [handler = std::move(handler), ec] { handler(ec, 0); });
            return;
        }

        auto& body = parser_->get().body();
        body.data = buf;
        body.size = size;

        withStream([&](auto& stream) {
            expire(beast::get_lowest_layer(stream), idleTimeout_);
            bhttp::async_read_some(stream, buffer_, *parser_,
                [self = shared_from_this(), size, handler = std::move(handler)](
                    beast::error_code ec, std::size_t) {
                    if (ec == bhttp::error::need_buffer) ec = {};
                    handler(ec, size - self->parser_->get().body().size);
                });
        });
    }

    bool done() const override { return !parser_ || parser_->is_done(); }

    const bhttp::response<bhttp::buffer_body>& head() const { return parser_->get(); }

    void close() override {
        beast::error_code ignored;
        timer_.cancel();
        resolver_.cancel();
        withStream([&](auto& stream) {
            auto& socket = beast::get_lowest_layer(stream).socket();
            if (socket.is_open()) {
                socket.shutdown(tcp::socket::shutdown_both, ignored);
                socket.close(ignored);
            }
        });
    }

private:
    net::any_io_executor executor_;
    std::shared_ptr<ssl::context> tls_;
    tcp::resolver resolver_;
    net::steady_timer timer_;
    bool resolveTimedOut_ = false;
    std::optional<beast::tcp_stream> plain_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> secure_;
    bhttp::request<bhttp::empty_body> request_;
    beast::flat_buffer buffer_;
    std::optional<Parser> parser_;
    std::chrono::milliseconds connectTimeout_;
    std::chrono::milliseconds idleTimeout_;
    std::uint64_t maxBodyBytes_;
    std::uint32_t maxHeaderBytes_;
    bool verifyTls_;

    void connect(const url::Url& target, const tcp::resolver::results_type& endpoints,
                 Handler handler) {
        if (target.secure()) {
            secure_.emplace(executor_, *tls_);
            auto* native = secure_->native_handle();
            bool literal = isIpLiteral(target.host);
            int rc = 1;
            if (!literal) {
                // SNI
                rc = SSL_set_tlsext_host_name(native, target.host.c_str()) == 1 ? 1 : 0;
            }
            if (rc == 1 && verifyTls_) {
                rc = literal
                    ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(native), target.host.c_str())
                    : SSL_set1_host(native, target.host.c_str());
            }
            if (rc != 1) {
                handler(beast::error_code(static_cast<int>(::ERR_get_error()),
                                          net::error::get_ssl_category()));
                return;
            }
        } else {
            plain_.emplace(executor_);
        }

        withStream([&](auto& stream) {
            auto& lowest = beast::get_lowest_layer(stream);
            expire(lowest, connectTimeout_);
            lowest.async_connect(endpoints,
                [self = shared_from_this(), handler = std::move(handler)](
                    beast::error_code ec, const tcp::endpoint&) mutable {
                    if (ec || !self->secure_) {
                        handler(ec);
                        return;
                    }
                    self->handshake(std::move(handler));
                });
        });
    }

    void handshake(Handler handler) {
        expire(beast::get_lowest_layer(*secure_), connectTimeout_);
        secure_->async_handshake(ssl::stream_base::client,
            [self = shared_from_this(), handler = std::move(handler)](beast::error_code ec) {
                handler(ec);
            });
    }

    bool isOpen() const {
        if (secure_) return beast::get_lowest_layer(*secure_).socket().is_open();
        if (plain_) return plain_->socket().is_open();
        return false;
    }

    template <typename Fn>
    void withStream(Fn&& fn) {
        if (secure_) {
            fn(*secure_);
        } else if (plain_) {
            fn(*plain_);
        }
    }

    static void expire(beast::tcp_stream& stream, std::chrono::milliseconds timeout) {
        if (timeout.count() > 0) {
            stream.expires_after(timeout);
        } else {
            stream.expires_never();
        }
    }
};

inline std::string describe(const std::string& step, const url::Url& target,
                            const beast::error_code& ec) {
    return step + " " + target.hostHeader() + ": " + ec.message();
}

// ═══════════════════════════════════════════
//  StreamOp: the hop loop of one asyncStream call
// ═══════════════════════════════════════════
class StreamOp : public std::enable_shared_from_this<StreamOp> {
public:
    StreamOp(RequestOptions opts, net::any_io_executor executor,
             std::shared_ptr<ssl::context> tls, url::Url target, StreamHandler handler)
        : opts_(std::move(opts))
        , executor_(std::move(executor))
        , tls_(std::move(tls))
        , target_(std::move(target))
        , handler_(std::move(handler))
    {}

    void start() {
        if (!target_.isHttp()) {
            fail("Unsupported scheme: " + target_.scheme);
            return;
        }

        connection_ = std::make_shared<Connection>(executor_, tls_, opts_);
        connection_->asyncOpen(target_, [self = shared_from_this()](beast::error_code ec) {
            if (ec) {
                self->fail(describe("connect", self->target_, ec));
                return;
            }
            self->send();
        });
    }

private:
    RequestOptions opts_;
    net::any_io_executor executor_;
    std::shared_ptr<ssl::context> tls_;
    url::Url target_;
    StreamHandler handler_;
    std::shared_ptr<Connection> connection_;
    int hop_ = 0;

    void send() {
        connection_->asyncSend(target_, opts_, [self = shared_from_this()](beast::error_code ec) {
            if (ec) {
                self->fail(describe("write", self->target_, ec));
                return;
            }
            self->connection_->asyncReadHeader([self](beast::error_code readEc) {
                if (readEc) {
                    self->fail(describe("read", self->target_, readEc));
                    return;
                }
                self->onHead();
            });
        });
    }

    void onHead() {
        auto& head = connection_->head();
        int status = static_cast<int>(head.result_int());
        auto location = head.find(bhttp::field::location);

        if (isRedirect(status) && location != head.end()) {
            if (hop_ >= opts_.maxRedirects) {
                fail("Too many redirects (limit " + std::to_string(opts_.maxRedirects) + ")");
                return;
            }
            auto next = url::resolve(target_, std::string(location->value()));
            if (!next) {
                fail("Invalid redirect location: " + std::string(location->value()));
                return;
            }
            connection_->close();
            connection_.reset();
            target_ = std::move(*next);
            ++hop_;
            start();
            return;
        }

        StreamResponse response;
        response.status = status;
        response.statusText = std::string(head.reason());
        for (auto& field : head) {
            response.headers.emplace_back(std::string(field.name_string()),
                                          std::string(field.value()));
        }
        response.url = target_.href();
        response.redirects = hop_;
        response.body = Body(std::move(connection_));
        complete(std::move(response));
    }

    void fail(const std::string& message) {
        if (connection_) {
            connection_->close();
            connection_.reset();
        }
        StreamResponse response;
        response.statusText = message;
        complete(std::move(response));
    }

    void complete(StreamResponse response) {
        auto handler = std::move(handler_);
        handler_ = nullptr;
        if (handler) handler(std::move(response));
    }
};

} // namespace detail

// ═══════════════════════════════════════════
//  Body
// ═══════════════════════════════════════════

Body::Body() = default;
Body::~Body() = default;
Body::Body(Body&&) noexcept = default;
Body& Body::operator=(Body&&) noexcept = default;

Body::Body(std::shared_ptr<http::BodySource> source)
    : source_(std::move(source))
{}

void Body::asyncRead(char* buf, std::size_t size, ReadHandler handler) {
    if (!source_) {
        handler({}, 0);
        return;
    }
    source_->asyncRead(buf, size,
        [this, handler = std::move(handler)](boost::system::error_code ec, std::size_t n) {
            bytesRead_ += n;
            if (ec) {
                // A broken upstream cannot be resumed
                close();
            }
            handler(ec, n);
        });
}

bool Body::done() const {
    return !source_ || source_->done();
}

void Body::close() {
    if (source_) {
        source_->close();
        source_.reset();
    }
}

std::size_t Body::read(char* buf, std::size_t size, boost::system::error_code& ec) {
    struct Result {
        bool complete = false;
        boost::system::error_code ec;
        std::size_t n = 0;
    };
    auto result = std::make_shared<Result>();

    asyncRead(buf, size, [result](boost::system::error_code e, std::size_t n) {
        result->complete = true;
        result->ec = e;
        result->n = n;
    });
    if (!result->complete && ioc_) {
        ioc_->restart();
        ioc_->run();
    }
    if (!result->complete) {
        // Nothing drives this source here
        close();
        ec = net::error::operation_not_supported;
        return 0;
    }
    ec = result->ec;
    return result->n;
}

// ═══════════════════════════════════════════
//  asyncStream / stream / request
// ═══════════════════════════════════════════

void asyncStream(const RequestOptions& opts, net::any_io_executor executor,
                 StreamHandler handler) {
    auto failWith = [&](std::string message) {
        StreamResponse response;
        response.statusText = std::move(message);
        if (!executor) {
            handler(std::move(response));
            return;
        }
        net::post(executor, [handler = std::move(handler),
                             response = std::make_shared<StreamResponse>(std::move(response))] {
            handler(std::move(*response));
        });
    };

    if (!executor) {
        failWith("No executor to run the request on");
        return;
    }

    auto target = url::parse(opts.url);
    if (!target) {
        failWith("Invalid URL: " + opts.url);
        return;
    }

    std::shared_ptr<ssl::context> tls;
    try {
        tls = detail::makeTlsContext(opts);
    } catch (const std::exception& e) {
        failWith(e.what());
        return;
    }

    std::make_shared<detail::StreamOp>(opts, executor, std::move(tls), std::move(*target),
                                       std::move(handler))->start();
}

StreamResponse stream(const RequestOptions& opts) {
    auto ioc = std::make_shared<net::io_context>(1);

    StreamResponse response;
    response.statusText = "Request did not complete";
    asyncStream(opts, ioc->get_executor(), [&response](StreamResponse result) {
        response = std::move(result);
    });
    ioc->run();

    response.body.ioc_ = std::move(ioc);
    return response;
}

FetchResponse request(const RequestOptions& opts) {
    auto streamed = stream(opts);

    FetchResponse response;
    response.status = streamed.status;
    response.statusText = streamed.statusText;
    response.headers = streamed.headers;

    std::vector<char> buf(16 * 1024);
    while (streamed.status != 0 && !streamed.body.done()) {
        beast::error_code ec;
        auto n = streamed.body.read(buf.data(), buf.size(), ec);
        response.body.append(buf.data(), n);
        if (ec) {
            response.status = 0;
            response.statusText = "read body: " + ec.message();
            break;
        }
    }
    return response;
}

} // namespace dlproxy::fetch
