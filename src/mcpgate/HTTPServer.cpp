//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/HTTPServer.cpp
// Purpose: HTTP/HTTPS gateway server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <array>
#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcpgate/HTTPServer.hpp"
#include "mcpgate/TransportRoutes.h"

#include <openssl/ssl.h>

namespace mcpgate {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kKeepAliveFrame = ": keepalive\n\n";

// Limits on how much of a rejected body is read and discarded before the connection closes.
constexpr std::size_t kDrainLimitBytes = 4 * 1024 * 1024;
constexpr std::chrono::milliseconds kDrainTimeout{1000};

std::string_view toStd(beast::string_view s) {
    return std::string_view(s.data(), s.size());
}

tcp::socket& rawSocket(beast::tcp_stream& s) { return s.socket(); }
tcp::socket& rawSocket(ssl::stream<tcp::socket>& s) { return s.next_layer(); }

// Counts a legacy stream as open for the lifetime of the object.
class StreamCounter {
public:
    explicit StreamCounter(std::atomic<std::size_t>& counter) : counter_(counter) { ++counter_; }
    ~StreamCounter() { --counter_; }
    StreamCounter(const StreamCounter&) = delete;
    StreamCounter& operator=(const StreamCounter&) = delete;

private:
    std::atomic<std::size_t>& counter_;
};

// Shared by a legacy stream's keep-alive loop and its disconnect watcher. Both coroutines run
// on the connection's strand, so the flags need no further synchronization.
struct StreamState {
    explicit StreamState(const net::any_io_executor& ex) : keepAliveTimer(ex), watcherExit(ex) {}
    net::steady_timer keepAliveTimer;
    net::steady_timer watcherExit;
    bool clientGone{false};
    bool watcherFinished{false};
};

} // namespace

class HTTPServer::Impl {
public:
    ServerConfig opts;
    std::shared_ptr<RpcAdapter> adapter;
    RouteTable routes;
    std::atomic<bool> running{false};
    std::atomic<std::size_t> activeStreams{0};
    std::atomic<std::uint16_t> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::vector<std::thread> ioThreads;

    std::mutex errorMutex;
    ErrorHandler errorHandler; // guarded by errorMutex

    Impl(const ServerConfig& o, std::shared_ptr<RpcAdapter> a)
        : opts(o), adapter(std::move(a)), routes(o), ioc(static_cast<int>(o.ioThreads == 0 ? 1 : o.ioThreads)) {
        if (!adapter) {
            throw std::invalid_argument("HTTPServer requires an RPC adapter");
        }
    }

    ~Impl() {
        shutdown();
    }

    void setErrorHandler(ErrorHandler handler) {
        std::lock_guard<std::mutex> lock(errorMutex);
        errorHandler = std::move(handler);
    }

    void notifyError(const std::string& msg) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            handler = errorHandler;
        }
        if (handler) { handler(msg); }
    }

    void setError(const std::string& msg) {
        LOG_WARN("{}", msg);
        notifyError(msg);
    }

    void setupTls() {
        if (opts.scheme != "https") {
            return;
        }
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
        // TLS 1.3 only
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        try {
            sslCtx->use_certificate_chain_file(opts.certFile);
            sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
            throw;
        }
        sslCtx->set_options(
            ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
            ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
    }

    void bind() {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.host, std::to_string(opts.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    void runIo() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer I/O thread failed: {}", e.what());
            setError(std::string("HTTPServer I/O thread error: ") + e.what());
        }
    }

    void shutdown() {
        bool wasRunning = running.exchange(false);
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        ioc.stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        ioThreads.clear();
        if (wasRunning) {
            LOG_INFO("HTTPServer stopped");
        }
    }

    void reportSessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
            // Shutdown-related errors are expected
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", kind, e.what());
        } else {
            setError(std::string("HTTPServer ") + kind + " session error: " + e.what());
        }
    }

    template <class Body>
    void applyCors(http::response<Body>& res) const {
        if (!opts.corsOrigin.empty()) {
            res.set(http::field::access_control_allow_origin, opts.corsOrigin);
        }
    }

    net::awaitable<void> sessionPlain(tcp::socket socket) {
        beast::tcp_stream stream(std::move(socket));
        try {
            co_await serveConnection(stream);
        } catch (const std::exception& e) {
            reportSessionError("plain", e);
        }
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        co_return;
    }

    net::awaitable<void> sessionTls(tcp::socket socket) {
        ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
        try {
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveConnection(tls);
            boost::system::error_code ec;
            co_await tls.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } catch (const std::exception& e) {
            reportSessionError("TLS", e);
        }
        co_return;
    }

    // Reads one request and answers it; a legacy stream keeps the connection until the client leaves.
    template <class Stream>
    net::awaitable<void> serveConnection(Stream& stream) {
        beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(opts.maxBodyBytes);

        boost::system::error_code ec;
        co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
        if (ec == http::error::body_limit) {
            LOG_WARN("HTTPServer: request body over {} bytes rejected", opts.maxBodyBytes);
            http::response<http::string_body> res{http::status::payload_too_large, parser.get().version()};
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            applyCors(res);
            res.body() = kBodyTooLargeBody;
            res.prepare_payload();
            co_await http::async_write(stream, res, net::use_awaitable);
            co_await drainRejectedBody(stream);
            co_return;
        }
        if (ec == http::error::end_of_stream) {
            co_return;
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }

        http::request<http::string_body> req = parser.release();
        RouteDecision d = routes.Resolve(req.method(), toStd(req.target()), toStd(req[http::field::accept]));
        if (d.action == RouteAction::OpenStream) {
            co_await runLegacyStream(stream, req.version());
            co_return;
        }

        auto res = makeResponse(req, d);
        LOG_DEBUG("{} {} -> {}", std::string(toStd(req.method_string())), std::string(toStd(req.target())),
                  res.result_int());
        co_await http::async_write(stream, res, net::use_awaitable);
        co_return;
    }

    // Discards what the client is still sending after a 413 so that closing the socket does not
    // reset the connection before the client has read the reply. Stops at EOF, after
    // kDrainLimitBytes or after kDrainTimeout.
    template <class Stream>
    net::awaitable<void> drainRejectedBody(Stream& stream) {
        auto ex = co_await net::this_coro::executor;
        auto finished = std::make_shared<bool>(false);
        net::steady_timer deadline(ex);
        deadline.expires_after(kDrainTimeout);
        deadline.async_wait([&stream, finished](const boost::system::error_code& ec) {
            if (!ec && !*finished) {
                boost::system::error_code ignored;
                rawSocket(stream).cancel(ignored);
            }
        });

        std::array<char, 8192> scratch{};
        std::size_t drained = 0;
        boost::system::error_code ec;
        while (drained < kDrainLimitBytes) {
            std::size_t n = co_await stream.async_read_some(net::buffer(scratch),
                                                            net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                break;
            }
            drained += n;
        }
        *finished = true;
        deadline.cancel();
        LOG_DEBUG("HTTPServer: discarded {} bytes of a rejected body ({})", drained,
                  ec ? ec.message() : std::string("limit reached"));
        co_return;
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req,
                                                   const RouteDecision& d) {
        const DiscoveryConfig& disc = opts.discovery;
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.keep_alive(false);

        switch (d.action) {
            case RouteAction::Rpc:
                res.set(http::field::content_type, "application/json");
                res.body() = adapter->HandleToJson(toStd(req[http::field::content_type]), req.body());
                break;
            case RouteAction::OpenStream:
            case RouteAction::StreamHeaders:
                res.set(http::field::content_type, "text/event-stream");
                res.set(http::field::cache_control, "no-cache");
                break;
            case RouteAction::StreamUnavailable:
                res.result(http::status::method_not_allowed);
                res.set(http::field::content_type, "text/plain; charset=utf-8");
                res.body() = disc.streamUnavailableText;
                break;
            case RouteAction::DescribeEndpoint:
                res.set(http::field::content_type, "text/plain; charset=utf-8");
                res.body() = disc.streamableGetText;
                break;
            case RouteAction::Redirect:
                res.result(http::status::permanent_redirect);
                res.set(http::field::location, d.location);
                break;
            case RouteAction::Root:
                res.set(http::field::content_type, "application/json");
                res.body() = RootDescriptorJson(disc);
                break;
            case RouteAction::McpDiscovery:
                res.set(http::field::content_type, "application/json");
                res.body() = McpDiscoveryJson(disc);
                break;
            case RouteAction::AuthStub:
                res.result(http::status::not_found);
                res.set(http::field::content_type, "application/json");
                res.body() = kNotImplementedBody;
                break;
            case RouteAction::Preflight:
                res.set(http::field::allow, d.allow);
                if (!opts.corsOrigin.empty()) {
                    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS, HEAD");
                    res.set(http::field::access_control_allow_headers, "*");
                    res.set(http::field::access_control_max_age, "600");
                }
                res.set(http::field::content_type, "text/plain; charset=utf-8");
                res.body() = "OK";
                break;
            case RouteAction::MethodNotAllowed:
                res.result(http::status::method_not_allowed);
                res.set(http::field::allow, d.allow);
                res.set(http::field::content_type, "text/plain; charset=utf-8");
                res.body() = "Method Not Allowed";
                break;
            case RouteAction::NotFound:
                res.result(http::status::not_found);
                res.set(http::field::content_type, "application/json");
                res.body() = kNotFoundBody;
                break;
        }
        applyCors(res);

        if (d.headOnly) {
            if (d.action != RouteAction::StreamHeaders) {
                res.content_length(res.body().size());
            }
            res.body().clear();
        } else {
            res.prepare_payload();
        }
        return res;
    }

    //==========================================================================================================
    // Legacy push stream: response headers, one handshake frame, then keep-alive comments until the
    // client disconnects, a write fails or the server stops. A watcher coroutine on the same strand
    // reads from the socket so that a client close is noticed between keep-alives.
    //==========================================================================================================
    template <class Stream>
    net::awaitable<void> runLegacyStream(Stream& stream, unsigned version) {
        StreamCounter counter(activeStreams);
        LOG_INFO("Legacy stream opened ({} active)", activeStreams.load());

        http::response<http::empty_body> res{http::status::ok, version};
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set("X-Accel-Buffering", "no");
        res.keep_alive(false);
        applyCors(res);
        http::response_serializer<http::empty_body> sr{res};
        co_await http::async_write_header(stream, sr, net::use_awaitable);

        const std::string handshake =
            "event: message\ndata: " + adapter->HandshakeNotification().Serialize() + "\n\n";
        co_await net::async_write(stream, net::buffer(handshake), net::use_awaitable);

        auto ex = co_await net::this_coro::executor;
        auto state = std::make_shared<StreamState>(ex);
        net::co_spawn(ex, watchDisconnect(stream, state), net::detached);

        boost::system::error_code ec;
        while (running.load() && !state->clientGone) {
            state->keepAliveTimer.expires_after(opts.keepAliveInterval);
            co_await state->keepAliveTimer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (!running.load() || state->clientGone) {
                break;
            }
            co_await net::async_write(stream, net::buffer(kKeepAliveFrame, std::strlen(kKeepAliveFrame)),
                                      net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_DEBUG("Legacy stream write failed: {}", ec.message());
                break;
            }
        }

        // The watcher borrows the stream; wake it and wait until it has let go.
        rawSocket(stream).cancel(ec);
        if (!state->watcherFinished) {
            state->watcherExit.expires_at(net::steady_timer::time_point::max());
            co_await state->watcherExit.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
        LOG_INFO("Legacy stream closed ({} remaining)", activeStreams.load() - 1);
        co_return;
    }

    template <class Stream>
    net::awaitable<void> watchDisconnect(Stream& stream, std::shared_ptr<StreamState> state) {
        std::array<char, 512> scratch{};
        boost::system::error_code ec;
        for (;;) {
            co_await stream.async_read_some(net::buffer(scratch), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                break;
            }
        }
        LOG_DEBUG("Legacy stream peer gone: {}", ec.message());
        state->clientGone = true;
        state->watcherFinished = true;
        state->keepAliveTimer.cancel();
        state->watcherExit.cancel();
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket(net::make_strand(ioc));
                co_await acceptor->async_accept(socket, net::use_awaitable);
                auto ex = socket.get_executor();
                if (sslCtx) {
                    net::co_spawn(ex, sessionTls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ex, sessionPlain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // operation_aborted once the acceptor is closed
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const ServerConfig& cfg, std::shared_ptr<RpcAdapter> adapter)
    : pImpl(std::make_unique<Impl>(cfg, std::move(adapter))) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        pImpl->setupTls();
        pImpl->bind();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPServer: cannot listen on {}:{}: {}", pImpl->opts.host, pImpl->opts.port, e.what());
        pImpl->notifyError(e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }

    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    Impl* impl = pImpl.get();
    for (unsigned int i = 0; i < pImpl->opts.ioThreads; ++i) {
        pImpl->ioThreads.emplace_back([impl]() { impl->runIo(); });
    }
    LOG_INFO("HTTPServer listening on {}://{}:{}", pImpl->opts.scheme, pImpl->opts.host, pImpl->boundPort.load());
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->shutdown();
    done.set_value();
    return fut;
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->setErrorHandler(std::move(handler));
}

std::uint16_t HTTPServer::LocalPort() const {
    return pImpl->boundPort.load();
}

std::size_t HTTPServer::ActiveStreamCount() const {
    return pImpl->activeStreams.load();
}

} // namespace mcpgate
