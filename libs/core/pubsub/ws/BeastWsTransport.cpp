#include "BeastWsTransport.hpp"
#include "TransportErrors.hpp"
#include "RelayLogging.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/beast/version.hpp>
#include <openssl/err.h>

std::function<std::shared_ptr<WsTransport>()>
BeastWsTransport::factory(net::io_context& ioc, ssl::context& sslCtx, Options opts) {
    return [&ioc, &sslCtx, opts]() -> std::shared_ptr<WsTransport> {
        return std::make_shared<BeastWsTransport>(ioc, sslCtx, opts);
    };
}

void BeastWsTransport::connect(const std::string& url) {
    net::post(strand_, [self = shared_from_this(), url]() { self->doConnect(url); });
}

void BeastWsTransport::close(CloseCb done) {
    net::post(strand_, [self = shared_from_this(), done = std::move(done)]() mutable {
        self->doClose(std::move(done));
    });
}

void BeastWsTransport::cancel() {
    net::post(strand_, [self = shared_from_this()]() { self->doCancel(); });
}

void BeastWsTransport::send(std::string msg) {
    net::post(strand_, [self = shared_from_this(), m = std::move(msg)]() mutable {
        if (self->state_.load() != ConnectionState::Open) {
            self->m_error("send on a connection that is not open (" +
                          std::string(toString(self->state_.load())) + ")");
            return;
        }
        self->writeQueue_.emplace_back(std::move(m));
        if (self->writeQueue_.size() == 1) {
            self->doWrite();
        }
    });
}

void BeastWsTransport::doConnect(const std::string& url) {
    if (state_.load() != ConnectionState::Idle) {
        m_error("connect() called on a transport in state " + std::string(toString(state_.load())));
        return;
    }
    auto parsed = ws_url::parse(url);
    if (!parsed) {
        state_ = ConnectionState::Connecting;
        fail("connect", "invalid WebSocket URL: " + url);
        return;
    }
    url_ = *parsed;
    state_ = ConnectionState::Connecting;

    if (url_.secure) {
        tls_.emplace(strand_, sslCtx_);
    } else {
        plain_.emplace(strand_);
    }

    rLog_Data("Resolving" << QString::fromStdString(url_.host) << "port" << QString::fromStdString(url_.port));
    resolver_.async_resolve(url_.host, url_.port,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results){
            self->onResolve(ec, results);
        });
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (state_.load() != ConnectionState::Connecting) return;
    if (ec) { fail("resolve", ec.message()); return; }
    lowestLayer().expires_after(opts_.connectTimeout);
    lowestLayer().async_connect(results,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type ep){
            self->onConnect(ec, ep);
        });
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (state_.load() != ConnectionState::Connecting) return;
    if (ec) { fail("connect", ec.message()); return; }
    if (!tls_) {
        startWsHandshake();
        return;
    }

    if (!SSL_set_tlsext_host_name(tls_->next_layer().native_handle(), url_.host.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        fail("sni", ssl_ec.message());
        return;
    }
    if (opts_.verifyPeer) {
        if (!SSL_set1_host(tls_->next_layer().native_handle(), url_.host.c_str())) {
            beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            fail("verify host", ssl_ec.message());
            return;
        }
        tls_->next_layer().set_verify_mode(ssl::verify_peer);
    } else {
        tls_->next_layer().set_verify_mode(ssl::verify_none);
    }
    tls_->next_layer().async_handshake(ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec){ self->onSslHandshake(ec); });
}

void BeastWsTransport::onSslHandshake(beast::error_code ec) {
    if (state_.load() != ConnectionState::Connecting) return;
    if (ec) { fail("tls handshake", ec.message()); return; }
    startWsHandshake();
}

void BeastWsTransport::startWsHandshake() {
    const std::string hostHeader = url_.host + ":" + url_.port;
    const std::string target = url_.target;
    withStream([this, &hostHeader, &target](auto& ws) {
        // The websocket stream has its own timeouts
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " relay-client");
        }));
        ws.async_handshake(hostHeader, target,
            [self = shared_from_this()](beast::error_code ec){ self->onWsHandshake(ec); });
    });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (state_.load() != ConnectionState::Connecting) return;
    if (ec) { fail("websocket handshake", ec.message()); return; }
    state_ = ConnectionState::Open;
    rLog_Data("WebSocket open:" << QString::fromStdString(url_.toString()));
    m_open();
    doRead();
    schedulePing();
}

void BeastWsTransport::doRead() {
    withStream([this](auto& ws) {
        ws.async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes){
            self->onRead(ec, bytes);
        });
    });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    const auto st = state_.load();
    if (st == ConnectionState::Closed) return;
    if (ec) {
        // Our own close handshake is in flight; doClose() finishes the connection
        if (st == ConnectionState::Closing) return;
        if (ec == websocket::error::closed) {
            std::uint16_t code = close_code::kNormal;
            withStream([&code](auto& ws) {
                const auto reason = ws.reason();
                if (reason.code != websocket::close_code::none) code = static_cast<std::uint16_t>(reason.code);
            });
            rLog_Data("Peer closed the connection, code" << code);
            finish(code);
            return;
        }
        fail("read", ec.message());
        return;
    }

    auto b = buf_.data();
    std::string payload(static_cast<const char*>(b.data()), b.size());
    buf_.consume(buf_.size());
    m_message(payload);

    doRead();
}

void BeastWsTransport::doWrite() {
    if (writeQueue_.empty()) return;
    const auto& front = writeQueue_.front();
    withStream([this, &front](auto& ws) {
        ws.text(true);
        ws.async_write(net::buffer(front), [self = shared_from_this()](beast::error_code ec, std::size_t){
            if (self->state_.load() == ConnectionState::Closed) return;
            if (ec) {
                self->fail("write", ec.message());
                return;
            }
            self->writeQueue_.pop_front();
            if (!self->writeQueue_.empty()) self->doWrite();
        });
    });
}

void BeastWsTransport::schedulePing() {
    if (opts_.pingInterval.count() <= 0) return;
    pingTimer_.expires_after(opts_.pingInterval);
    pingTimer_.async_wait([self = shared_from_this()](beast::error_code ec){
        if (ec || self->state_.load() != ConnectionState::Open) return;
        self->withStream([&self](auto& ws) {
            ws.async_ping({}, [self](beast::error_code ec2){
                if (self->state_.load() != ConnectionState::Open) return;
                if (ec2) { self->fail("ping", ec2.message()); return; }
                self->schedulePing();
            });
        });
    });
}

void BeastWsTransport::doClose(CloseCb done) {
    switch (state_.load()) {
    case ConnectionState::Open:
        state_ = ConnectionState::Closing;
        pingTimer_.cancel();
        withStream([this, &done](auto& ws) {
            ws.async_close(websocket::close_code::normal,
                [self = shared_from_this(), done = std::move(done)](beast::error_code ec) {
                    std::exception_ptr err;
                    if (ec && ec != websocket::error::closed && ec != net::error::operation_aborted) {
                        err = std::make_exception_ptr(TransportError("close failed: " + ec.message()));
                    }
                    self->finish(close_code::kNormal);
                    if (done) done(err);
                });
        });
        return;
    case ConnectionState::Connecting:
        // Abort the attempt in flight; pending handlers see state Closed and bail out
        resolver_.cancel();
        if (plain_ || tls_) {
            beast::error_code ignored;
            lowestLayer().socket().close(ignored);
        }
        finish(close_code::kNormal);
        if (done) done(nullptr);
        return;
    default:
        if (done) done(std::make_exception_ptr(AlreadyClosedError()));
        return;
    }
}

void BeastWsTransport::doCancel() {
    const auto st = state_.load();
    if (st == ConnectionState::Closed) return;
    resolver_.cancel();
    if (plain_ || tls_) {
        beast::error_code ignored;
        lowestLayer().socket().close(ignored);
    }
    finish(close_code::kAbnormal);
}

void BeastWsTransport::fail(const std::string& what, const std::string& message) {
    if (state_.load() == ConnectionState::Closed) return;
    const bool connecting = state_.load() == ConnectionState::Connecting;
    rLog_Warning("WebSocket" << QString::fromStdString(what) << "failed:" << QString::fromStdString(message));
    m_error((connecting ? "connect error (" : "transport error (") + what + "): " + message);
    if (plain_ || tls_) {
        beast::error_code ignored;
        lowestLayer().socket().close(ignored);
    }
    finish(close_code::kAbnormal);
}

void BeastWsTransport::finish(std::uint16_t code) {
    if (state_.exchange(ConnectionState::Closed) == ConnectionState::Closed) return;
    pingTimer_.cancel();
    // writeQueue_ stays intact: an aborted async_write may still reference its front buffer
    m_close(code);
}
