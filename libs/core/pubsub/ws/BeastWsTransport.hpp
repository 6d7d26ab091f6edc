#pragma once
#include "WsTransport.hpp"
#include "WsUrl.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>  // ensure tcp_stream is declared
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// Boost.Beast implementation of WsTransport for ws:// and wss:// endpoints.
// One instance serves exactly one connection attempt; create a new one to reconnect.
// All I/O runs on a private strand; handlers keep the object alive via shared_from_this.
class BeastWsTransport : public WsTransport,
                         public std::enable_shared_from_this<BeastWsTransport> {
public:
    struct Options {
        std::chrono::seconds connectTimeout{30};
        std::chrono::seconds pingInterval{25};
        bool                 verifyPeer{true};
    };

    BeastWsTransport(net::io_context& ioc, ssl::context& sslCtx, Options opts)
        : strand_(net::make_strand(ioc))
        , sslCtx_(sslCtx)
        , opts_(opts)
        , resolver_(strand_)
        , pingTimer_(strand_)
    {}

    // Returns a factory suitable for SessionController.
    static std::function<std::shared_ptr<WsTransport>()>
    factory(net::io_context& ioc, ssl::context& sslCtx, Options opts);

    void connect(const std::string& url) override;
    void send(std::string msg) override;
    void close(CloseCb done) override;
    void cancel() override;
    ConnectionState state() const override { return state_.load(); }

private:
    using Strand      = net::strand<net::io_context::executor_type>;
    using PlainStream = websocket::stream<beast::tcp_stream>;
    using TlsStream   = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    template <typename F>
    void withStream(F&& f) {
        if (tls_) f(*tls_);
        else if (plain_) f(*plain_);
    }
    beast::tcp_stream& lowestLayer() {
        return tls_ ? beast::get_lowest_layer(*tls_) : beast::get_lowest_layer(*plain_);
    }

    // Beast state
    Strand strand_;
    ssl::context& sslCtx_;
    Options opts_;
    tcp::resolver resolver_;
    std::optional<PlainStream> plain_;
    std::optional<TlsStream> tls_;
    beast::flat_buffer buf_;
    net::steady_timer pingTimer_;
    std::deque<std::string> writeQueue_;

    // State
    std::atomic<ConnectionState> state_{ConnectionState::Idle};
    WsUrl url_;

    // Handlers
    void doConnect(const std::string& url);
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type);
    void onSslHandshake(beast::error_code ec);
    void startWsHandshake();
    void onWsHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void schedulePing();
    void doClose(CloseCb done);
    void doCancel();

    // Reports the failure and terminates with close code 1006.
    void fail(const std::string& what, const std::string& message);
    // Single exit point to Closed; emits onClose exactly once.
    void finish(std::uint16_t code);
};
