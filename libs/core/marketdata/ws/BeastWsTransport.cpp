#include "BeastWsTransport.hpp"
#include <boost/beast/core.hpp>
#include <openssl/err.h>
#include <string_view>

void BeastWsTransport::connect(std::string host, std::string port, std::string target) {
    host_ = std::move(host);
    port_ = std::move(port);
    target_ = std::move(target);
    closing_ = false;
    down_ = false;

    resolver_.async_resolve(host_, port_,
        [this](beast::error_code ec, tcp::resolver::results_type results){
            onResolve(ec, results);
        });
}

void BeastWsTransport::close() {
    if (closing_) return;
    closing_ = true;
    pingTimer_.cancel();
    resolver_.cancel();

    if (ws_.is_open()) {
        ws_.async_close(websocket::close_code::normal, [this](beast::error_code ec){
            if (ec && onError_) onError_("close: " + ec.message());
            reportDown();
        });
    } else {
        // Mid-connect: abort the pending socket operation
        beast::error_code ec;
        beast::get_lowest_layer(ws_).socket().close(ec);
        if (ec && ec != net::error::not_connected && onError_) onError_("close: " + ec.message());
        reportDown();
    }
}

void BeastWsTransport::reportDown() {
    if (down_) return;
    down_ = true;
    pingTimer_.cancel();
    if (onStatus_) onStatus_(false);
}

void BeastWsTransport::fail(beast::error_code ec, const char* stage) {
    if (closing_) {
        // Errors after close() are the close itself (operation_aborted, closed)
        reportDown();
        return;
    }
    if (onError_) onError_(std::string{stage} + ": " + ec.message());
    reportDown();
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail(ec, "resolve");
    if (closing_) return reportDown();
    beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
    beast::get_lowest_layer(ws_).async_connect(results,
        [this](beast::error_code ec, tcp::resolver::results_type::endpoint_type ep){
            onConnect(ec, ep);
        });
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) return fail(ec, "connect");
    if (closing_) return reportDown();
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail(ssl_ec, "SNI");
    }
    if (!SSL_set1_host(ws_.next_layer().native_handle(), host_.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail(ssl_ec, "host verification");
    }
    ws_.next_layer().set_verify_mode(ssl::verify_peer);
    ws_.next_layer().async_handshake(ssl::stream_base::client,
        [this](beast::error_code ec){ onSslHandshake(ec); });
}

void BeastWsTransport::onSslHandshake(beast::error_code ec) {
    if (ec) return fail(ec, "TLS handshake");
    if (closing_) return reportDown();
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    // Binance expects the port in the Host header for :9443
    ws_.async_handshake(host_ + ":" + port_, target_,
        [this](beast::error_code ec){ onWsHandshake(ec); });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (ec) return fail(ec, "websocket handshake");
    if (closing_) {
        ws_.async_close(websocket::close_code::normal, [this](beast::error_code){ reportDown(); });
        return;
    }
    if (onStatus_) onStatus_(true);
    doRead();
    schedulePing();
}

void BeastWsTransport::doRead() {
    ws_.async_read(buf_, [this](beast::error_code ec, std::size_t bytes){ onRead(ec, bytes); });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (ec) return fail(ec, "read");

    if (onMessage_ && !closing_) {
        auto b = buf_.data();
        std::string payload(static_cast<const char*>(b.data()), b.size());
        buf_.consume(buf_.size());
        onMessage_(std::move(payload));
    } else {
        buf_.consume(buf_.size());
    }

    doRead();
}

void BeastWsTransport::schedulePing() {
    pingTimer_.expires_after(kPingInterval);
    pingTimer_.async_wait([this](beast::error_code ec){
        if (ec || closing_ || down_) return;
        ws_.async_ping({}, [this](beast::error_code ec2){
            if (ec2) return fail(ec2, "ping");
            schedulePing();
        });
    });
}
