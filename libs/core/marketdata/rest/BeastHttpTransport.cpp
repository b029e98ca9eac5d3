#include "BeastHttpTransport.hpp"
#include "../model/Errors.hpp"
#include "CandleSyncLogging.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <fmt/format.h>
#include <QString>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

TransportError makeError(const std::string& host, const std::string& target, std::string_view what) {
    return TransportError(fmt::format("GET https://{}{} failed: {}", host, target, what));
}

// Drives one async operation to completion on a private io_context.
// tcp_stream deadlines only apply to async operations.
template <typename Initiate>
beast::error_code runToCompletion(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result = net::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

} // namespace

HttpResponse BeastHttpTransport::get(const std::string& host,
                                     const std::string& port,
                                     const std::string& target,
                                     std::chrono::seconds timeout) {
    net::io_context ioc;
    ssl::context sslCtx{ssl::context::tlsv12_client};
    sslCtx.set_default_verify_paths();
    sslCtx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, sslCtx);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        beast::error_code ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        throw makeError(host, target, "SNI: " + ec.message());
    }
    if (!SSL_set1_host(stream.native_handle(), host.c_str())) {
        beast::error_code ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        throw makeError(host, target, "host verification: " + ec.message());
    }

    tcp::resolver resolver(ioc);
    tcp::resolver::results_type results;
    beast::error_code ec = net::error::would_block;
    resolver.async_resolve(host, port, [&](beast::error_code e, tcp::resolver::results_type r) {
        ec = e;
        results = std::move(r);
    });
    ioc.run_for(timeout);
    if (ec == net::error::would_block) {
        resolver.cancel();
        ioc.restart();
        ioc.run();
        throw makeError(host, target, "resolve: timed out");
    }
    if (ec) throw makeError(host, target, "resolve: " + ec.message());

    auto& lowest = beast::get_lowest_layer(stream);
    lowest.expires_after(timeout);
    ec = runToCompletion(ioc, [&](auto handler) { lowest.async_connect(results, std::move(handler)); });
    if (ec) throw makeError(host, target, "connect: " + ec.message());

    lowest.expires_after(timeout);
    ec = runToCompletion(ioc, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });
    if (ec) throw makeError(host, target, "TLS handshake: " + ec.message());

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");

    lowest.expires_after(timeout);
    ec = runToCompletion(ioc, [&](auto handler) { http::async_write(stream, req, std::move(handler)); });
    if (ec) throw makeError(host, target, "write: " + ec.message());

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    lowest.expires_after(timeout);
    ec = runToCompletion(ioc, [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });
    if (ec) throw makeError(host, target, "read: " + ec.message());

    // Servers commonly skip close_notify; the response is already complete.
    lowest.expires_after(timeout);
    ec = runToCompletion(ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        cLog_Data("TLS shutdown after GET" << QString::fromStdString(target) << "reported:"
                  << QString::fromStdString(ec.message()));
    }

    HttpResponse out;
    out.status = static_cast<unsigned>(res.result_int());
    out.body = std::move(res.body());
    return out;
}
