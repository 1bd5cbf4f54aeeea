#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>

#include <chrono>
#include <string>

namespace deskpool::networking {

// Beast only honours tcp_stream deadlines on async operations. These helpers
// start one async operation on a private io_context and run it to completion,
// which gives blocking call sites a hard per-operation timeout.

template <typename Start>
boost::beast::error_code run_one(boost::asio::io_context& ioc, Start&& start) {
    boost::beast::error_code result = boost::asio::error::would_block;
    start([&result](boost::beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

inline boost::asio::ip::tcp::resolver::results_type
resolve(boost::asio::io_context& ioc, const std::string& host, std::uint16_t port,
        boost::beast::error_code& ec) {
    boost::asio::ip::tcp::resolver resolver(ioc);
    boost::asio::ip::tcp::resolver::results_type results;
    ec = boost::asio::error::would_block;
    resolver.async_resolve(host, std::to_string(port),
                           [&](boost::beast::error_code e, boost::asio::ip::tcp::resolver::results_type r) {
                               ec = e;
                               results = std::move(r);
                           });
    ioc.restart();
    ioc.run();
    return results;
}

// Resolves and connects the lowest layer of `stream` within `timeout`.
template <typename Stream>
boost::beast::error_code connect(boost::asio::io_context& ioc, Stream& stream,
                                 const std::string& host, std::uint16_t port,
                                 std::chrono::steady_clock::duration timeout) {
    boost::beast::error_code ec;
    auto results = resolve(ioc, host, port, ec);
    if (ec) return ec;

    auto& tcp = boost::beast::get_lowest_layer(stream);
    tcp.expires_after(timeout);
    return run_one(ioc, [&](auto handler) { tcp.async_connect(results, handler); });
}

// SNI plus certificate host name verification, then the TLS handshake.
template <typename SslStream>
boost::beast::error_code tls_handshake(boost::asio::io_context& ioc, SslStream& stream,
                                       const std::string& host,
                                       std::chrono::steady_clock::duration timeout) {
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        return boost::beast::error_code(static_cast<int>(::ERR_get_error()),
                                        boost::asio::error::get_ssl_category());
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));

    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    return run_one(ioc, [&](auto handler) {
        stream.async_handshake(boost::asio::ssl::stream_base::client, handler);
    });
}

inline boost::asio::ssl::context make_client_tls_context(bool verify_peer) {
    boost::asio::ssl::context ctx(boost::asio::ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(verify_peer ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none);
    return ctx;
}

} // namespace deskpool::networking
