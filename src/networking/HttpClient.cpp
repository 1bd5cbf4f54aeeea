#include "networking/HttpClient.h"

#include "networking/BlockingIo.hpp"
#include "networking/Url.h"
#include "logging/Log.h"

#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

namespace deskpool::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;

namespace {

constexpr const char* kUserAgent = "deskpool/1.0";

template <typename Stream>
HttpResponse exchange(asio::io_context& ioc, Stream& stream,
                      http::request<http::string_body>& req,
                      std::chrono::milliseconds timeout) {
    auto& tcp = beast::get_lowest_layer(stream);

    tcp.expires_after(timeout);
    beast::error_code ec = run_one(ioc, [&](auto handler) { http::async_write(stream, req, handler); });
    if (ec) throw beast::system_error(ec, "http write");

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    tcp.expires_after(timeout);
    ec = run_one(ioc, [&](auto handler) { http::async_read(stream, buffer, res, handler); });
    if (ec) throw beast::system_error(ec, "http read");

    return HttpResponse{res.result_int(), std::move(res.body())};
}

} // namespace

HttpClient::HttpClient(std::chrono::milliseconds timeout, bool verify_tls)
    : timeout_(timeout), verify_tls_(verify_tls) {}

HttpResponse HttpClient::request(http::verb method, const std::string& url_text,
                                 const std::string& body, const Headers& headers) const {
    const Url url = parse_url(url_text);

    http::request<http::string_body> req{method, url.target, 11};
    req.set(http::field::host, url.authority());
    req.set(http::field::user_agent, kUserAgent);
    for (const auto& [name, value] : headers) req.set(name, value);
    if (!body.empty()) {
        req.body() = body;
        req.prepare_payload();
    }

    asio::io_context ioc;

    if (url.secure()) {
        auto ctx = make_client_tls_context(verify_tls_);
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

        beast::error_code ec = connect(ioc, stream, url.host, url.port, timeout_);
        if (ec) throw beast::system_error(ec, "connect " + url.authority());
        ec = tls_handshake(ioc, stream, url.host, timeout_);
        if (ec) throw beast::system_error(ec, "tls handshake " + url.authority());

        HttpResponse res = exchange(ioc, stream, req, timeout_);

        // Many servers drop the connection without close_notify.
        beast::get_lowest_layer(stream).expires_after(timeout_);
        ec = run_one(ioc, [&](auto handler) { stream.async_shutdown(handler); });
        if (ec && ec != asio::ssl::error::stream_truncated && ec != asio::error::eof) {
            logging::debug("Http") << "tls shutdown " << url.authority() << ": " << ec.message();
        }
        return res;
    }

    beast::tcp_stream stream(ioc);
    beast::error_code ec = connect(ioc, stream, url.host, url.port, timeout_);
    if (ec) throw beast::system_error(ec, "connect " + url.authority());

    HttpResponse res = exchange(ioc, stream, req, timeout_);
    stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        logging::debug("Http") << "shutdown " << url.authority() << ": " << ec.message();
    }
    return res;
}

HttpResponse HttpClient::post_json(const std::string& url, const std::string& json,
                                   const Headers& headers) const {
    Headers all = headers;
    all.emplace_back("Content-Type", "application/json");
    return request(http::verb::post, url, json, all);
}

} // namespace deskpool::networking
