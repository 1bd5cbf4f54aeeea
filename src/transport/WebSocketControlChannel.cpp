#include "transport/WebSocketControlChannel.h"

#include "core/Base64.hpp"
#include "core/Error.h"
#include "logging/Log.h"
#include "networking/BlockingIo.hpp"

#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/json.hpp>

#include <type_traits>

namespace deskpool::transport {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace json = boost::json;

std::string ControlEndpoint::describe() const {
    return std::string(tls ? "wss://" : "ws://") + host + ":" + std::to_string(port) + path;
}

// Type-erases the plain and TLS websocket streams.
class WebSocketControlChannel::Connection {
public:
    virtual ~Connection() = default;
    virtual std::string roundtrip(const std::string& request) = 0;
    virtual void close() = 0;
};

namespace {

using PlainWs = websocket::stream<beast::tcp_stream>;
using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

[[noreturn]] void fail(const ControlEndpoint& ep, const std::string& what, const beast::error_code& ec) {
    throw Error(Errc::TransportError, ep.describe() + ": " + what + ": " + ec.message());
}

template <typename WsStream>
class StreamConnection : public WebSocketControlChannel::Connection {
public:
    static constexpr bool kTls = std::is_same_v<WsStream, TlsWs>;

    StreamConnection(const ControlEndpoint& ep, std::chrono::milliseconds timeout)
        : endpoint_(ep),
          timeout_(timeout),
          ctx_(networking::make_client_tls_context(ep.verify_tls)),
          ws_(make_stream(ioc_, ctx_)) {}

    ~StreamConnection() override {
        close();
    }

    // Resolve, connect, optional TLS, websocket upgrade.
    void open() {
        beast::error_code ec = networking::connect(ioc_, ws_, endpoint_.host, endpoint_.port, timeout_);
        if (ec) fail(endpoint_, "connect", ec);

        if constexpr (kTls) {
            ec = networking::tls_handshake(ioc_, ws_.next_layer(), endpoint_.host, timeout_);
            if (ec) fail(endpoint_, "tls handshake", ec);
        }

        const std::string api_key = endpoint_.api_key;
        ws_.set_option(websocket::stream_base::decorator([api_key](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "deskpool/1.0");
            if (!api_key.empty()) req.set("X-API-Key", api_key);
        }));

        beast::get_lowest_layer(ws_).expires_after(timeout_);
        ec = networking::run_one(ioc_, [&](auto handler) {
            ws_.async_handshake(endpoint_.host + ":" + std::to_string(endpoint_.port), endpoint_.path, handler);
        });
        if (ec) fail(endpoint_, "websocket handshake", ec);

        ws_.text(true);
        open_ = true;
    }

    std::string roundtrip(const std::string& request) override {
        if (!open_) {
            throw Error(Errc::TransportError, endpoint_.describe() + ": channel is closed");
        }

        beast::get_lowest_layer(ws_).expires_after(timeout_);
        beast::error_code ec = networking::run_one(ioc_, [&](auto handler) {
            ws_.async_write(asio::buffer(request), handler);
        });
        if (ec) {
            open_ = false;
            fail(endpoint_, "write", ec);
        }

        beast::flat_buffer buffer;
        beast::get_lowest_layer(ws_).expires_after(timeout_);
        ec = networking::run_one(ioc_, [&](auto handler) { ws_.async_read(buffer, handler); });
        if (ec) {
            open_ = false;
            fail(endpoint_, "read", ec);
        }
        return beast::buffers_to_string(buffer.data());
    }

    void close() override {
        if (!open_) return;
        open_ = false;

        beast::get_lowest_layer(ws_).expires_after(timeout_);
        const beast::error_code ec = networking::run_one(ioc_, [&](auto handler) {
            ws_.async_close(websocket::close_code::normal, handler);
        });
        if (ec) {
            logging::debug("Control") << endpoint_.describe() << ": close: " << ec.message();
        }
    }

private:
    static WsStream make_stream(asio::io_context& ioc, asio::ssl::context& ctx) {
        if constexpr (kTls) {
            return WsStream(ioc, ctx);
        } else {
            (void)ctx;
            return WsStream(ioc);
        }
    }

    ControlEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
    asio::io_context ioc_;
    asio::ssl::context ctx_;
    WsStream ws_;
    bool open_ = false;
};

json::array split_combo(const std::string& combo) {
    json::array keys;
    std::size_t start = 0;
    for (;;) {
        const auto plus = combo.find('+', start);
        const auto part = combo.substr(start, plus == std::string::npos ? std::string::npos : plus - start);
        if (!part.empty()) keys.emplace_back(part);
        if (plus == std::string::npos) break;
        start = plus + 1;
    }
    return keys;
}

} // namespace

WebSocketControlChannel::WebSocketControlChannel(ControlEndpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)) {
    if (endpoint_.tls) {
        auto conn = std::make_unique<StreamConnection<TlsWs>>(endpoint_, timeout);
        conn->open();
        conn_ = std::move(conn);
    } else {
        auto conn = std::make_unique<StreamConnection<PlainWs>>(endpoint_, timeout);
        conn->open();
        conn_ = std::move(conn);
    }
    logging::info("Control") << "connected to " << endpoint_.describe();
}

WebSocketControlChannel::~WebSocketControlChannel() = default;

json::object WebSocketControlChannel::call(std::string_view command, json::object params) {
    json::object request;
    request["command"] = command;
    request["params"] = std::move(params);

    std::string raw;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!conn_) {
            throw Error(Errc::TransportError, endpoint_.describe() + ": channel is closed");
        }
        raw = conn_->roundtrip(json::serialize(request));
    }

    json::error_code ec;
    json::value reply = json::parse(raw, ec);
    if (ec || !reply.is_object()) {
        throw Error(Errc::TransportError,
                    endpoint_.describe() + ": malformed reply to " + std::string(command));
    }

    json::object& obj = reply.as_object();
    const json::value* success = obj.if_contains("success");
    if (!success || !success->is_bool() || !success->get_bool()) {
        std::string why = "remote reported failure";
        if (const json::value* err = obj.if_contains("error"); err && err->is_string()) {
            why = std::string(err->get_string());
        }
        throw Error(Errc::TransportError, endpoint_.describe() + ": " + std::string(command) + ": " + why);
    }
    return std::move(obj);
}

void WebSocketControlChannel::click(int x, int y, session::MouseButton button) {
    // The remote agent has no middle-click command.
    const char* command = button == session::MouseButton::Right ? "right_click" : "left_click";
    call(command, {{"x", x}, {"y", y}});
}

void WebSocketControlChannel::type_text(const std::string& text) {
    call("type_text", {{"text", text}});
}

void WebSocketControlChannel::press_key(const std::string& key) {
    if (key.find('+') != std::string::npos && key.size() > 1) {
        call("hotkey", {{"keys", split_combo(key)}});
    } else {
        call("press_key", {{"key", key}});
    }
}

void WebSocketControlChannel::scroll(session::ScrollDirection direction, int amount) {
    call(direction == session::ScrollDirection::Up ? "scroll_up" : "scroll_down", {{"clicks", amount}});
}

void WebSocketControlChannel::move_cursor(int x, int y) {
    call("move_cursor", {{"x", x}, {"y", y}});
}

std::string WebSocketControlChannel::screenshot() {
    json::object reply = call("screenshot");
    const json::value* data = reply.if_contains("image_data");
    if (!data || !data->is_string()) {
        throw Error(Errc::TransportError, endpoint_.describe() + ": screenshot reply without image_data");
    }
    return decode_base64(data->get_string());
}

void WebSocketControlChannel::close() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!conn_) return;
    conn_->close();
    conn_.reset();
    logging::info("Control") << "closed " << endpoint_.describe();
}

} // namespace deskpool::transport
