#pragma once

#include "transport/ControlChannel.h"

#include <boost/json/object.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace deskpool::transport {

struct ControlEndpoint {
    std::string host;
    std::uint16_t port = 0;
    std::string path = "/ws";
    bool tls = false;
    bool verify_tls = true;
    std::string api_key;    // sent as X-API-Key on the handshake

    std::string describe() const;
};

// JSON command protocol over a (TLS) WebSocket:
//   -> {"command":"left_click","params":{"x":10,"y":20}}
//   <- {"success":true, ...}
// Calls are serialized; each request/response pair has its own deadline.
class WebSocketControlChannel : public ControlChannel {
public:
    // Connects and completes the handshake, or throws Errc::TransportError.
    WebSocketControlChannel(ControlEndpoint endpoint, std::chrono::milliseconds timeout);
    ~WebSocketControlChannel() override;

    WebSocketControlChannel(const WebSocketControlChannel&) = delete;
    WebSocketControlChannel& operator=(const WebSocketControlChannel&) = delete;

    void click(int x, int y, session::MouseButton button) override;
    void type_text(const std::string& text) override;
    void press_key(const std::string& key) override;
    void scroll(session::ScrollDirection direction, int amount) override;
    void move_cursor(int x, int y) override;
    std::string screenshot() override;
    void close() override;

private:
    boost::json::object call(std::string_view command, boost::json::object params = {});

    class Connection;

    ControlEndpoint endpoint_;
    std::mutex mu_;
    std::unique_ptr<Connection> conn_;
};

} // namespace deskpool::transport
