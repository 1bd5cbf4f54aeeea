#pragma once

#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace deskpool::networking {

using ClientId = std::uint64_t;

// Client-facing WebSocket endpoint. Callbacks run on the connection's strand;
// they must hand long work off to another executor.
class WebSocketServer {
public:
    using OnConnect    = std::function<void(ClientId)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;

    // Port 0 binds an ephemeral port; see port().
    WebSocketServer(boost::asio::io_context& ioc, unsigned short port);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active connections

    unsigned short port() const;
    std::size_t client_count() const;

    // Queued per connection; safe from any thread. Unknown clients are ignored.
    void send(ClientId client, const std::string& msg);
    void broadcast(const std::string& msg);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace deskpool::networking
