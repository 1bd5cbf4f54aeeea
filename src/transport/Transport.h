#pragma once

#include "transport/ControlChannel.h"
#include "transport/Tunnel.h"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace deskpool::transport {

// How the control channel is spoken once a network path exists.
struct ControlSettings {
    std::string path = "/ws";
    bool tls = true;
    bool verify_tls = true;     // direct connections only; tunnel ends are local
    std::string api_key;
    std::chrono::milliseconds timeout{30000};
};

// One session's network path plus the control channel running over it.
class TransportHandle {
public:
    virtual ~TransportHandle() = default;

    // Where the control channel can be reached (local end for tunnels).
    virtual const TunnelEndpoint& endpoint() const = 0;

    // Opens the control channel. Throws Errc::TransportError.
    virtual void attach() = 0;

    // Throws Errc::TransportError when not attached or already closed.
    virtual ControlChannel& channel() = 0;

    virtual bool degraded() const = 0;

    // Idempotent.
    virtual void close() = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    // Establishes the network path. Throws Errc::AmbiguousTransport,
    // Errc::TransportTimeout or Errc::TransportError.
    virtual std::unique_ptr<TransportHandle> open(const TunnelRequest& request) = 0;
};

// Tunnel process (or direct connection) plus a WebSocket control channel.
class TunnelTransportFactory : public TransportFactory {
public:
    TunnelTransportFactory(boost::asio::io_context& ioc, TunnelOptions tunnel, ControlSettings control);

    std::unique_ptr<TransportHandle> open(const TunnelRequest& request) override;

private:
    boost::asio::io_context& ioc_;
    TunnelOptions tunnel_;
    ControlSettings control_;
};

} // namespace deskpool::transport
