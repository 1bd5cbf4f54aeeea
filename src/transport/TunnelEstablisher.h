#pragma once

#include "transport/Tunnel.h"
#include "transport/TunnelStateFile.h"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <mutex>

namespace deskpool::transport {

// Brings up one local forwarding process (gcloud IAP, ssh -L or cloudflared)
// and watches it. Process output and the periodic health check run on the
// supplied io_context, so establish() must not be called from one of its
// threads.
class TunnelEstablisher {
public:
    TunnelEstablisher(boost::asio::io_context& ioc, TunnelOptions options);
    ~TunnelEstablisher();

    TunnelEstablisher(const TunnelEstablisher&) = delete;
    TunnelEstablisher& operator=(const TunnelEstablisher&) = delete;

    // Tears down any previous tunnel first. Throws Errc::AmbiguousTransport,
    // Errc::TransportTimeout or Errc::TransportError.
    TunnelEndpoint establish(const TunnelRequest& request);

    // Idempotent.
    void close();

    TunnelStatus status() const;

private:
    struct Active;

    void spawn(Active& active, const CommandLine& cmd);
    void wait_for_signal(Active& active);
    void wait_for_port(Active& active, std::uint16_t port);

    boost::asio::io_context& ioc_;
    TunnelOptions options_;
    TunnelStateFile state_file_;

    mutable std::mutex mutex_;
    std::shared_ptr<Active> active_;
};

} // namespace deskpool::transport
