#include "transport/Transport.h"

#include "core/Error.h"
#include "logging/Log.h"
#include "transport/TunnelEstablisher.h"
#include "transport/WebSocketControlChannel.h"

#include <mutex>

namespace deskpool::transport {

namespace {

class TunnelTransport : public TransportHandle {
public:
    TunnelTransport(boost::asio::io_context& ioc, const TunnelOptions& options, ControlSettings control)
        : establisher_(ioc, options), control_(std::move(control)) {}

    ~TunnelTransport() override {
        close();
    }

    void establish(const TunnelRequest& request) {
        endpoint_ = establisher_.establish(request);
    }

    const TunnelEndpoint& endpoint() const override { return endpoint_; }

    void attach() override {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) throw Error(Errc::TransportError, "transport already closed");
        if (channel_) return;

        ControlEndpoint ep;
        ep.host = endpoint_.host;
        ep.port = endpoint_.port;
        ep.path = control_.path;
        ep.tls = control_.tls;
        ep.verify_tls = control_.verify_tls && !endpoint_.local_port;
        ep.api_key = control_.api_key;
        channel_ = std::make_unique<WebSocketControlChannel>(ep, control_.timeout);
        logging::info("Transport") << "control channel attached at " << ep.describe();
    }

    ControlChannel& channel() override {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) throw Error(Errc::TransportError, "transport closed");
        if (!channel_) throw Error(Errc::TransportError, "control channel not attached");
        return *channel_;
    }

    bool degraded() const override {
        return establisher_.status().degraded;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) return;
        closed_ = true;
        if (channel_) {
            try {
                channel_->close();
            } catch (const Error& e) {
                logging::warn("Transport") << "control channel close failed: " << e.what();
            }
        }
        establisher_.close();
    }

private:
    TunnelEstablisher establisher_;
    ControlSettings control_;
    TunnelEndpoint endpoint_;

    std::mutex mu_;
    bool closed_ = false;
    std::unique_ptr<WebSocketControlChannel> channel_;
};

} // namespace

TunnelTransportFactory::TunnelTransportFactory(boost::asio::io_context& ioc, TunnelOptions tunnel,
                                               ControlSettings control)
    : ioc_(ioc), tunnel_(std::move(tunnel)), control_(std::move(control)) {}

std::unique_ptr<TransportHandle> TunnelTransportFactory::open(const TunnelRequest& request) {
    auto transport = std::make_unique<TunnelTransport>(ioc_, tunnel_, control_);
    transport->establish(request);
    return transport;
}

} // namespace deskpool::transport
