#include "transport/Tunnel.h"

#include "core/Error.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace deskpool::transport {

namespace asio = boost::asio;
using asio::ip::tcp;

std::string_view to_string(TunnelType type) noexcept {
    switch (type) {
        case TunnelType::Auto:   return "auto";
        case TunnelType::Direct: return "direct";
        case TunnelType::Ssh:    return "ssh";
        case TunnelType::Iap:    return "iap";
        case TunnelType::Relay:  return "relay";
    }
    return "unknown";
}

TunnelType parse_tunnel_type(std::string_view name) {
    for (TunnelType t : {TunnelType::Auto, TunnelType::Direct, TunnelType::Ssh, TunnelType::Iap, TunnelType::Relay}) {
        if (to_string(t) == name) return t;
    }
    throw Error(Errc::InvalidArgument, "unknown transport type '" + std::string(name) + "'");
}

std::string TunnelRequest::target_name() const {
    if (!vm_name.empty()) return vm_name;
    if (!host.empty()) return host;
    return relay_hostname;
}

TunnelType resolve_tunnel_type(const TunnelRequest& request) {
    if (request.type != TunnelType::Auto) return request.type;
    if (!request.zone.empty() && !request.vm_name.empty()) return TunnelType::Iap;
    if (!request.host.empty()) return TunnelType::Ssh;
    throw Error(Errc::AmbiguousTransport, "cannot determine transport type: need zone + vm_name or host");
}

CommandLine build_command(TunnelType type, const TunnelRequest& request, std::uint16_t local_port,
                          const TunnelOptions& options) {
    CommandLine cmd;
    const std::string local = std::to_string(local_port);

    switch (type) {
        case TunnelType::Iap:
            cmd.program = options.gcloud_program;
            cmd.args = {"compute", "start-iap-tunnel", request.vm_name, std::to_string(request.remote_port),
                        "--local-host-port", "localhost:" + local, "--zone", request.zone};
            if (!request.project.empty()) {
                cmd.args.push_back("--project");
                cmd.args.push_back(request.project);
            }
            break;

        case TunnelType::Ssh:
            cmd.program = options.ssh_program;
            cmd.args = {"-N",
                        "-L", local + ":localhost:" + std::to_string(request.remote_port),
                        "-p", std::to_string(request.ssh_port),
                        "-o", "StrictHostKeyChecking=no",
                        "-o", "ServerAliveInterval=30",
                        "-o", "ServerAliveCountMax=3",
                        "-o", "ExitOnForwardFailure=yes"};
            if (!request.identity_file.empty()) {
                cmd.args.push_back("-i");
                cmd.args.push_back(request.identity_file);
            }
            cmd.args.push_back(request.username.empty() ? request.host : request.username + "@" + request.host);
            break;

        case TunnelType::Relay:
            cmd.program = options.cloudflared_program;
            cmd.args = {"access", "tcp", "--hostname", request.relay_hostname, "--url", "127.0.0.1:" + local};
            break;

        case TunnelType::Auto:
        case TunnelType::Direct:
            throw Error(Errc::InvalidArgument,
                        "no transport process for type " + std::string(to_string(type)));
    }
    return cmd;
}

const std::vector<std::string>& ready_signals(TunnelType type) {
    static const std::vector<std::string> iap = {"Listening on port", "tunnel is running"};
    static const std::vector<std::string> relay = {"Registered tunnel", "Connection registered",
                                                   "Start Websocket listener"};
    static const std::vector<std::string> none;
    switch (type) {
        case TunnelType::Iap:   return iap;
        case TunnelType::Relay: return relay;
        default:                return none;
    }
}

std::uint16_t find_free_port(std::uint16_t start, unsigned max_probes) {
    asio::io_context ioc;
    for (unsigned i = 0; i < max_probes && start + i <= 65535u; ++i) {
        const auto candidate = static_cast<std::uint16_t>(start + i);

        tcp::acceptor acceptor(ioc);
        boost::system::error_code ec;
        acceptor.open(tcp::v4(), ec);
        if (ec) continue;
        acceptor.bind(tcp::endpoint(asio::ip::address_v4::loopback(), candidate), ec);
        if (!ec) return candidate;
    }
    throw Error(Errc::TransportError, "no free local port in [" + std::to_string(start) + ", " +
                                          std::to_string(start + max_probes) + ")");
}

} // namespace deskpool::transport
