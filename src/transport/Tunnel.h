#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deskpool::transport {

enum class TunnelType { Auto, Direct, Ssh, Iap, Relay };

std::string_view to_string(TunnelType type) noexcept;
TunnelType parse_tunnel_type(std::string_view name);    // throws Errc::InvalidArgument

struct TunnelRequest {
    TunnelType type = TunnelType::Auto;
    std::string host;               // direct, ssh
    std::string vm_name;            // iap
    std::string zone;               // iap
    std::string project;            // iap, optional
    std::string username;           // ssh, optional
    std::uint16_t ssh_port = 22;
    std::string identity_file;      // ssh, optional
    std::string relay_hostname;     // relay
    std::uint16_t remote_port = 8080;

    std::string target_name() const;
};

// auto: zone + vm_name -> iap, else host -> ssh, else Errc::AmbiguousTransport.
TunnelType resolve_tunnel_type(const TunnelRequest& request);

struct TunnelOptions {
    std::uint16_t base_local_port = 7788;
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds health_interval{30000};
    std::chrono::milliseconds ssh_settle{3000};
    std::string gcloud_program = "gcloud";
    std::string ssh_program = "ssh";
    std::string cloudflared_program = "cloudflared";
    std::string state_file;         // advisory sidecar; empty disables it
};

struct CommandLine {
    std::string program;
    std::vector<std::string> args;
};

// The process that forwards 127.0.0.1:local_port to the remote control port.
CommandLine build_command(TunnelType type, const TunnelRequest& request, std::uint16_t local_port,
                          const TunnelOptions& options);

// Output fragments that mean the transport process is forwarding.
const std::vector<std::string>& ready_signals(TunnelType type);

// Probes upward from `start`, bind-testing each candidate on 127.0.0.1.
// Throws Errc::TransportError when nothing in range is free.
std::uint16_t find_free_port(std::uint16_t start, unsigned max_probes = 100);

struct TunnelEndpoint {
    TunnelType type = TunnelType::Direct;
    std::string host;
    std::uint16_t port = 0;
    std::optional<std::uint16_t> local_port;
};

struct TunnelStatus {
    bool active = false;
    TunnelType type = TunnelType::Direct;
    std::optional<std::uint16_t> local_port;
    std::uint16_t remote_port = 0;
    std::string endpoint;
    std::string target;
    std::chrono::system_clock::time_point started_at{};
    bool degraded = false;
};

} // namespace deskpool::transport
