#pragma once

#include <cstdint>
#include <string>

namespace deskpool::config {

struct ServerConfig {
    std::uint16_t port = 9002;
    unsigned io_threads = 2;
    unsigned worker_threads = 4;
};

struct OrchestratorSection {
    unsigned max_sessions = 5;
    unsigned readiness_timeout_s = 180;
    unsigned probe_interval_s = 5;
    unsigned probe_attempt_timeout_s = 5;
    std::string probe_mode = "websocket";   // websocket | tcp
    std::uint16_t control_port = 8443;
    std::string control_path = "/ws";
    bool control_tls = true;
    double step_delay_scale = 1.0;
    unsigned max_frame_width = 1200;
    unsigned idle_timeout_s = 0;            // 0 disables
    std::string default_kind = "windows";
    std::string default_region = "north-america";
};

struct ProviderSection {
    std::string api_base = "https://api.cua.ai";
    std::string api_key;
    unsigned timeout_s = 30;
};

struct FleetSection {
    bool enabled = true;
    std::string registrar_url = "http://localhost:8080";
    unsigned heartbeat_interval_s = 30;
    unsigned timeout_s = 5;
};

struct TunnelSection {
    std::uint16_t base_local_port = 7788;
    unsigned timeout_s = 60;
    unsigned health_interval_s = 30;
    unsigned ssh_settle_ms = 3000;
    std::string gcloud_program = "gcloud";
    std::string ssh_program = "ssh";
    std::string cloudflared_program = "cloudflared";
    std::string state_file;                 // empty: $HOME/.deskpool/tunnel-state.json
};

struct ExportSection {
    bool enabled = false;
    std::string status_file = "/tmp/deskpool-status.json";
};

struct AppConfig {
    ServerConfig server;
    OrchestratorSection orchestrator;
    ProviderSection provider;
    FleetSection fleet;
    TunnelSection tunnel;
    ExportSection exports;
    std::string log_level = "info";

    // Overlays the keys present in a JSON document onto the defaults.
    // Throws deskpool::Error(Errc::InvalidArgument) on bad JSON or wrong types.
    static AppConfig from_json(const std::string& text);
    static AppConfig load(const std::string& path);

    // False with a reason when a value is out of range.
    bool validate(std::string& why) const;
};

// $HOME/.deskpool/tunnel-state.json, or /tmp when HOME is unset.
std::string default_state_file();

} // namespace deskpool::config
