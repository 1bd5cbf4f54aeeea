#include "config/AppConfig.h"

#include "core/Error.h"
#include "logging/Log.h"
#include "networking/Url.h"
#include "session/Session.h"

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace deskpool::config {

namespace json = boost::json;

namespace {

[[noreturn]] void bad(const std::string& key, const char* expected) {
    throw Error(Errc::InvalidArgument, "config: '" + key + "' must be " + expected);
}

// Reads `obj[key]` into `out` when present.
class Reader {
public:
    Reader(const json::object& obj, std::string section) : obj_(obj), section_(std::move(section)) {}

    void get(const char* key, std::string& out) const {
        if (const json::value* v = find(key)) {
            if (!v->is_string()) bad(name(key), "a string");
            out = std::string(v->get_string());
        }
    }

    void get(const char* key, bool& out) const {
        if (const json::value* v = find(key)) {
            if (!v->is_bool()) bad(name(key), "a boolean");
            out = v->get_bool();
        }
    }

    void get(const char* key, double& out) const {
        if (const json::value* v = find(key)) {
            if (v->is_double()) out = v->get_double();
            else if (v->is_int64()) out = static_cast<double>(v->get_int64());
            else if (v->is_uint64()) out = static_cast<double>(v->get_uint64());
            else bad(name(key), "a number");
        }
    }

    void get(const char* key, unsigned& out) const {
        out = static_cast<unsigned>(integer(key, out, std::numeric_limits<unsigned>::max()));
    }

    void get(const char* key, std::uint16_t& out) const {
        out = static_cast<std::uint16_t>(integer(key, out, 65535));
    }

private:
    const json::value* find(const char* key) const {
        const json::value* v = obj_.if_contains(key);
        return (v && !v->is_null()) ? v : nullptr;
    }

    std::string name(const char* key) const {
        return section_.empty() ? key : section_ + "." + key;
    }

    std::uint64_t integer(const char* key, std::uint64_t current, std::uint64_t max) const {
        const json::value* v = find(key);
        if (!v) return current;
        if (v->is_int64() && v->get_int64() >= 0 && static_cast<std::uint64_t>(v->get_int64()) <= max) {
            return static_cast<std::uint64_t>(v->get_int64());
        }
        if (v->is_uint64() && v->get_uint64() <= max) return v->get_uint64();
        bad(name(key), "a non-negative integer in range");
    }

    const json::object& obj_;
    std::string section_;
};

const json::object* section(const json::object& root, const char* key) {
    const json::value* v = root.if_contains(key);
    if (!v || v->is_null()) return nullptr;
    if (!v->is_object()) bad(key, "an object");
    return &v->get_object();
}

} // namespace

std::string default_state_file() {
    const char* home = std::getenv("HOME");
    return std::string(home && *home ? home : "/tmp") + "/.deskpool/tunnel-state.json";
}

AppConfig AppConfig::from_json(const std::string& text) {
    boost::system::error_code ec;
    json::value doc = json::parse(text, ec);
    if (ec) throw Error(Errc::InvalidArgument, "config: " + ec.message());
    if (!doc.is_object()) throw Error(Errc::InvalidArgument, "config: top level must be an object");
    const json::object& root = doc.get_object();

    AppConfig cfg;
    Reader(root, "").get("log_level", cfg.log_level);

    if (const json::object* s = section(root, "server")) {
        Reader r(*s, "server");
        r.get("port", cfg.server.port);
        r.get("io_threads", cfg.server.io_threads);
        r.get("worker_threads", cfg.server.worker_threads);
    }
    if (const json::object* s = section(root, "orchestrator")) {
        Reader r(*s, "orchestrator");
        auto& o = cfg.orchestrator;
        r.get("max_sessions", o.max_sessions);
        r.get("readiness_timeout_s", o.readiness_timeout_s);
        r.get("probe_interval_s", o.probe_interval_s);
        r.get("probe_attempt_timeout_s", o.probe_attempt_timeout_s);
        r.get("probe_mode", o.probe_mode);
        r.get("control_port", o.control_port);
        r.get("control_path", o.control_path);
        r.get("control_tls", o.control_tls);
        r.get("step_delay_scale", o.step_delay_scale);
        r.get("max_frame_width", o.max_frame_width);
        r.get("idle_timeout_s", o.idle_timeout_s);
        r.get("default_kind", o.default_kind);
        r.get("default_region", o.default_region);
    }
    if (const json::object* s = section(root, "provider")) {
        Reader r(*s, "provider");
        r.get("api_base", cfg.provider.api_base);
        r.get("api_key", cfg.provider.api_key);
        r.get("timeout_s", cfg.provider.timeout_s);
    }
    if (const json::object* s = section(root, "fleet")) {
        Reader r(*s, "fleet");
        r.get("enabled", cfg.fleet.enabled);
        r.get("registrar_url", cfg.fleet.registrar_url);
        r.get("heartbeat_interval_s", cfg.fleet.heartbeat_interval_s);
        r.get("timeout_s", cfg.fleet.timeout_s);
    }
    if (const json::object* s = section(root, "tunnel")) {
        Reader r(*s, "tunnel");
        auto& t = cfg.tunnel;
        r.get("base_local_port", t.base_local_port);
        r.get("timeout_s", t.timeout_s);
        r.get("health_interval_s", t.health_interval_s);
        r.get("ssh_settle_ms", t.ssh_settle_ms);
        r.get("gcloud_program", t.gcloud_program);
        r.get("ssh_program", t.ssh_program);
        r.get("cloudflared_program", t.cloudflared_program);
        r.get("state_file", t.state_file);
    }
    if (const json::object* s = section(root, "export")) {
        Reader r(*s, "export");
        r.get("enabled", cfg.exports.enabled);
        r.get("status_file", cfg.exports.status_file);
    }
    return cfg;
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw Error(Errc::InvalidArgument, "config: cannot open " + path);
    std::ostringstream text;
    text << in.rdbuf();
    logging::debug("Config") << "loaded " << path;
    return from_json(text.str());
}

bool AppConfig::validate(std::string& why) const {
    if (server.port == 0) { why = "server.port must be non-zero"; return false; }
    if (server.io_threads == 0) { why = "server.io_threads must be at least 1"; return false; }
    if (server.worker_threads == 0) { why = "server.worker_threads must be at least 1"; return false; }
    if (orchestrator.max_sessions == 0) { why = "orchestrator.max_sessions must be at least 1"; return false; }
    if (orchestrator.readiness_timeout_s == 0) { why = "orchestrator.readiness_timeout_s must be positive"; return false; }
    if (orchestrator.probe_interval_s == 0) { why = "orchestrator.probe_interval_s must be positive"; return false; }
    if (orchestrator.probe_mode != "websocket" && orchestrator.probe_mode != "tcp") {
        why = "orchestrator.probe_mode must be 'websocket' or 'tcp'";
        return false;
    }
    if (orchestrator.control_port == 0) { why = "orchestrator.control_port must be non-zero"; return false; }
    if (orchestrator.control_path.empty() || orchestrator.control_path[0] != '/') {
        why = "orchestrator.control_path must start with '/'";
        return false;
    }
    if (orchestrator.step_delay_scale < 0.0) { why = "orchestrator.step_delay_scale must not be negative"; return false; }
    try {
        session::parse_os_kind(orchestrator.default_kind);
        session::parse_region(orchestrator.default_region);
    } catch (const Error& e) {
        why = std::string("orchestrator: ") + e.what();
        return false;
    }
    if (!logging::parse_level(log_level)) { why = "log_level must be debug, info, warn or error"; return false; }
    if (fleet.enabled && fleet.registrar_url.empty()) {
        why = "fleet.registrar_url is required when fleet.enabled";
        return false;
    }
    try {
        networking::parse_url(provider.api_base);
    } catch (const Error& e) {
        why = std::string("provider.api_base: ") + e.what();
        return false;
    }
    if (fleet.enabled) {
        try {
            networking::parse_url(fleet.registrar_url);
        } catch (const Error& e) {
            why = std::string("fleet.registrar_url: ") + e.what();
            return false;
        }
    }
    if (fleet.heartbeat_interval_s == 0) { why = "fleet.heartbeat_interval_s must be positive"; return false; }
    if (tunnel.timeout_s == 0) { why = "tunnel.timeout_s must be positive"; return false; }
    if (tunnel.base_local_port == 0) { why = "tunnel.base_local_port must be non-zero"; return false; }
    if (exports.enabled && exports.status_file.empty()) {
        why = "export.status_file is required when export.enabled";
        return false;
    }
    return true;
}

} // namespace deskpool::config
