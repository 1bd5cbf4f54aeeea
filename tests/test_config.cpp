#include <catch2/catch.hpp>

#include "config/AppConfig.h"
#include "core/Error.h"

using deskpool::Error;
using deskpool::config::AppConfig;

TEST_CASE("Defaults are valid", "[config]") {
    const AppConfig cfg;
    std::string why;
    REQUIRE(cfg.validate(why));
    REQUIRE(cfg.server.port == 9002);
    REQUIRE(cfg.orchestrator.max_sessions == 5);
    REQUIRE(cfg.orchestrator.readiness_timeout_s == 180);
    REQUIRE(cfg.tunnel.base_local_port == 7788);
    REQUIRE(cfg.fleet.heartbeat_interval_s == 30);
}

TEST_CASE("Present keys overlay the defaults", "[config]") {
    const AppConfig cfg = AppConfig::from_json(R"({
        "log_level": "debug",
        "server": {"port": 9100},
        "orchestrator": {"max_sessions": 2, "probe_mode": "tcp", "step_delay_scale": 0},
        "fleet": {"enabled": false},
        "tunnel": {"state_file": "/var/run/deskpool/tunnel.json"},
        "export": {"enabled": true, "status_file": "/tmp/pool.json"}
    })");

    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.server.port == 9100);
    REQUIRE(cfg.server.worker_threads == 4);
    REQUIRE(cfg.orchestrator.max_sessions == 2);
    REQUIRE(cfg.orchestrator.probe_mode == "tcp");
    REQUIRE(cfg.orchestrator.step_delay_scale == 0.0);
    REQUIRE(cfg.orchestrator.control_port == 8443);
    REQUIRE_FALSE(cfg.fleet.enabled);
    REQUIRE(cfg.tunnel.state_file == "/var/run/deskpool/tunnel.json");
    REQUIRE(cfg.exports.enabled);
    REQUIRE(cfg.exports.status_file == "/tmp/pool.json");
}

TEST_CASE("Malformed configuration is rejected", "[config]") {
    REQUIRE_THROWS_AS(AppConfig::from_json("{"), Error);
    REQUIRE_THROWS_AS(AppConfig::from_json("[]"), Error);
    REQUIRE_THROWS_AS(AppConfig::from_json(R"({"server": 5})"), Error);
    REQUIRE_THROWS_AS(AppConfig::from_json(R"({"server": {"port": "9002"}})"), Error);
    REQUIRE_THROWS_AS(AppConfig::from_json(R"({"server": {"port": 70000}})"), Error);
    REQUIRE_THROWS_AS(AppConfig::from_json(R"({"orchestrator": {"max_sessions": -1}})"), Error);
    REQUIRE_THROWS_AS(AppConfig::from_json(R"({"fleet": {"enabled": "yes"}})"), Error);
    REQUIRE_THROWS_AS(AppConfig::load("/nonexistent/deskpool.json"), Error);
}

TEST_CASE("Out of range values fail validation with a reason", "[config]") {
    std::string why;

    AppConfig cfg;
    cfg.orchestrator.max_sessions = 0;
    REQUIRE_FALSE(cfg.validate(why));
    REQUIRE(why.find("max_sessions") != std::string::npos);

    cfg = AppConfig{};
    cfg.orchestrator.probe_mode = "icmp";
    REQUIRE_FALSE(cfg.validate(why));

    cfg = AppConfig{};
    cfg.orchestrator.default_kind = "beos";
    REQUIRE_FALSE(cfg.validate(why));

    cfg = AppConfig{};
    cfg.log_level = "loud";
    REQUIRE_FALSE(cfg.validate(why));

    cfg = AppConfig{};
    cfg.fleet.registrar_url.clear();
    REQUIRE_FALSE(cfg.validate(why));
    cfg.fleet.enabled = false;
    REQUIRE(cfg.validate(why));
}

TEST_CASE("Service URLs must carry a scheme and host", "[config]") {
    std::string why;

    AppConfig cfg;
    cfg.fleet.registrar_url = "registrar.local:9000";
    REQUIRE_FALSE(cfg.validate(why));
    REQUIRE(why.find("fleet.registrar_url") != std::string::npos);
    cfg.fleet.enabled = false;
    REQUIRE(cfg.validate(why));

    cfg = AppConfig{};
    cfg.provider.api_base = "api.cua.ai";
    REQUIRE_FALSE(cfg.validate(why));
    REQUIRE(why.find("provider.api_base") != std::string::npos);

    cfg = AppConfig{};
    cfg.fleet.registrar_url = "http://registrar.local:9000/v1";
    REQUIRE(cfg.validate(why));
}
