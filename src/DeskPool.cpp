#include "config/AppConfig.h"
#include "core/Error.h"
#include "fleet/HttpFleetRegistrar.h"
#include "logging/Log.h"
#include "networking/CommandRouter.h"
#include "networking/WebSocketServer.h"
#include "orchestrator/Events.h"
#include "orchestrator/JsonViews.h"
#include "orchestrator/SessionOrchestrator.h"
#include "orchestrator/StatusExporter.h"
#include "provider/CloudProviderApi.h"
#include "transport/Transport.h"
#include "transport/TunnelStateFile.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/json.hpp>

#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

namespace json = boost::json;
namespace asio = boost::asio;
using namespace deskpool;
using std::chrono::milliseconds;
using std::chrono::seconds;

static constexpr std::string_view kUsage =
    "usage: deskpool [--config FILE] [--port N] [--log-level debug|info|warn|error]\n"
    "       deskpool tunnel-status [--state-file FILE]\n"
    "       deskpool --help\n";

struct CommandLine {
    std::string command = "serve";
    std::string config_file;
    std::string state_file;
    std::optional<std::uint16_t> port;
    std::optional<std::string> log_level;
    bool help = false;
};

static CommandLine parse_args(int argc, char** argv) {
    CommandLine cl;
    int i = 1;
    if (argc > 1 && std::string(argv[1]) == "tunnel-status") {
        cl.command = "tunnel-status";
        i = 2;
    }

    auto value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw Error(Errc::InvalidArgument, flag + " needs a value");
        return argv[++i];
    };

    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cl.help = true;
        } else if (arg == "--config" && cl.command == "serve") {
            cl.config_file = value(arg);
        } else if (arg == "--port" && cl.command == "serve") {
            const std::string text = value(arg);
            char* end = nullptr;
            const long port = std::strtol(text.c_str(), &end, 10);
            if (*end != '\0' || port <= 0 || port > 65535) {
                throw Error(Errc::InvalidArgument, "--port must be 1-65535");
            }
            cl.port = static_cast<std::uint16_t>(port);
        } else if (arg == "--log-level" && cl.command == "serve") {
            cl.log_level = value(arg);
        } else if (arg == "--state-file" && cl.command == "tunnel-status") {
            cl.state_file = value(arg);
        } else {
            throw Error(Errc::InvalidArgument, "unknown argument '" + arg + "'");
        }
    }
    return cl;
}

static int tunnel_status(const CommandLine& cl) {
    const std::string path = cl.state_file.empty() ? config::default_state_file() : cl.state_file;
    const auto state = transport::TunnelStateFile::read(path);
    const json::value* tunnels = state ? state->if_contains("tunnels") : nullptr;
    if (!tunnels || !tunnels->is_object() || tunnels->as_object().empty()) {
        std::cout << "no active tunnel (" << path << ")\n";
        return 1;
    }
    std::cout << json::serialize(*state) << "\n";
    return 0;
}

static int serve(config::AppConfig cfg) {
    if (const char* key = std::getenv("DESKPOOL_API_KEY"); key && *key && cfg.provider.api_key.empty()) {
        cfg.provider.api_key = key;
    }
    if (cfg.tunnel.state_file.empty()) cfg.tunnel.state_file = config::default_state_file();
    if (cfg.provider.api_key.empty()) {
        logging::warn("DeskPool") << "no provider API key configured; create requests will fail";
    }

    asio::io_context ioc;
    auto work = asio::make_work_guard(ioc);

    provider::CloudProviderApi provider(cfg.provider.api_base, cfg.provider.api_key,
                                        seconds(cfg.provider.timeout_s));

    transport::TunnelOptions tunnel;
    tunnel.base_local_port = cfg.tunnel.base_local_port;
    tunnel.timeout = seconds(cfg.tunnel.timeout_s);
    tunnel.health_interval = seconds(cfg.tunnel.health_interval_s);
    tunnel.ssh_settle = milliseconds(cfg.tunnel.ssh_settle_ms);
    tunnel.gcloud_program = cfg.tunnel.gcloud_program;
    tunnel.ssh_program = cfg.tunnel.ssh_program;
    tunnel.cloudflared_program = cfg.tunnel.cloudflared_program;
    tunnel.state_file = cfg.tunnel.state_file;

    transport::ControlSettings control;
    control.path = cfg.orchestrator.control_path;
    control.tls = cfg.orchestrator.control_tls;
    control.api_key = cfg.provider.api_key;
    transport::TunnelTransportFactory transports(ioc, tunnel, control);

    std::unique_ptr<fleet::HttpFleetRegistrar> registrar;
    if (cfg.fleet.enabled) {
        registrar = std::make_unique<fleet::HttpFleetRegistrar>(cfg.fleet.registrar_url, seconds(cfg.fleet.timeout_s));
    }

    orchestrator::OrchestratorConfig ocfg;
    ocfg.max_sessions = cfg.orchestrator.max_sessions;
    ocfg.readiness_timeout = seconds(cfg.orchestrator.readiness_timeout_s);
    ocfg.probe_mode = cfg.orchestrator.probe_mode == "tcp" ? networking::ProbeMode::Tcp
                                                           : networking::ProbeMode::WebSocket;
    ocfg.control_port = cfg.orchestrator.control_port;
    ocfg.control_path = cfg.orchestrator.control_path;
    ocfg.control_tls = cfg.orchestrator.control_tls;
    ocfg.api_key = cfg.provider.api_key;
    ocfg.step_delay_scale = cfg.orchestrator.step_delay_scale;
    ocfg.max_frame_width = cfg.orchestrator.max_frame_width;
    ocfg.heartbeat_interval = seconds(cfg.fleet.heartbeat_interval_s);
    ocfg.idle_timeout = seconds(cfg.orchestrator.idle_timeout_s);

    orchestrator::OrchestratorDeps deps{provider, transports, ioc, registrar.get()};
    deps.probe_options.interval = seconds(cfg.orchestrator.probe_interval_s);
    deps.probe_options.attempt_timeout = seconds(cfg.orchestrator.probe_attempt_timeout_s);

    orchestrator::SessionOrchestrator orch(ocfg, deps);
    asio::thread_pool workers(cfg.server.worker_threads);
    networking::CommandRouter router(orch, workers, session::parse_os_kind(cfg.orchestrator.default_kind),
                                     session::parse_region(cfg.orchestrator.default_region));

    networking::WebSocketServer server(ioc, cfg.server.port);

    std::unique_ptr<orchestrator::StatusExporter> exporter;
    if (cfg.exports.enabled) {
        exporter = std::make_unique<orchestrator::StatusExporter>(cfg.exports.status_file);
        exporter->write(orch.list(), orch.pool_status());
    }

    orch.set_on_event([&](const orchestrator::Event& e) {
        server.broadcast(json::serialize(orchestrator::to_json(e)));
        if (exporter && e.type != orchestrator::EventType::Frame) {
            exporter->write(orch.list(), orch.pool_status());
        }
    });

    server.set_on_connect([&](networking::ClientId client) {
        json::object hello;
        hello["event"] = "welcome";
        hello["clientId"] = client;
        hello["pool"] = orchestrator::to_json(orch.pool_status());
        server.send(client, json::serialize(hello));
    });

    server.set_on_message([&](networking::ClientId client, const std::string& msg) {
        router.dispatch(msg, [&server, client](const std::string& reply) { server.send(client, reply); });
    });

    server.start();

    std::promise<void> shutdown;
    auto shutdown_requested = shutdown.get_future();
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        logging::info("DeskPool") << "signal " << signo << ", shutting down";
        shutdown.set_value();
    });

    std::vector<std::thread> io_threads;
    for (unsigned i = 0; i < cfg.server.io_threads; ++i) {
        io_threads.emplace_back([&ioc] {
            for (;;) {
                try {
                    ioc.run();
                    break;
                } catch (const std::exception& e) {
                    logging::error("DeskPool") << "io handler failed: " << e.what();
                }
            }
        });
    }

    logging::info("DeskPool") << "service running on port " << server.port() << " (max " << ocfg.max_sessions
                              << " sessions)";
    shutdown_requested.wait();

    server.stop();
    router.shutdown();
    work.reset();
    ioc.stop();
    for (auto& t : io_threads) t.join();

    logging::info("DeskPool") << "exit.";
    return 0;
}

int main(int argc, char** argv) {
    try {
        const CommandLine cl = parse_args(argc, argv);
        if (cl.help) {
            std::cout << kUsage;
            return 0;
        }
        if (cl.command == "tunnel-status") return tunnel_status(cl);

        config::AppConfig cfg = cl.config_file.empty() ? config::AppConfig{} : config::AppConfig::load(cl.config_file);
        if (cl.port) cfg.server.port = *cl.port;
        if (cl.log_level) cfg.log_level = *cl.log_level;

        std::string why;
        if (!cfg.validate(why)) {
            std::cerr << "deskpool: " << why << "\n";
            return 2;
        }
        logging::set_level(*logging::parse_level(cfg.log_level));
        return serve(std::move(cfg));
    } catch (const Error& e) {
        std::cerr << "deskpool: " << e.what() << "\n\n" << kUsage;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "deskpool: " << e.what() << "\n";
        return 1;
    }
}
