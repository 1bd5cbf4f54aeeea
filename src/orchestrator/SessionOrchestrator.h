#pragma once

#include "core/IDGenerator.hpp"
#include "fleet/FleetRegistrar.h"
#include "fleet/HeartbeatReporter.h"
#include "imaging/FrameResizer.h"
#include "networking/ReadinessProber.h"
#include "orchestrator/Events.h"
#include "provider/ProviderApi.h"
#include "session/Action.h"
#include "session/SessionRegistry.h"
#include "transport/Transport.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace deskpool::orchestrator {

struct OrchestratorConfig {
    std::size_t max_sessions = 5;
    std::chrono::milliseconds readiness_timeout{180000};
    networking::ProbeMode probe_mode = networking::ProbeMode::WebSocket;
    std::uint16_t control_port = 8443;
    std::string control_path = "/ws";
    bool control_tls = true;
    std::string api_key;                            // X-API-Key on readiness handshakes
    double step_delay_scale = 1.0;                  // 0 skips UI settle waits
    std::size_t max_frame_width = 1200;
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds idle_timeout{0};      // 0 disables the idle reaper
};

struct OrchestratorDeps {
    provider::ProviderApi& provider;
    transport::TransportFactory& transports;
    boost::asio::io_context& ioc;
    fleet::FleetRegistrar* registrar = nullptr;     // nullptr: no fleet reporting
    networking::ReadinessProber::Options probe_options{};
    networking::ReadinessProber::ProbeFn probe = networking::probe_endpoint;
};

// Owns the lifecycle of every session: provisioning, readiness, transport,
// heartbeats, action/task execution and teardown. All public operations block
// and are safe to call from any number of threads, except from the threads
// running the io_context.
class SessionOrchestrator {
public:
    using EventHandler = std::function<void(const Event&)>;

    SessionOrchestrator(OrchestratorConfig config, OrchestratorDeps deps);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // Called synchronously from whichever thread raised the event.
    void set_on_event(EventHandler handler);

    // Throws ResourceExhausted before touching the registry when full. Any
    // later failure leaves the session queryable in `error` and is rethrown.
    session::Session create(const session::SessionConfig& config);

    // Frame captured after the action. Throws NotFound, InvalidState,
    // InvalidArgument or TransportError (the session is then in `error`).
    session::Frame execute_action(const std::string& id, const session::Action& action);

    // Step failures come back in the result. Throws NotFound or InvalidState
    // when the task cannot start.
    session::TaskResult execute_task(const std::string& id, const std::string& task);

    // Runs the task on every session carrying `tag` concurrently.
    std::vector<session::TaskResult> execute_task_on_tag(const std::string& tag, const std::string& task);

    // Live frame when possible, else the cached one. Throws NotFound.
    std::optional<session::Frame> screenshot(const std::string& id);

    std::optional<session::Session> get(const std::string& id) const;
    std::vector<session::Session> list() const;
    std::vector<session::Session> list_by_tag(const std::string& tag) const;
    std::vector<session::Session> list_by_status(session::Status status) const;
    std::vector<std::string> list_tags() const;

    // Throws NotFound.
    session::Session add_tags(const std::string& id, const std::vector<std::string>& tags);
    session::Session remove_tags(const std::string& id, const std::vector<std::string>& tags);

    // Idempotent; unknown ids are a no-op.
    void stop(const std::string& id);
    void stop_all();

    session::PoolStatus pool_status() const;

    const session::SessionRegistry& registry() const { return registry_; }
    std::size_t active_heartbeats() const;

private:
    struct Runtime;
    class InFlight;

    std::shared_ptr<Runtime> runtime(const std::string& id) const;
    // Throws InvalidState for recently stopped ids, NotFound for the rest.
    std::shared_ptr<Runtime> require_runtime(const std::string& id) const;
    void teardown(const std::string& id, Runtime& rt);
    void fail_create(const std::string& id, Runtime& rt, const std::string& why);

    transport::TunnelRequest tunnel_request(const session::SessionConfig& config,
                                            const provider::ProviderHandle& machine) const;
    networking::ProbeTarget probe_target(const transport::TunnelEndpoint& endpoint) const;
    session::Frame capture_frame(const std::string& id, transport::ControlChannel& channel,
                                 std::string reasoning, std::string last_action);

    bool set_status(const std::string& id, session::Status to);
    void mark_error(const std::string& id, const std::string& why);
    void emit(EventType type, const std::string& id, boost::json::object data = {});
    void settle(std::chrono::milliseconds delay) const;

    void schedule_idle_check();

    OrchestratorConfig config_;
    provider::ProviderApi& provider_;
    transport::TransportFactory& transports_;
    fleet::FleetRegistrar* registrar_;
    boost::asio::io_context& ioc_;

    session::SessionRegistry registry_;
    networking::ReadinessProber prober_;
    imaging::FrameResizer resizer_;
    IDGenerator ids_;
    std::unique_ptr<fleet::HeartbeatReporter> heartbeats_;

    mutable std::mutex runtimes_mu_;
    std::map<std::string, std::shared_ptr<Runtime>> runtimes_;
    std::set<std::string> stopped_;
    std::deque<std::string> stopped_order_;

    std::mutex handler_mu_;
    EventHandler on_event_;

    boost::asio::thread_pool pool_;
    std::shared_ptr<boost::asio::steady_timer> idle_timer_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace deskpool::orchestrator
