#include "orchestrator/SessionOrchestrator.h"

#include "core/Base64.hpp"
#include "core/Error.h"
#include "logging/Log.h"
#include "orchestrator/JsonViews.h"
#include "session/TaskParser.h"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <condition_variable>
#include <future>
#include <thread>

namespace deskpool::orchestrator {

namespace asio = boost::asio;
namespace json = boost::json;
using namespace session;
using namespace std::chrono_literals;
using std::chrono::milliseconds;

namespace {

constexpr auto kMaxIdleCheckPeriod = milliseconds(60000);
constexpr std::size_t kStoppedIdsKept = 1024;

std::vector<std::string> capabilities_for(OsKind kind) {
    return {"browser", "compute", "screenshot", std::string(to_string(kind))};
}

std::vector<std::string> unique_tags(const std::vector<std::string>& tags) {
    std::vector<std::string> out;
    for (const auto& t : tags) {
        if (t.empty()) throw Error(Errc::InvalidArgument, "tags must be non-empty");
        if (std::find(out.begin(), out.end(), t) == out.end()) out.push_back(t);
    }
    return out;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) {
        if (!out.empty()) out += '\n';
        out += l;
    }
    return out;
}

} // namespace

// Per-session state that must not live in the registry record: the transport
// and provider handles plus the stop/in-flight bookkeeping.
struct SessionOrchestrator::Runtime {
    std::mutex mu;
    std::condition_variable cv;
    int inflight = 0;
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> stopping{false};

    std::unique_ptr<transport::TransportHandle> transport;
    std::optional<provider::ProviderHandle> machine;
    bool registered = false;
};

// Marks one operation as running on a session. Stop waits for all of them.
class SessionOrchestrator::InFlight {
public:
    explicit InFlight(Runtime& rt) : rt_(rt) {
        std::lock_guard<std::mutex> lock(rt_.mu);
        if (rt_.stop_requested) throw Error(Errc::InvalidState, "session is stopping");
        ++rt_.inflight;
    }

    ~InFlight() {
        {
            std::lock_guard<std::mutex> lock(rt_.mu);
            --rt_.inflight;
        }
        rt_.cv.notify_all();
    }

    InFlight(const InFlight&) = delete;
    InFlight& operator=(const InFlight&) = delete;

private:
    Runtime& rt_;
};

SessionOrchestrator::SessionOrchestrator(OrchestratorConfig config, OrchestratorDeps deps)
    : config_(std::move(config)),
      provider_(deps.provider),
      transports_(deps.transports),
      registrar_(deps.registrar),
      ioc_(deps.ioc),
      registry_(config_.max_sessions),
      prober_(deps.probe_options, std::move(deps.probe)),
      resizer_(config_.max_frame_width),
      pool_(std::max<std::size_t>(2, config_.max_sessions)),
      idle_timer_(std::make_shared<asio::steady_timer>(ioc_)),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
    if (registrar_) {
        heartbeats_ = std::make_unique<fleet::HeartbeatReporter>(
            ioc_, *registrar_, config_.heartbeat_interval,
            [this](const std::string& id) -> std::optional<fleet::HeartbeatState> {
                const auto s = registry_.get(id);
                if (!s || is_terminal(s->status)) return std::nullopt;
                return fleet::HeartbeatState{s->status == Status::Working, s->current_task};
            });
    }
    if (config_.idle_timeout.count() > 0) {
        asio::post(ioc_, [this, alive = alive_] {
            if (*alive) schedule_idle_check();
        });
    }
}

SessionOrchestrator::~SessionOrchestrator() {
    *alive_ = false;
    asio::post(ioc_, [timer = idle_timer_] { timer->cancel(); });
    if (heartbeats_) heartbeats_->cancel_all();
    pool_.join();

    const std::size_t left = registry_.size();
    if (left > 0) {
        logging::warn("Orchestrator") << left << " session(s) still allocated at shutdown";
    }
}

void SessionOrchestrator::set_on_event(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mu_);
    on_event_ = std::move(handler);
}

void SessionOrchestrator::emit(EventType type, const std::string& id, json::object data) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mu_);
        handler = on_event_;
    }
    if (!handler) return;
    try {
        handler(Event{type, id, std::move(data)});
    } catch (const std::exception& e) {
        logging::warn("Orchestrator") << "event handler failed on " << to_string(type) << ": " << e.what();
    }
}

std::shared_ptr<SessionOrchestrator::Runtime> SessionOrchestrator::runtime(const std::string& id) const {
    std::lock_guard<std::mutex> lock(runtimes_mu_);
    auto it = runtimes_.find(id);
    return it == runtimes_.end() ? nullptr : it->second;
}

std::shared_ptr<SessionOrchestrator::Runtime> SessionOrchestrator::require_runtime(const std::string& id) const {
    std::lock_guard<std::mutex> lock(runtimes_mu_);
    auto it = runtimes_.find(id);
    if (it != runtimes_.end()) return it->second;
    if (stopped_.count(id)) throw Error(Errc::InvalidState, "session " + id + " is stopped");
    throw Error(Errc::NotFound, "no session " + id);
}

bool SessionOrchestrator::set_status(const std::string& id, Status to) {
    if (!registry_.transition(id, to)) return false;
    json::object data;
    data["status"] = to_string(to);
    emit(EventType::SessionStatus, id, std::move(data));
    return true;
}

void SessionOrchestrator::mark_error(const std::string& id, const std::string& why) {
    logging::error("Orchestrator") << "session " << id << ": " << why;
    registry_.update(id, [](Session& s) { s.current_task.reset(); });
    set_status(id, Status::Error);

    json::object data;
    data["error"] = why;
    emit(EventType::SessionError, id, std::move(data));
}

void SessionOrchestrator::settle(milliseconds delay) const {
    if (config_.step_delay_scale <= 0.0 || delay.count() <= 0) return;
    std::this_thread::sleep_for(milliseconds(static_cast<long long>(delay.count() * config_.step_delay_scale)));
}

transport::TunnelRequest SessionOrchestrator::tunnel_request(const SessionConfig& config,
                                                             const provider::ProviderHandle& machine) const {
    transport::TunnelRequest req;
    req.remote_port = config_.control_port;

    if (!config.transport) {
        req.type = transport::TunnelType::Direct;
        req.host = machine.host;
        return req;
    }

    const TransportHint& hint = *config.transport;
    req.type = transport::parse_tunnel_type(hint.type);
    req.host = hint.host;
    req.vm_name = hint.vm_name;
    req.zone = hint.zone;
    req.project = hint.project;
    req.username = hint.username;
    req.identity_file = hint.identity_file;
    req.ssh_port = hint.ssh_port;
    req.relay_hostname = hint.relay_hostname;

    // An explicit type may lean on what the provider returned; auto resolves
    // from the caller's fields alone.
    if (req.type != transport::TunnelType::Auto) {
        if (req.host.empty()) req.host = machine.host;
        if (req.vm_name.empty()) req.vm_name = machine.name;
    }
    return req;
}

networking::ProbeTarget SessionOrchestrator::probe_target(const transport::TunnelEndpoint& endpoint) const {
    networking::ProbeTarget target;
    target.host = endpoint.host;
    target.port = endpoint.port;
    target.mode = config_.probe_mode;
    target.tls = config_.control_tls;
    target.verify_tls = !endpoint.local_port;
    target.path = config_.control_path;
    if (!config_.api_key.empty()) target.headers.emplace_back("X-API-Key", config_.api_key);
    return target;
}

Frame SessionOrchestrator::capture_frame(const std::string& id, transport::ControlChannel& channel,
                                         std::string reasoning, std::string last_action) {
    Frame frame;
    frame.session_id = id;
    frame.image_base64 = encode_base64(resizer_.normalize(channel.screenshot()));
    frame.timestamp = Frame::Clock::now();
    frame.reasoning = std::move(reasoning);
    frame.last_action = std::move(last_action);

    emit(EventType::Frame, id, to_json(frame));
    return frame;
}

// ---------------------------------------------------------------------------
// Lifecycle

Session SessionOrchestrator::create(const SessionConfig& config) {
    const std::string id = ids_.session_id();

    Session record;
    record.id = id;
    record.display_name = config.name;
    record.kind = config.kind;
    record.status = Status::Spawning;
    record.tags = unique_tags(config.tags);
    record.size_class = config.size_class;
    record.resources = resources_for(config.size_class);
    record.region = config.region;
    record.created_at = Session::Clock::now();
    record.last_activity_at = record.created_at;

    auto rt = std::make_shared<Runtime>();
    {
        std::lock_guard<std::mutex> lock(runtimes_mu_);
        runtimes_.emplace(id, rt);
    }
    try {
        registry_.insert(record);
    } catch (const Error&) {
        std::lock_guard<std::mutex> lock(runtimes_mu_);
        runtimes_.erase(id);
        throw;
    }

    InFlight guard(*rt);
    logging::info("Orchestrator") << "creating " << id << " (" << to_string(config.kind) << ", "
                                  << to_string(config.size_class) << ")";
    emit(EventType::SessionCreated, id, summary_json(record));

    auto check_stop = [&rt](const char* phase) {
        if (rt->stop_requested) throw Error(Errc::InvalidState, std::string("stopped during ") + phase);
    };

    try {
        provider::ProviderHandle machine = provider_.create_machine(config.kind, config.region, config.size_class);
        rt->machine = machine;
        if (config.name.empty()) {
            registry_.update(id, [&machine](Session& s) { s.display_name = machine.name; });
        }
        check_stop("provisioning");
        if (!set_status(id, Status::SettingUp)) {
            throw Error(Errc::InvalidState, "session left spawning unexpectedly");
        }

        rt->transport = transports_.open(tunnel_request(config, machine));
        check_stop("transport setup");

        const auto target = probe_target(rt->transport->endpoint());
        const auto probe = prober_.wait_ready(target, config_.readiness_timeout, &rt->stop_requested);
        logging::info("Orchestrator") << id << ": " << target.describe() << " reachable after "
                                      << probe.elapsed.count() << "ms (" << probe.attempts << " attempts)";
        check_stop("readiness probing");

        rt->transport->attach();
        if (!set_status(id, Status::Ready)) {
            throw Error(Errc::InvalidState, "session left setting_up unexpectedly");
        }
    } catch (const std::exception& e) {
        fail_create(id, *rt, e.what());
        throw;
    }

    const Session ready = *registry_.get(id);
    if (registrar_ && !rt->stop_requested) {
        try {
            registrar_->register_session(id, ready.display_name, capabilities_for(ready.kind));
        } catch (const std::exception& e) {
            logging::warn("Orchestrator") << id << " fleet registration failed: " << e.what();
        }
        rt->registered = true;
        heartbeats_->start(id);
    }

    logging::info("Orchestrator") << id << " (" << ready.display_name << ") is ready";
    emit(EventType::SessionReady, id, summary_json(ready));
    return ready;
}

void SessionOrchestrator::fail_create(const std::string& id, Runtime& rt, const std::string& why) {
    teardown(id, rt);
    mark_error(id, "create failed: " + why);
}

void SessionOrchestrator::teardown(const std::string& id, Runtime& rt) {
    if (registrar_ && rt.registered) {
        try {
            registrar_->set_offline(id);
        } catch (const std::exception& e) {
            logging::warn("Orchestrator") << id << ": offline report failed: " << e.what();
        }
        rt.registered = false;
    }

    if (rt.transport) {
        try {
            rt.transport->close();
        } catch (const std::exception& e) {
            logging::warn("Orchestrator") << id << ": transport close failed: " << e.what();
        }
        rt.transport.reset();
    }

    if (rt.machine) {
        try {
            provider_.delete_machine(rt.machine->name);
        } catch (const std::exception& e) {
            logging::error("Orchestrator") << id << ": delete of machine " << rt.machine->name
                                           << " failed, leak risk: " << e.what();
        }
        rt.machine.reset();
    }
}

void SessionOrchestrator::stop(const std::string& id) {
    const auto rt = runtime(id);
    if (!rt) {
        // Record without a runtime: nothing remote to release.
        if (registry_.contains(id)) {
            set_status(id, Status::Stopped);
            registry_.erase(id);
            emit(EventType::SessionStopped, id);
        }
        return;
    }
    if (rt->stopping.exchange(true)) return;

    logging::info("Orchestrator") << "stopping " << id;
    {
        std::unique_lock<std::mutex> lock(rt->mu);
        rt->stop_requested = true;
        rt->cv.wait(lock, [&rt] { return rt->inflight == 0; });
    }

    if (heartbeats_) heartbeats_->cancel(id);
    teardown(id, *rt);

    set_status(id, Status::Stopped);
    registry_.erase(id);
    {
        std::lock_guard<std::mutex> lock(runtimes_mu_);
        runtimes_.erase(id);
        if (stopped_.insert(id).second) stopped_order_.push_back(id);
        if (stopped_order_.size() > kStoppedIdsKept) {
            stopped_.erase(stopped_order_.front());
            stopped_order_.pop_front();
        }
    }
    logging::info("Orchestrator") << id << " stopped";
    emit(EventType::SessionStopped, id);
}

void SessionOrchestrator::stop_all() {
    if (heartbeats_) heartbeats_->cancel_all();

    std::vector<std::string> ids;
    for (const auto& s : registry_.list()) ids.push_back(s.id);
    {
        std::lock_guard<std::mutex> lock(runtimes_mu_);
        for (const auto& kv : runtimes_) {
            if (std::find(ids.begin(), ids.end(), kv.first) == ids.end()) ids.push_back(kv.first);
        }
    }
    if (ids.empty()) return;
    logging::info("Orchestrator") << "stopping " << ids.size() << " session(s)";

    std::vector<std::future<void>> pending;
    for (const auto& id : ids) {
        auto job = std::make_shared<std::packaged_task<void()>>([this, id] { stop(id); });
        pending.push_back(job->get_future());
        asio::post(pool_, [job] { (*job)(); });
    }
    for (auto& f : pending) f.get();
}

// ---------------------------------------------------------------------------
// Actions and tasks

Frame SessionOrchestrator::execute_action(const std::string& id, const Action& action) {
    validate(action);

    const auto rt = require_runtime(id);
    InFlight guard(*rt);
    registry_.claim(id, {Status::Ready, Status::Idle}, Status::Working);

    const std::string description = describe(action);
    std::optional<Error> failure;
    std::optional<Frame> frame;
    transport::ControlChannel* channel = nullptr;

    try {
        if (!rt->transport) throw Error(Errc::TransportError, "session has no transport");
        channel = &rt->transport->channel();
        transport::apply(*channel, action);
    } catch (const Error& e) {
        failure = e;
    }

    // A frame is captured even after a failed input, for observability.
    if (channel) {
        try {
            frame = capture_frame(id, *channel, failure ? std::string("Input failed: ") + failure->what() : "",
                                  description);
        } catch (const Error& e) {
            if (!failure) failure = e;
            else logging::warn("Orchestrator") << id << ": frame after failed input also failed: " << e.what();
        }
    }

    registry_.update(id, [&](Session& s) {
        s.touch();
        s.last_action_description = description;
        if (frame) s.last_frame = *frame;
    });

    if (failure) {
        mark_error(id, description + ": " + failure->what());
        throw *failure;
    }
    set_status(id, Status::Idle);
    return *frame;
}

TaskResult SessionOrchestrator::execute_task(const std::string& id, const std::string& task) {
    const auto rt = require_runtime(id);
    InFlight guard(*rt);
    registry_.claim(id, {Status::Ready, Status::Idle}, Status::Working);

    const auto started = std::chrono::steady_clock::now();
    OsKind kind = OsKind::Windows;
    registry_.update(id, [&](Session& s) {
        s.current_task = task;
        s.touch();
        kind = s.kind;
    });
    json::object started_data;
    started_data["task"] = task;
    emit(EventType::TaskStarted, id, std::move(started_data));

    TaskResult result;
    result.session_id = id;
    result.task = task;

    const std::vector<TaskStep> steps = plan_task(parse_task(task), kind);
    std::vector<std::string> outputs;
    bool stopped = false;
    bool failed = false;

    try {
        if (!rt->transport) throw Error(Errc::TransportError, "session has no transport");
        transport::ControlChannel& channel = rt->transport->channel();

        result.frames.push_back(capture_frame(id, channel, "Captured the screen before acting", "Initial state"));
        for (const TaskStep& step : steps) {
            if (rt->stop_requested) {
                stopped = true;
                break;
            }
            for (const TimedAction& timed : step.actions) {
                transport::apply(channel, timed.action);
                settle(timed.settle);
            }
            result.frames.push_back(capture_frame(id, channel, step.reasoning, step.frame_label));
            outputs.push_back(step.summary);
        }
        if (steps.empty()) outputs.push_back("No actionable steps recognized; captured the current screen");
    } catch (const Error& e) {
        failed = true;
        result.error = e.what();
    }

    result.success = !failed && !stopped;
    if (stopped) result.error = "stopped before completion";
    result.output = join_lines(outputs);
    result.duration = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);

    registry_.update(id, [&](Session& s) {
        s.current_task.reset();
        s.touch();
        if (!result.frames.empty()) s.last_frame = result.frames.back();
        if (!outputs.empty()) s.last_action_description = outputs.back();
    });

    json::object data;
    data["task"] = task;
    data["output"] = result.output;
    data["frames"] = result.frames.size();
    data["durationMs"] = result.duration.count();
    if (result.success) {
        set_status(id, Status::Idle);
        emit(EventType::TaskComplete, id, std::move(data));
    } else {
        data["error"] = *result.error;
        if (failed) mark_error(id, "task failed: " + *result.error);
        emit(EventType::TaskFailed, id, std::move(data));
    }
    return result;
}

std::vector<TaskResult> SessionOrchestrator::execute_task_on_tag(const std::string& tag, const std::string& task) {
    const std::vector<Session> targets = registry_.list_by_tag(tag);
    logging::info("Orchestrator") << "running task on " << targets.size() << " session(s) tagged '" << tag << "'";

    std::vector<std::future<TaskResult>> pending;
    for (const auto& s : targets) {
        auto job = std::make_shared<std::packaged_task<TaskResult()>>([this, id = s.id, task] {
            try {
                return execute_task(id, task);
            } catch (const Error& e) {
                TaskResult r;
                r.session_id = id;
                r.task = task;
                r.error = std::string(errc_name(e.code())) + ": " + e.what();
                return r;
            }
        });
        pending.push_back(job->get_future());
        asio::post(pool_, [job] { (*job)(); });
    }

    std::vector<TaskResult> results;
    results.reserve(pending.size());
    for (auto& f : pending) results.push_back(f.get());
    return results;
}

std::optional<Frame> SessionOrchestrator::screenshot(const std::string& id) {
    const auto current = registry_.get(id);
    if (!current) throw Error(Errc::NotFound, "no session " + id);

    const auto rt = runtime(id);
    const Status status = current->status;
    if (rt && (status == Status::Ready || status == Status::Idle || status == Status::Working)) {
        try {
            InFlight guard(*rt);
            if (!rt->transport) throw Error(Errc::TransportError, "session has no transport");
            Frame frame = capture_frame(id, rt->transport->channel(), "On-demand capture",
                                        current->last_action_description);
            registry_.update(id, [&frame](Session& s) { s.last_frame = frame; });
            return frame;
        } catch (const Error& e) {
            logging::warn("Orchestrator") << id << ": live screenshot failed, serving cached frame: " << e.what();
        }
    }

    const auto latest = registry_.get(id);
    return latest ? latest->last_frame : current->last_frame;
}

// ---------------------------------------------------------------------------
// Queries and tags

std::optional<Session> SessionOrchestrator::get(const std::string& id) const {
    return registry_.get(id);
}

std::vector<Session> SessionOrchestrator::list() const {
    return registry_.list();
}

std::vector<Session> SessionOrchestrator::list_by_tag(const std::string& tag) const {
    return registry_.list_by_tag(tag);
}

std::vector<Session> SessionOrchestrator::list_by_status(Status status) const {
    return registry_.list_by_status(status);
}

std::vector<std::string> SessionOrchestrator::list_tags() const {
    return registry_.all_tags();
}

Session SessionOrchestrator::add_tags(const std::string& id, const std::vector<std::string>& tags) {
    auto s = registry_.add_tags(id, unique_tags(tags));
    if (!s) throw Error(Errc::NotFound, "no session " + id);
    return *s;
}

Session SessionOrchestrator::remove_tags(const std::string& id, const std::vector<std::string>& tags) {
    auto s = registry_.remove_tags(id, tags);
    if (!s) throw Error(Errc::NotFound, "no session " + id);
    return *s;
}

PoolStatus SessionOrchestrator::pool_status() const {
    return registry_.pool_status();
}

std::size_t SessionOrchestrator::active_heartbeats() const {
    return heartbeats_ ? heartbeats_->active_count() : 0;
}

// ---------------------------------------------------------------------------
// Idle reaper

void SessionOrchestrator::schedule_idle_check() {
    idle_timer_->expires_after(std::min(config_.idle_timeout, kMaxIdleCheckPeriod));
    idle_timer_->async_wait([this, alive = alive_](const boost::system::error_code& ec) {
        if (ec || !*alive) return;

        const auto now = Session::Clock::now();
        for (const auto& s : registry_.list()) {
            const bool parked = s.status == Status::Ready || s.status == Status::Idle;
            if (!parked || now - s.last_activity_at < config_.idle_timeout) continue;
            logging::info("Orchestrator") << s.id << " idle for over "
                                          << std::chrono::duration_cast<std::chrono::seconds>(config_.idle_timeout).count()
                                          << "s, stopping";
            asio::post(pool_, [this, alive, id = s.id] {
                if (*alive) stop(id);
            });
        }
        schedule_idle_check();
    });
}

} // namespace deskpool::orchestrator
