#include "transport/TunnelEstablisher.h"

#include "core/Error.h"
#include "logging/Log.h"
#include "networking/PortProbe.h"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exception.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

#include <atomic>
#include <memory>
#include <condition_variable>

namespace deskpool::transport {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bp = boost::process;
using asio::ip::tcp;
using namespace std::chrono_literals;

namespace {

constexpr auto kPortPollInterval = 500ms;
constexpr auto kPortPollTimeout = 1000ms;
constexpr auto kHealthConnectTimeout = 2000ms;

const std::vector<std::string>& failure_signals(TunnelType type) {
    static const std::vector<std::string> ssh = {"Permission denied", "Connection refused",
                                                 "Could not resolve hostname", "Host key verification failed"};
    static const std::vector<std::string> none;
    return type == TunnelType::Ssh ? ssh : none;
}

bool contains_any(const std::string& line, const std::vector<std::string>& needles) {
    for (const auto& n : needles) {
        if (line.find(n) != std::string::npos) return true;
    }
    return false;
}

std::string seconds(std::chrono::milliseconds ms) {
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(ms).count()) + "s";
}

} // namespace

struct TunnelEstablisher::Active : std::enable_shared_from_this<TunnelEstablisher::Active> {
    enum class Phase { Pending, Ready, Failed };

    explicit Active(asio::io_context& ioc) : ioc(ioc), out(ioc), err(ioc), health(ioc) {}

    void on_line(const char* stream, const std::string& line) {
        logging::debug("Tunnel") << to_string(status.type) << " " << stream << ": " << line;
        std::lock_guard<std::mutex> lock(mu);
        if (phase != Phase::Pending) return;
        if (contains_any(line, failure_signals(status.type))) {
            phase = Phase::Failed;
            failure = line;
        } else if (contains_any(line, ready_signals(status.type))) {
            phase = Phase::Ready;
        }
        cv.notify_all();
    }

    void on_stream_closed() {
        std::lock_guard<std::mutex> lock(mu);
        if (++closed_streams < 2) return;
        if (phase == Phase::Pending) {
            phase = Phase::Failed;
            if (failure.empty()) failure = "transport process exited before it was ready";
        } else if (!closed) {
            degraded = true;
            logging::warn("Tunnel") << to_string(status.type) << " tunnel process for " << status.target << " exited";
        }
        cv.notify_all();
    }

    // Waits until the phase leaves Pending or `until` passes.
    Phase wait(std::chrono::steady_clock::time_point until) {
        std::unique_lock<std::mutex> lock(mu);
        cv.wait_until(lock, until, [this] { return phase != Phase::Pending; });
        return phase;
    }

    std::string failure_text() {
        std::lock_guard<std::mutex> lock(mu);
        return failure;
    }

    void mark_ready() {
        std::lock_guard<std::mutex> lock(mu);
        if (phase == Phase::Pending) phase = Phase::Ready;
    }

    void read_lines(bp::async_pipe& pipe, asio::streambuf& buf, const char* name) {
        asio::async_read_until(pipe, buf, '\n',
            [self = shared_from_this(), &pipe, &buf, name](const boost::system::error_code& ec, std::size_t n) {
                auto take = [&buf](std::size_t count) {
                    auto begin = asio::buffers_begin(buf.data());
                    std::string line(begin, begin + static_cast<std::ptrdiff_t>(count));
                    buf.consume(count);
                    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
                    return line;
                };

                if (!ec) {
                    self->on_line(name, take(n));
                    self->read_lines(pipe, buf, name);
                    return;
                }
                if (buf.size() > 0) self->on_line(name, take(buf.size()));
                self->on_stream_closed();
            });
    }

    // Stops the process and the io-side work. Safe to call more than once.
    void shutdown() {
        if (closed.exchange(true)) return;

        std::error_code ec;
        child.terminate(ec);
        if (ec) logging::debug("Tunnel") << "terminate: " << ec.message();

        asio::post(ioc, [self = shared_from_this()] {
            self->health.cancel();
            std::error_code close_ec;
            if (self->out.is_open()) self->out.close(close_ec);
            if (self->err.is_open()) self->err.close(close_ec);
            if (close_ec) logging::debug("Tunnel") << "pipe close: " << close_ec.message();
        });
    }

    // Connects to the local port every `interval`; a failure only flags the
    // tunnel as degraded.
    void schedule_health_check(std::chrono::milliseconds interval) {
        asio::post(ioc, [self = shared_from_this(), interval] {
            if (self->closed) return;
            self->health.expires_after(interval);
            self->health.async_wait([self, interval](const boost::system::error_code& ec) {
                if (ec || self->closed) return;
                self->check_health(interval);
            });
        });
    }

    void check_health(std::chrono::milliseconds interval) {
        const std::uint16_t port = *status.local_port;
        auto stream = std::make_shared<beast::tcp_stream>(ioc);
        stream->expires_after(kHealthConnectTimeout);
        stream->async_connect(tcp::endpoint(asio::ip::address_v4::loopback(), port),
            [self = shared_from_this(), stream, port, interval](const boost::system::error_code& ec) {
                if (self->closed) return;
                const bool was_degraded = self->degraded.exchange(static_cast<bool>(ec));
                if (ec && !was_degraded) {
                    logging::warn("Tunnel") << "health check failed on port " << port << ": " << ec.message();
                } else if (!ec && was_degraded) {
                    logging::info("Tunnel") << "port " << port << " reachable again";
                }
                beast::error_code close_ec;
                stream->socket().close(close_ec);
                self->schedule_health_check(interval);
            });
    }

    asio::io_context& ioc;
    TunnelStatus status;

    bp::async_pipe out;
    bp::async_pipe err;
    asio::streambuf out_buf;
    asio::streambuf err_buf;
    bp::child child;

    asio::steady_timer health;

    std::atomic<bool> closed{false};
    std::atomic<bool> degraded{false};

    std::mutex mu;
    std::condition_variable cv;
    Phase phase = Phase::Pending;
    std::string failure;
    int closed_streams = 0;
};

TunnelEstablisher::TunnelEstablisher(asio::io_context& ioc, TunnelOptions options)
    : ioc_(ioc), options_(std::move(options)), state_file_(options_.state_file) {}

TunnelEstablisher::~TunnelEstablisher() {
    close();
}

TunnelEndpoint TunnelEstablisher::establish(const TunnelRequest& request) {
    close();

    const TunnelType type = resolve_tunnel_type(request);
    auto active = std::make_shared<Active>(ioc_);
    active->status.type = type;
    active->status.remote_port = request.remote_port;
    active->status.target = request.target_name();
    active->status.started_at = std::chrono::system_clock::now();

    TunnelEndpoint endpoint;
    endpoint.type = type;

    if (type == TunnelType::Direct) {
        if (request.host.empty()) {
            throw Error(Errc::InvalidArgument, "direct transport requires a host");
        }
        endpoint.host = request.host;
        endpoint.port = request.remote_port;
        active->mark_ready();
        logging::info("Tunnel") << "direct connection to " << request.host << ":" << request.remote_port;
    } else {
        const std::uint16_t local_port = find_free_port(options_.base_local_port);
        const CommandLine cmd = build_command(type, request, local_port, options_);
        active->status.local_port = local_port;

        logging::info("Tunnel") << "starting " << to_string(type) << " tunnel to " << active->status.target
                                << " via 127.0.0.1:" << local_port;
        spawn(*active, cmd);
        active->read_lines(active->out, active->out_buf, "stdout");
        active->read_lines(active->err, active->err_buf, "stderr");

        try {
            if (type == TunnelType::Ssh) wait_for_port(*active, local_port);
            else wait_for_signal(*active);
        } catch (const Error&) {
            active->shutdown();
            throw;
        }

        endpoint.host = "127.0.0.1";
        endpoint.port = local_port;
        endpoint.local_port = local_port;
        logging::info("Tunnel") << to_string(type) << " tunnel ready on 127.0.0.1:" << local_port;
    }

    active->status.active = true;
    active->status.endpoint = (request.remote_port == 443 ? "https://" : "http://") + endpoint.host + ":" +
                              std::to_string(endpoint.port);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = active;
    }
    if (endpoint.local_port) {
        state_file_.write(active->status);
        if (options_.health_interval.count() > 0) active->schedule_health_check(options_.health_interval);
    }
    return endpoint;
}

void TunnelEstablisher::close() {
    std::shared_ptr<Active> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active.swap(active_);
    }
    if (!active) return;

    logging::info("Tunnel") << "closing " << to_string(active->status.type) << " tunnel to " << active->status.target;
    active->shutdown();
    if (active->status.local_port) state_file_.remove(*active->status.local_port);
}

TunnelStatus TunnelEstablisher::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return TunnelStatus{};
    TunnelStatus s = active_->status;
    s.degraded = active_->degraded.load();
    return s;
}

void TunnelEstablisher::spawn(Active& active, const CommandLine& cmd) {
    boost::filesystem::path exe(cmd.program);
    if (exe.parent_path().empty()) exe = bp::search_path(cmd.program);
    if (exe.empty()) {
        throw Error(Errc::TransportError, "'" + cmd.program + "' not found on PATH");
    }

    try {
        active.child = bp::child(exe, bp::args(cmd.args),
                                 bp::std_out > active.out,
                                 bp::std_err > active.err,
                                 bp::std_in < bp::null);
    } catch (const bp::process_error& e) {
        throw Error(Errc::TransportError, "failed to start " + cmd.program + ": " + e.what());
    }
}

void TunnelEstablisher::wait_for_signal(Active& active) {
    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    switch (active.wait(deadline)) {
        case Active::Phase::Ready:
            return;
        case Active::Phase::Failed:
            throw Error(Errc::TransportError, std::string(to_string(active.status.type)) + " tunnel failed: " +
                                                  active.failure_text());
        case Active::Phase::Pending:
            break;
    }
    throw Error(Errc::TransportTimeout, std::string(to_string(active.status.type)) + " tunnel not ready within " +
                                            seconds(options_.timeout));
}

void TunnelEstablisher::wait_for_port(Active& active, std::uint16_t port) {
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + options_.timeout;

    auto fail_if_failed = [&active](Active::Phase phase) {
        if (phase == Active::Phase::Failed) {
            throw Error(Errc::TransportError, "ssh tunnel failed: " + active.failure_text());
        }
    };

    // ssh -N prints nothing on success; give it time to authenticate first.
    fail_if_failed(active.wait(std::min(start + options_.ssh_settle, deadline)));

    while (true) {
        if (networking::port_open("127.0.0.1", port, kPortPollTimeout)) {
            active.mark_ready();
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        fail_if_failed(active.wait(std::min(now + kPortPollInterval, deadline)));
    }
    throw Error(Errc::TransportTimeout, "ssh tunnel port " + std::to_string(port) + " not open within " +
                                            seconds(options_.timeout));
}

} // namespace deskpool::transport
