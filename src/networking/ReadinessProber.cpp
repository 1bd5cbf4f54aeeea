#include "networking/ReadinessProber.h"

#include "core/Error.h"
#include "logging/Log.h"
#include "networking/BlockingIo.hpp"

#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <algorithm>
#include <thread>

namespace deskpool::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

template <typename WsStream>
bool websocket_handshake(asio::io_context& ioc, WsStream& ws, const ProbeTarget& target,
                         milliseconds timeout) {
    ws.set_option(websocket::stream_base::decorator([&target](websocket::request_type& req) {
        for (const auto& [name, value] : target.headers) req.set(name, value);
    }));

    beast::get_lowest_layer(ws).expires_after(timeout);
    beast::error_code ec = run_one(ioc, [&](auto handler) {
        ws.async_handshake(target.host + ":" + std::to_string(target.port), target.path, handler);
    });
    if (ec) return false;

    beast::get_lowest_layer(ws).expires_after(timeout);
    ec = run_one(ioc, [&](auto handler) { ws.async_close(websocket::close_code::normal, handler); });
    if (ec) logging::debug("Prober") << "close after handshake: " << ec.message();
    return true;
}

// Sleeps up to `d`, returning early when `cancel` is raised.
void pause(milliseconds d, const std::atomic<bool>* cancel) {
    const auto until = Clock::now() + d;
    while (Clock::now() < until) {
        if (cancel && cancel->load()) return;
        std::this_thread::sleep_for(std::min<Clock::duration>(milliseconds(100), until - Clock::now()));
    }
}

} // namespace

std::string ProbeTarget::describe() const {
    if (mode == ProbeMode::Tcp) return "tcp://" + host + ":" + std::to_string(port);
    return std::string(tls ? "wss://" : "ws://") + host + ":" + std::to_string(port) + path;
}

bool probe_endpoint(const ProbeTarget& target, milliseconds timeout) {
    asio::io_context ioc;

    if (target.mode == ProbeMode::Tcp) {
        beast::tcp_stream stream(ioc);
        return !connect(ioc, stream, target.host, target.port, timeout);
    }

    if (target.tls) {
        auto ctx = make_client_tls_context(target.verify_tls);
        websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws(ioc, ctx);
        if (connect(ioc, ws, target.host, target.port, timeout)) return false;
        if (tls_handshake(ioc, ws.next_layer(), target.host, timeout)) return false;
        return websocket_handshake(ioc, ws, target, timeout);
    }

    websocket::stream<beast::tcp_stream> ws(ioc);
    if (connect(ioc, ws, target.host, target.port, timeout)) return false;
    return websocket_handshake(ioc, ws, target, timeout);
}

ReadinessProber::ReadinessProber(Options options, ProbeFn probe)
    : options_(options), probe_(std::move(probe)) {}

ReadinessProber::Result ReadinessProber::wait_ready(const ProbeTarget& target, milliseconds timeout,
                                                    const std::atomic<bool>* cancel) const {
    const auto start = Clock::now();
    const auto deadline = start + timeout;
    const auto interval = std::max(options_.interval, milliseconds(1));
    const auto max_attempts = std::max<long long>(1, (timeout.count() + interval.count() - 1) / interval.count());

    Result result;
    for (long long i = 0; i < max_attempts; ++i) {
        if (i > 0) pause(interval, cancel);
        if (cancel && cancel->load()) {
            throw Error(Errc::NotReady, target.describe() + ": readiness wait cancelled");
        }

        const auto remaining = std::chrono::duration_cast<milliseconds>(deadline - Clock::now());
        if (i > 0 && remaining <= milliseconds::zero()) break;

        ++result.attempts;
        const auto attempt_timeout = std::max(milliseconds(1), std::min(options_.attempt_timeout, remaining));
        if (probe_(target, attempt_timeout)) {
            result.elapsed = std::chrono::duration_cast<milliseconds>(Clock::now() - start);
            logging::info("Prober") << target.describe() << " is ready ("
                                    << result.elapsed.count() / 1000 << "s, "
                                    << result.attempts << " attempts)";
            return result;
        }
        logging::debug("Prober") << "waiting for " << target.describe() << " ("
                                 << std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - start).count()
                                 << "s)";
    }

    throw Error(Errc::NotReady, target.describe() + " not ready after " +
                                    std::to_string(timeout.count() / 1000) + "s (" +
                                    std::to_string(result.attempts) + " attempts)");
}

} // namespace deskpool::networking
