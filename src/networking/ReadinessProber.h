#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace deskpool::networking {

enum class ProbeMode { Tcp, WebSocket };

struct ProbeTarget {
    std::string host;
    std::uint16_t port = 0;
    ProbeMode mode = ProbeMode::Tcp;
    bool tls = false;                   // WebSocket only
    bool verify_tls = true;             // WebSocket only
    std::string path = "/ws";           // WebSocket only
    std::vector<std::pair<std::string, std::string>> headers;

    std::string describe() const;
};

// One connection attempt; every socket it opens is released before it returns.
bool probe_endpoint(const ProbeTarget& target, std::chrono::milliseconds timeout);

// Polls an endpoint until it accepts a connection or the deadline passes.
class ReadinessProber {
public:
    using ProbeFn = std::function<bool(const ProbeTarget&, std::chrono::milliseconds)>;

    struct Options {
        std::chrono::milliseconds interval{5000};
        std::chrono::milliseconds attempt_timeout{5000};
    };

    struct Result {
        std::chrono::milliseconds elapsed{0};
        unsigned attempts = 0;
    };

    explicit ReadinessProber(Options options, ProbeFn probe = probe_endpoint);

    // Makes ceil(timeout / interval) attempts at most, `interval` apart, and
    // never runs past `timeout`. Throws deskpool::Error(Errc::NotReady) when
    // the endpoint never answered or `cancel` was raised.
    Result wait_ready(const ProbeTarget& target, std::chrono::milliseconds timeout,
                      const std::atomic<bool>* cancel = nullptr) const;

    const Options& options() const noexcept { return options_; }

private:
    Options options_;
    ProbeFn probe_;
};

} // namespace deskpool::networking
