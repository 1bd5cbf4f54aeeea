#pragma once

#include "fleet/FleetRegistrar.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace deskpool::fleet {

struct HeartbeatState {
    bool busy = false;
    std::optional<std::string> current_task;
};

// One periodic liveness push per session. Timers run on the shared
// io_context; the pushes themselves go out on a small sender pool so a slow
// registrar never stalls other I/O.
class HeartbeatReporter {
public:
    // Returns nullopt once the session is gone; its timer then stops itself.
    using StateSource = std::function<std::optional<HeartbeatState>(const std::string& id)>;

    HeartbeatReporter(boost::asio::io_context& ioc, FleetRegistrar& registrar,
                      std::chrono::milliseconds interval, StateSource source);
    ~HeartbeatReporter();

    HeartbeatReporter(const HeartbeatReporter&) = delete;
    HeartbeatReporter& operator=(const HeartbeatReporter&) = delete;

    // Pushes once right away, then every interval. No-op if already running.
    void start(const std::string& id);

    // No pushes for `id` happen after this returns. Unknown ids are ignored.
    void cancel(const std::string& id);
    void cancel_all();

    bool active(const std::string& id) const;
    std::size_t active_count() const;

private:
    struct Entry;

    void schedule(const std::shared_ptr<Entry>& entry);
    void push(const std::shared_ptr<Entry>& entry);

    boost::asio::io_context& ioc_;
    FleetRegistrar& registrar_;
    std::chrono::milliseconds interval_;
    StateSource source_;
    boost::asio::thread_pool sender_{2};

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace deskpool::fleet
