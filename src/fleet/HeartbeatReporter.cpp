#include "fleet/HeartbeatReporter.h"

#include "logging/Log.h"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <exception>
#include <vector>

namespace deskpool::fleet {

namespace asio = boost::asio;

struct HeartbeatReporter::Entry {
    Entry(asio::io_context& ioc, std::string session_id) : id(std::move(session_id)), timer(ioc) {}

    std::string id;
    asio::steady_timer timer;

    // Held across a push, so cancel() waits out an in-flight one.
    std::mutex mu;
    bool cancelled = false;
};

HeartbeatReporter::HeartbeatReporter(asio::io_context& ioc, FleetRegistrar& registrar,
                                     std::chrono::milliseconds interval, StateSource source)
    : ioc_(ioc), registrar_(registrar), interval_(interval), source_(std::move(source)) {}

HeartbeatReporter::~HeartbeatReporter() {
    cancel_all();
    sender_.join();
}

void HeartbeatReporter::start(const std::string& id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.count(id)) return;
        entry = std::make_shared<Entry>(ioc_, id);
        entries_.emplace(id, entry);
    }
    logging::debug("Heartbeat") << "started for " << id << " every " << interval_.count() << "ms";

    asio::post(sender_, [this, entry] { push(entry); });
    schedule(entry);
}

void HeartbeatReporter::schedule(const std::shared_ptr<Entry>& entry) {
    asio::post(ioc_, [this, entry] {
        {
            std::lock_guard<std::mutex> lock(entry->mu);
            if (entry->cancelled) return;
        }
        entry->timer.expires_after(interval_);
        entry->timer.async_wait([this, entry](const boost::system::error_code& ec) {
            if (ec) return;
            asio::post(sender_, [this, entry] {
                push(entry);
                schedule(entry);
            });
        });
    });
}

void HeartbeatReporter::push(const std::shared_ptr<Entry>& entry) {
    std::lock_guard<std::mutex> lock(entry->mu);
    if (entry->cancelled) return;

    const std::optional<HeartbeatState> state = source_(entry->id);
    if (!state) {
        entry->cancelled = true;
        logging::debug("Heartbeat") << entry->id << " is gone, stopping";
        return;
    }

    try {
        registrar_.heartbeat(entry->id, state->busy, state->current_task);
    } catch (const std::exception& e) {
        logging::warn("Heartbeat") << "push for " << entry->id << " failed: " << e.what();
    }
}

void HeartbeatReporter::cancel(const std::string& id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return;
        entry = it->second;
        entries_.erase(it);
    }
    {
        std::lock_guard<std::mutex> lock(entry->mu);
        entry->cancelled = true;
    }
    asio::post(ioc_, [entry] { entry->timer.cancel(); });
    logging::debug("Heartbeat") << "cancelled for " << id;
}

void HeartbeatReporter::cancel_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : entries_) ids.push_back(kv.first);
    }
    for (const auto& id : ids) cancel(id);
}

bool HeartbeatReporter::active(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

std::size_t HeartbeatReporter::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace deskpool::fleet
