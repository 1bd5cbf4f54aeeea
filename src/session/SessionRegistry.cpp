#include "session/SessionRegistry.h"

#include "core/Error.h"
#include "logging/Log.h"

#include <algorithm>
#include <set>

namespace deskpool::session {

SessionRegistry::SessionRegistry(std::size_t capacity) : capacity_(capacity) {}

std::size_t SessionRegistry::occupied_locked() const {
    return static_cast<std::size_t>(std::count_if(
        sessions_.begin(), sessions_.end(),
        [](const auto& kv) { return kv.second.status != Status::Stopped; }));
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return occupied_locked();
}

void SessionRegistry::insert(Session session) {
    std::lock_guard<std::mutex> lk(mu_);
    if (occupied_locked() >= capacity_) {
        throw Error(Errc::ResourceExhausted,
                    "maximum session limit (" + std::to_string(capacity_) + ") reached");
    }
    if (sessions_.count(session.id) != 0) {
        throw Error(Errc::InvalidArgument, "duplicate session id " + session.id);
    }
    std::string id = session.id;
    sessions_.emplace(std::move(id), std::move(session));
}

std::optional<Session> SessionRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

bool SessionRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.count(id) != 0;
}

std::vector<Session> SessionRegistry::list() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Session> out;
    out.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) out.push_back(s);
    return out;
}

std::vector<Session> SessionRegistry::list_by_tag(std::string_view tag) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Session> out;
    for (const auto& [id, s] : sessions_) {
        if (s.has_tag(tag)) out.push_back(s);
    }
    return out;
}

std::vector<Session> SessionRegistry::list_by_status(Status status) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Session> out;
    for (const auto& [id, s] : sessions_) {
        if (s.status == status) out.push_back(s);
    }
    return out;
}

std::vector<std::string> SessionRegistry::all_tags() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::set<std::string> tags;
    for (const auto& [id, s] : sessions_) tags.insert(s.tags.begin(), s.tags.end());
    return {tags.begin(), tags.end()};
}

std::optional<Session> SessionRegistry::add_tags(const std::string& id,
                                                 const std::vector<std::string>& tags) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;

    auto& s = it->second;
    for (const auto& tag : tags) {
        if (!tag.empty() && !s.has_tag(tag)) s.tags.push_back(tag);
    }
    return s;
}

std::optional<Session> SessionRegistry::remove_tags(const std::string& id,
                                                    const std::vector<std::string>& tags) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;

    auto& current = it->second.tags;
    current.erase(std::remove_if(current.begin(), current.end(),
                                 [&](const std::string& t) {
                                     return std::find(tags.begin(), tags.end(), t) != tags.end();
                                 }),
                  current.end());
    return it->second;
}

bool SessionRegistry::transition(const std::string& id, Status to) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;

    const Status from = it->second.status;
    if (!can_transition(from, to)) {
        logging::debug("Registry") << id << ": refused " << to_string(from) << " -> " << to_string(to);
        return false;
    }
    it->second.status = to;
    logging::info("Registry") << id << ": " << to_string(from) << " -> " << to_string(to);
    return true;
}

Status SessionRegistry::claim(const std::string& id, std::initializer_list<Status> from, Status to) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw Error(Errc::NotFound, "session " + id + " not found");
    }

    const Status current = it->second.status;
    const bool allowed = std::find(from.begin(), from.end(), current) != from.end();
    if (!allowed || !can_transition(current, to)) {
        throw Error(Errc::InvalidState,
                    "session " + id + " is in " + std::string(to_string(current)) + " state");
    }
    it->second.status = to;
    logging::debug("Registry") << id << ": " << to_string(current) << " -> " << to_string(to);
    return current;
}

bool SessionRegistry::erase(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.erase(id) != 0;
}

PoolStatus SessionRegistry::pool_status() const {
    std::lock_guard<std::mutex> lk(mu_);
    PoolStatus ps;
    ps.capacity = capacity_;
    ps.total = occupied_locked();
    for (const auto& [id, s] : sessions_) {
        switch (s.status) {
            case Status::Ready:   ++ps.ready; break;
            case Status::Working: ++ps.working; break;
            case Status::Idle:    ++ps.idle; break;
            case Status::Error:   ++ps.error; break;
            default: break;
        }
    }
    return ps;
}

} // namespace deskpool::session
