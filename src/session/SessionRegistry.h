#pragma once

#include "session/Session.h"

#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deskpool::session {

// Process-resident table of session records. Every read returns a copy;
// every mutation happens under one mutex.
class SessionRegistry {
public:
    explicit SessionRegistry(std::size_t capacity);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    std::size_t capacity() const noexcept { return capacity_; }

    // Records that still occupy a slot (everything not yet stopped).
    std::size_t size() const;

    // Throws Errc::ResourceExhausted when the table is full. Rejects, never queues.
    void insert(Session session);

    std::optional<Session> get(const std::string& id) const;
    bool contains(const std::string& id) const;

    std::vector<Session> list() const;
    std::vector<Session> list_by_tag(std::string_view tag) const;
    std::vector<Session> list_by_status(Status status) const;
    std::vector<std::string> all_tags() const;

    // Idempotent. nullopt when the id is unknown.
    std::optional<Session> add_tags(const std::string& id, const std::vector<std::string>& tags);
    std::optional<Session> remove_tags(const std::string& id, const std::vector<std::string>& tags);

    // Moves the record to `to` when the move is legal. False otherwise
    // (unknown id included); the record is left untouched.
    bool transition(const std::string& id, Status to);

    // Moves the record to `to` only from one of `from`. Returns the status it
    // left. Throws Errc::NotFound or Errc::InvalidState.
    Status claim(const std::string& id, std::initializer_list<Status> from, Status to);

    // Applies `fn(Session&)` atomically. False when the id is unknown.
    template <typename Fn>
    bool update(const std::string& id, Fn&& fn) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return false;
        fn(it->second);
        return true;
    }

    bool erase(const std::string& id);

    PoolStatus pool_status() const;

private:
    std::size_t occupied_locked() const;

    const std::size_t capacity_;

    mutable std::mutex mu_;
    // Ordered by id; ids are ULIDs so iteration follows creation order.
    std::map<std::string, Session> sessions_;
};

} // namespace deskpool::session
