#pragma once

#include <boost/json/object.hpp>

#include <string>
#include <string_view>

namespace deskpool::orchestrator {

enum class EventType {
    SessionCreated,
    SessionStatus,
    SessionReady,
    SessionError,
    TaskStarted,
    TaskComplete,
    TaskFailed,
    Frame,
    SessionStopped
};

std::string_view to_string(EventType type) noexcept;

struct Event {
    EventType type;
    std::string session_id;
    boost::json::object data;
};

// {"event":"<type>","sessionId":...,"data":{...}}
boost::json::object to_json(const Event& event);

} // namespace deskpool::orchestrator
