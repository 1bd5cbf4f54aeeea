#include "orchestrator/Events.h"

namespace deskpool::orchestrator {

std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::SessionCreated: return "session_created";
        case EventType::SessionStatus:  return "session_status";
        case EventType::SessionReady:   return "session_ready";
        case EventType::SessionError:   return "session_error";
        case EventType::TaskStarted:    return "task_started";
        case EventType::TaskComplete:   return "task_complete";
        case EventType::TaskFailed:     return "task_failed";
        case EventType::Frame:          return "frame";
        case EventType::SessionStopped: return "session_stopped";
    }
    return "unknown";
}

boost::json::object to_json(const Event& event) {
    boost::json::object obj;
    obj["event"] = to_string(event.type);
    obj["sessionId"] = event.session_id;
    obj["data"] = event.data;
    return obj;
}

} // namespace deskpool::orchestrator
