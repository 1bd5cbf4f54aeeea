#pragma once

#include "orchestrator/SessionOrchestrator.h"

#include <boost/asio/thread_pool.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <functional>
#include <optional>
#include <string>

namespace deskpool::networking {

// JSON request/reply protocol of the client surface:
//   -> {"req":7,"op":"task","id":"sess-...","task":"go to example.com"}
//   <- {"req":7,"ok":true,"result":{...}}
//   <- {"req":7,"ok":false,"error":{"code":"InvalidState","message":"..."}}
class CommandRouter {
public:
    using Reply = std::function<void(const std::string&)>;

    CommandRouter(orchestrator::SessionOrchestrator& orchestrator, boost::asio::thread_pool& workers,
                  session::OsKind default_kind, std::optional<session::Region> default_region);

    // Queues the request on the worker pool; `reply` is called from there
    // exactly once.
    void dispatch(const std::string& message, Reply reply);

    // Runs one parsed request and returns its result. Throws deskpool::Error.
    boost::json::value handle(const boost::json::object& request);

    // Parses, runs and encodes the reply, all on the calling thread.
    std::string process(const std::string& message);

    // Waits for every queued request, then stops all sessions. A create still
    // queued at shutdown therefore never leaves a machine behind.
    void shutdown();

private:
    orchestrator::SessionOrchestrator& orchestrator_;
    boost::asio::thread_pool& workers_;
    session::OsKind default_kind_;
    std::optional<session::Region> default_region_;
};

} // namespace deskpool::networking
