#pragma once

#include "session/Session.h"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace deskpool::orchestrator {

std::string iso8601(std::chrono::system_clock::time_point tp);

boost::json::object to_json(const session::Frame& frame);
boost::json::object to_json(const session::Session& s);
boost::json::object to_json(const session::TaskResult& result);
boost::json::object to_json(const session::PoolStatus& status);
boost::json::array to_json(const std::vector<session::Session>& sessions);

// Same as to_json(Session) without the cached frame payload.
boost::json::object summary_json(const session::Session& s);

// {"name","kind","size","region","tags","transport":{...}}. Missing fields take
// the given defaults. Throws Errc::InvalidArgument.
session::SessionConfig session_config_from_json(const boost::json::object& obj, session::OsKind default_kind,
                                                std::optional<session::Region> default_region);

std::vector<std::string> string_list(const boost::json::value& v, const char* field);

} // namespace deskpool::orchestrator
