#include "fleet/HttpFleetRegistrar.h"

#include "logging/Log.h"
#include "networking/Url.h"

#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

#include <exception>

namespace deskpool::fleet {

namespace json = boost::json;

HttpFleetRegistrar::HttpFleetRegistrar(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), http_(timeout) {}

bool HttpFleetRegistrar::post(const std::string& path, const std::string& body, const std::string& what) {
    try {
        const networking::HttpResponse res = http_.post_json(networking::join_path(base_url_, path), body);
        if (res.ok()) return true;
        logging::warn("Fleet") << what << " rejected: " << res.status;
    } catch (const std::exception& e) {
        logging::warn("Fleet") << what << " failed: " << e.what();
    }
    return false;
}

void HttpFleetRegistrar::register_session(const std::string& id, const std::string& name,
                                          const std::vector<std::string>& capabilities) {
    json::array caps;
    for (const auto& c : capabilities) caps.emplace_back(c);

    json::object body;
    body["id"] = id;
    body["name"] = name;
    body["endpoint"] = "vm://" + id;
    body["capabilities"] = std::move(caps);

    if (post("/vps/register", json::serialize(body), "register " + id)) {
        logging::info("Fleet") << "registered " << name << " (" << id << ")";
    }
}

void HttpFleetRegistrar::heartbeat(const std::string& id, bool busy,
                                   const std::optional<std::string>& current_task) {
    json::object body;
    body["id"] = id;
    body["status"] = busy ? "busy" : "online";
    if (current_task) body["currentTask"] = *current_task;
    else body["currentTask"] = nullptr;

    post("/vps/heartbeat", json::serialize(body), "heartbeat " + id);
}

void HttpFleetRegistrar::set_offline(const std::string& id) {
    json::object body;
    body["id"] = id;
    body["status"] = "offline";

    if (post("/vps/heartbeat", json::serialize(body), "offline " + id)) {
        logging::debug("Fleet") << id << " reported offline";
    }
}

} // namespace deskpool::fleet
