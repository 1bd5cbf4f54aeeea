#pragma once

#include "fleet/FleetRegistrar.h"
#include "networking/HttpClient.h"

#include <chrono>

namespace deskpool::fleet {

//   POST {base}/vps/register   {"id","name","endpoint":"vm://<id>","capabilities"}
//   POST {base}/vps/heartbeat  {"id","status":"busy"|"online"|"offline","currentTask"}
class HttpFleetRegistrar : public FleetRegistrar {
public:
    HttpFleetRegistrar(std::string base_url, std::chrono::milliseconds timeout);

    void register_session(const std::string& id, const std::string& name,
                          const std::vector<std::string>& capabilities) override;
    void heartbeat(const std::string& id, bool busy, const std::optional<std::string>& current_task) override;
    void set_offline(const std::string& id) override;

private:
    bool post(const std::string& path, const std::string& body, const std::string& what);

    std::string base_url_;
    networking::HttpClient http_;
};

} // namespace deskpool::fleet
