#pragma once

#include <optional>
#include <string>
#include <vector>

namespace deskpool::fleet {

// External fleet registry. Every call is best-effort: implementations log
// failures and return normally.
class FleetRegistrar {
public:
    virtual ~FleetRegistrar() = default;

    virtual void register_session(const std::string& id, const std::string& name,
                                  const std::vector<std::string>& capabilities) = 0;
    virtual void heartbeat(const std::string& id, bool busy, const std::optional<std::string>& current_task) = 0;
    virtual void set_offline(const std::string& id) = 0;
};

} // namespace deskpool::fleet
