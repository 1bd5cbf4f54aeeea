#pragma once

#include "session/Session.h"

#include <optional>
#include <string>

namespace deskpool::provider {

// What the provider hands back for a new machine. Kept only until teardown.
struct ProviderHandle {
    std::string name;
    std::string host;
};

class ProviderApi {
public:
    virtual ~ProviderApi() = default;

    // Throws deskpool::Error(Errc::ProvisionError).
    virtual ProviderHandle create_machine(session::OsKind kind, std::optional<session::Region> region,
                                          session::SizeClass size) = 0;

    // A machine that is already gone counts as deleted.
    // Throws deskpool::Error(Errc::ProvisionError).
    virtual void delete_machine(const std::string& name) = 0;
};

} // namespace deskpool::provider
