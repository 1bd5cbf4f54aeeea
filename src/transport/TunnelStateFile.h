#pragma once

#include "transport/Tunnel.h"

#include <boost/json/object.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace deskpool::transport {

// Advisory sidecar describing the active tunnels, for operators only:
//   {"tunnels":{"<localPort>":{"type":...,"localPort":...,...}}}
// Every establisher in the process shares one file; each owns the entry under
// its local port. Writes are best-effort: failures are logged and never
// propagate.
class TunnelStateFile {
public:
    explicit TunnelStateFile(std::string path) : path_(std::move(path)) {}

    // Adds or replaces the entry for status.local_port.
    void write(const TunnelStatus& status) const;

    // Drops the entry for `local_port`; the file goes away with its last entry.
    void remove(std::uint16_t local_port) const;

    const std::string& path() const { return path_; }

    static boost::json::object to_json(const TunnelStatus& status);

    // Returns nullopt when the file is missing or unreadable.
    static std::optional<boost::json::object> read(const std::string& path);

    // The entry for one tunnel, nullopt when it is not recorded.
    static std::optional<boost::json::object> read_entry(const std::string& path, std::uint16_t local_port);

private:
    bool store(const boost::json::object& doc) const;

    std::string path_;
};

} // namespace deskpool::transport
