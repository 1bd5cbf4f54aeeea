#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace deskpool::networking {

// True when a TCP connection to host:port completes within `timeout`.
// The socket is closed before returning.
bool port_open(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);

} // namespace deskpool::networking
