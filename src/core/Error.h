#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace deskpool {

enum class Errc {
    ProvisionError,
    NotReady,
    TransportTimeout,
    TransportError,
    InvalidState,
    ResourceExhausted,
    AmbiguousTransport,
    InvalidArgument,
    NotFound
};

std::string_view errc_name(Errc code) noexcept;

class Error : public std::runtime_error {
public:
    Error(Errc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    Errc code() const noexcept { return code_; }

private:
    Errc code_;
};

} // namespace deskpool
