#include "core/Error.h"

namespace deskpool {

std::string_view errc_name(Errc code) noexcept {
    switch (code) {
        case Errc::ProvisionError:     return "ProvisionError";
        case Errc::NotReady:           return "NotReady";
        case Errc::TransportTimeout:   return "TransportTimeout";
        case Errc::TransportError:     return "TransportError";
        case Errc::InvalidState:       return "InvalidState";
        case Errc::ResourceExhausted:  return "ResourceExhausted";
        case Errc::AmbiguousTransport: return "AmbiguousTransport";
        case Errc::InvalidArgument:    return "InvalidArgument";
        case Errc::NotFound:           return "NotFound";
    }
    return "Unknown";
}

} // namespace deskpool
