#pragma once

#include <cstdint>
#include <string>

namespace deskpool::networking {

// scheme://host[:port][/target] for http, https, ws and wss.
struct Url {
    std::string scheme;
    std::string host;
    std::uint16_t port = 0;
    std::string target = "/";

    bool secure() const { return scheme == "https" || scheme == "wss"; }
    std::string authority() const;
    std::string str() const;
};

// Throws deskpool::Error(Errc::InvalidArgument).
Url parse_url(const std::string& text);

std::string join_path(const std::string& base, const std::string& path);

} // namespace deskpool::networking
