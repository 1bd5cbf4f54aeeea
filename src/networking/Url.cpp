#include "networking/Url.h"

#include "core/Error.h"

#include <algorithm>
#include <cctype>

namespace deskpool::networking {

namespace {

std::uint16_t default_port(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws") return 80;
    return 443;
}

} // namespace

std::string Url::authority() const {
    if (port == default_port(scheme)) return host;
    return host + ":" + std::to_string(port);
}

std::string Url::str() const {
    return scheme + "://" + authority() + target;
}

Url parse_url(const std::string& text) {
    const auto sep = text.find("://");
    if (sep == std::string::npos) {
        throw Error(Errc::InvalidArgument, "url '" + text + "' has no scheme");
    }

    Url url;
    url.scheme = text.substr(0, sep);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https" && url.scheme != "ws" && url.scheme != "wss") {
        throw Error(Errc::InvalidArgument, "unsupported url scheme '" + url.scheme + "'");
    }

    const std::string rest = text.substr(sep + 3);
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) url.target = rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        url.host = authority.substr(0, colon);
        const std::string port = authority.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(), ::isdigit) || port.size() > 5 ||
            std::stoul(port) == 0 || std::stoul(port) > 65535) {
            throw Error(Errc::InvalidArgument, "url '" + text + "' has an invalid port");
        }
        url.port = static_cast<std::uint16_t>(std::stoul(port));
    } else {
        url.host = authority;
        url.port = default_port(url.scheme);
    }

    if (url.host.empty()) {
        throw Error(Errc::InvalidArgument, "url '" + text + "' has no host");
    }
    return url;
}

std::string join_path(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    const bool base_slash = base.back() == '/';
    const bool path_slash = path.front() == '/';
    if (base_slash && path_slash) return base + path.substr(1);
    if (!base_slash && !path_slash) return base + "/" + path;
    return base + path;
}

} // namespace deskpool::networking
