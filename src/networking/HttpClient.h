#pragma once

#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace deskpool::networking {

struct HttpResponse {
    unsigned status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Blocking HTTP/1.1 client (http and https). One connection per request.
// Network failures and timeouts throw boost::system::system_error.
class HttpClient {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit HttpClient(std::chrono::milliseconds timeout, bool verify_tls = true);

    HttpResponse request(boost::beast::http::verb method, const std::string& url,
                         const std::string& body = {}, const Headers& headers = {}) const;

    HttpResponse post_json(const std::string& url, const std::string& json,
                           const Headers& headers = {}) const;

private:
    std::chrono::milliseconds timeout_;
    bool verify_tls_;
};

} // namespace deskpool::networking
