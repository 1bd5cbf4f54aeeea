#include "provider/CloudProviderApi.h"

#include "core/Error.h"
#include "logging/Log.h"
#include "networking/Url.h"

#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/system/system_error.hpp>

namespace deskpool::provider {

namespace json = boost::json;
namespace http = boost::beast::http;

namespace {

constexpr std::size_t kMaxErrorBody = 200;

std::string excerpt(const std::string& body) {
    if (body.size() <= kMaxErrorBody) return body;
    return body.substr(0, kMaxErrorBody) + "...";
}

std::string string_field(const json::object& obj, json::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v || !v->is_string()) return {};
    return std::string(v->get_string());
}

} // namespace

CloudProviderApi::CloudProviderApi(std::string api_base, std::string api_key, std::chrono::milliseconds timeout)
    : api_base_(std::move(api_base)), api_key_(std::move(api_key)), http_(timeout) {}

networking::HttpClient::Headers CloudProviderApi::auth_headers() const {
    return {{"Authorization", "Bearer " + api_key_}};
}

ProviderHandle CloudProviderApi::create_machine(session::OsKind kind, std::optional<session::Region> region,
                                                session::SizeClass size) {
    if (api_key_.empty()) {
        throw Error(Errc::ProvisionError, "provider API key is not configured");
    }

    json::object body;
    body["os"] = session::to_string(kind);
    body["configuration"] = session::to_string(size);
    body["region"] = session::to_string(region.value_or(session::Region::NorthAmerica));

    const std::string url = networking::join_path(api_base_, "/v1/vms");
    networking::HttpResponse res;
    try {
        res = http_.post_json(url, json::serialize(body), auth_headers());
    } catch (const boost::system::system_error& e) {
        throw Error(Errc::ProvisionError, "POST " + url + ": " + e.what());
    }

    if (!res.ok()) {
        throw Error(Errc::ProvisionError,
                    "provisioning failed: " + std::to_string(res.status) + " - " + excerpt(res.body));
    }

    boost::system::error_code ec;
    json::value doc = json::parse(res.body, ec);
    if (ec || !doc.is_object()) {
        throw Error(Errc::ProvisionError, "provisioning reply is not a JSON object");
    }

    ProviderHandle handle;
    handle.name = string_field(doc.as_object(), "name");
    handle.host = string_field(doc.as_object(), "host");
    if (handle.name.empty()) {
        throw Error(Errc::ProvisionError, "provisioning reply has no machine name");
    }
    if (handle.host.empty()) handle.host = handle.name;

    logging::info("Provider") << "created " << session::to_string(kind) << "/" << session::to_string(size)
                              << " machine " << handle.name << " at " << handle.host;
    return handle;
}

void CloudProviderApi::delete_machine(const std::string& name) {
    const std::string url = networking::join_path(api_base_, "/v1/vms/" + name);
    networking::HttpResponse res;
    try {
        res = http_.request(http::verb::delete_, url, {}, auth_headers());
    } catch (const boost::system::system_error& e) {
        throw Error(Errc::ProvisionError, "DELETE " + url + ": " + e.what());
    }

    if (res.status == 404) {
        logging::info("Provider") << "machine " << name << " already gone";
        return;
    }
    if (!res.ok()) {
        throw Error(Errc::ProvisionError, "delete of " + name + " failed: " + std::to_string(res.status));
    }
    logging::info("Provider") << "deleted machine " << name;
}

} // namespace deskpool::provider
