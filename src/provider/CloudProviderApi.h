#pragma once

#include "networking/HttpClient.h"
#include "provider/ProviderApi.h"

#include <chrono>
#include <string>

namespace deskpool::provider {

// REST client for the hosted VM API:
//   POST   {api_base}/v1/vms          {"os","configuration","region"} -> {"name","host"}
//   DELETE {api_base}/v1/vms/{name}
class CloudProviderApi : public ProviderApi {
public:
    CloudProviderApi(std::string api_base, std::string api_key, std::chrono::milliseconds timeout);

    ProviderHandle create_machine(session::OsKind kind, std::optional<session::Region> region,
                                  session::SizeClass size) override;
    void delete_machine(const std::string& name) override;

private:
    networking::HttpClient::Headers auth_headers() const;

    std::string api_base_;
    std::string api_key_;
    networking::HttpClient http_;
};

} // namespace deskpool::provider
