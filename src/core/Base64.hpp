#pragma once

#include <boost/beast/core/detail/base64.hpp>

#include <string>
#include <string_view>

// Beast keeps its codec under detail; this header is its only user.
namespace deskpool {

inline std::string encode_base64(std::string_view data) {
    std::string out;
    out.resize(boost::beast::detail::base64::encoded_size(data.size()));
    out.resize(boost::beast::detail::base64::encode(&out[0], data.data(), data.size()));
    return out;
}

// Stops at the first character outside the alphabet.
inline std::string decode_base64(std::string_view encoded) {
    std::string out;
    out.resize(boost::beast::detail::base64::decoded_size(encoded.size()));
    const auto result = boost::beast::detail::base64::decode(&out[0], encoded.data(), encoded.size());
    out.resize(result.first);
    return out;
}

} // namespace deskpool
