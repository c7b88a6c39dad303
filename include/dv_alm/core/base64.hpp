#pragma once

#include <dv_alm/core/result.hpp>

#include <string>
#include <string_view>

namespace dv_alm {

// Standard base64 (RFC 4648, with padding) on the OpenSSL EVP block codec.
// Solution zips travel through the Web API as base64 strings in both
// directions.
std::string Base64Encode(std::string_view data);

// Returns Err(message) on characters outside the alphabet or bad padding.
Result<std::string, std::string> Base64Decode(std::string_view encoded);

} // namespace dv_alm
