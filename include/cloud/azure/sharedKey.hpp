#pragma once

#include <map>
#include <string>

namespace unistore::cloud::azure {

// Request headers keyed by their canonical spelling ("Content-Type", "x-ms-date", ...).
using HeaderMap = std::map<std::string, std::string>;
// Unencoded query parameters.
using QueryMap = std::map<std::string, std::string>;

static constexpr const auto* API_VERSION = "2021-08-06";

// SharedKey string-to-sign for the Blob service (version 2009-09-19 and later).
// urlPath is the encoded request path, e.g. "/container/dir/blob.txt".
std::string buildStringToSign(const std::string& verb,
                              const std::string& account,
                              const std::string& urlPath,
                              const QueryMap& query,
                              const HeaderMap& headers);

// "SharedKey <account>:<base64(hmac-sha256(key, stringToSign))>"
std::string buildAuthorizationHeader(const std::string& account,
                                     const std::string& decodedKey,
                                     const std::string& stringToSign);

}
