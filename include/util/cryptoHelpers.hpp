#pragma once

#include <string>

namespace unistore::util {

std::string hmacSha256Raw(const std::string& key, const std::string& data);

// Standard base64 with padding (libsodium ORIGINAL variant).
std::string b64Encode(const std::string& data);
std::string b64Decode(const std::string& b64);

}
