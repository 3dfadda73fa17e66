#pragma once

#include "storage/Error.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace unistore::util {

void ensureCurlGlobalInit();

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// Maps an HTTP status (0 = transport failure) onto the storage error taxonomy.
[[nodiscard]] storage::ErrorKind errorKindFromHttpStatus(long status);

// RFC 3986 percent-encoding of every byte outside the unreserved set.
[[nodiscard]] std::string urlEncode(const std::string& s);

// Percent-encodes each '/'-separated segment, keeping the separators.
[[nodiscard]] std::string escapeKeyPreserveSlashes(const std::string& key);

// k1=v1&k2=v2, values url-encoded
[[nodiscard]] std::string formEncode(const std::map<std::string, std::string>& fields);

[[nodiscard]] std::string findHeader(const std::string& rawHeaders, const std::string& name);

void trimInPlace(std::string& s);

}
