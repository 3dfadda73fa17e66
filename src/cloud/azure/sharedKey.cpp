#include "cloud/azure/sharedKey.hpp"
#include "util/cryptoHelpers.hpp"

#include <boost/algorithm/string.hpp>
#include <sstream>

namespace unistore::cloud::azure {

static std::string headerOrEmpty(const HeaderMap& headers, const std::string& name) {
    for (const auto& [k, v] : headers)
        if (boost::algorithm::iequals(k, name)) return v;
    return {};
}

std::string buildStringToSign(const std::string& verb,
                              const std::string& account,
                              const std::string& urlPath,
                              const QueryMap& query,
                              const HeaderMap& headers) {
    auto contentLength = headerOrEmpty(headers, "Content-Length");
    if (contentLength == "0") contentLength.clear();

    std::ostringstream sts;
    sts << verb << "\n"
        << headerOrEmpty(headers, "Content-Encoding") << "\n"
        << headerOrEmpty(headers, "Content-Language") << "\n"
        << contentLength << "\n"
        << headerOrEmpty(headers, "Content-MD5") << "\n"
        << headerOrEmpty(headers, "Content-Type") << "\n"
        << headerOrEmpty(headers, "Date") << "\n"
        << headerOrEmpty(headers, "If-Modified-Since") << "\n"
        << headerOrEmpty(headers, "If-Match") << "\n"
        << headerOrEmpty(headers, "If-None-Match") << "\n"
        << headerOrEmpty(headers, "If-Unmodified-Since") << "\n"
        << headerOrEmpty(headers, "Range") << "\n";

    // Canonicalized headers: every x-ms-* header, lower-cased and sorted.
    std::map<std::string, std::string> msHeaders;
    for (const auto& [k, v] : headers) {
        const auto lower = boost::algorithm::to_lower_copy(k);
        if (boost::algorithm::starts_with(lower, "x-ms-")) msHeaders[lower] = boost::algorithm::trim_copy(v);
    }
    for (const auto& [k, v] : msHeaders) sts << k << ":" << v << "\n";

    // Canonicalized resource
    sts << "/" << account << urlPath;
    std::map<std::string, std::string> params;
    for (const auto& [k, v] : query) params[boost::algorithm::to_lower_copy(k)] = v;
    for (const auto& [k, v] : params) sts << "\n" << k << ":" << v;

    return sts.str();
}

std::string buildAuthorizationHeader(const std::string& account,
                                     const std::string& decodedKey,
                                     const std::string& stringToSign) {
    return "SharedKey " + account + ":" + util::b64Encode(util::hmacSha256Raw(decodedKey, stringToSign));
}

}
