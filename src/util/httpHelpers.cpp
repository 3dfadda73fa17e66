#include "util/httpHelpers.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <cctype>
#include <curl/curl.h>
#include <iomanip>
#include <mutex>
#include <sstream>

using namespace unistore::storage;

namespace unistore::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

ErrorKind errorKindFromHttpStatus(const long status) {
    switch (status) {
        case 400: return ErrorKind::InvalidArgument;
        case 401:
        case 403: return ErrorKind::PermissionDenied;
        case 404: return ErrorKind::NotFound;
        case 409:
        case 412: return ErrorKind::AlreadyExists;
        default: return ErrorKind::BackendUnavailable;  // 0 (transport), 429, 5xx, anything unexpected
    }
}

std::string urlEncode(const std::string& s) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0');
    for (const unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out << c;
        else out << '%' << std::setw(2) << static_cast<int>(c);
    }
    return out.str();
}

std::string escapeKeyPreserveSlashes(const std::string& key) {
    std::string out;
    std::size_t start = 0;
    while (true) {
        const auto slash = key.find('/', start);
        out += urlEncode(key.substr(start, slash - start));
        if (slash == std::string::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

std::string formEncode(const std::map<std::string, std::string>& fields) {
    std::string out;
    for (const auto& [k, v] : fields) {
        if (!out.empty()) out += '&';
        out += urlEncode(k) + '=' + urlEncode(v);
    }
    return out;
}

std::string findHeader(const std::string& rawHeaders, const std::string& name) {
    std::istringstream in(rawHeaders);
    std::string line;
    while (std::getline(in, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (!boost::algorithm::iequals(line.substr(0, colon), name)) continue;
        std::string value = line.substr(colon + 1);
        trimInPlace(value);
        return value;
    }
    return {};
}

void trimInPlace(std::string& s) {
    boost::algorithm::trim(s);
}

}
