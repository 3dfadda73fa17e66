#include "cloud/azure/ConnectionString.hpp"
#include "storage/Error.hpp"

#include <boost/algorithm/string.hpp>
#include <vector>

using namespace unistore::cloud::azure;
using namespace unistore::storage;

ConnectionString ConnectionString::parse(const std::string& raw) {
    ConnectionString cs;
    bool devStorage = false;

    std::vector<std::string> pairs;
    boost::algorithm::split(pairs, raw, boost::algorithm::is_any_of(";"));

    for (auto& pair : pairs) {
        boost::algorithm::trim(pair);
        if (pair.empty()) continue;

        // Account keys end in '=' padding, so split on the first '=' only.
        const auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0)
            throwError(ErrorKind::InvalidArgument, "Malformed connection string segment: '" + pair + "'");

        const auto key = boost::algorithm::trim_copy(pair.substr(0, eq));
        const auto value = boost::algorithm::trim_copy(pair.substr(eq + 1));

        if (boost::algorithm::iequals(key, "DefaultEndpointsProtocol")) cs.protocol = boost::algorithm::to_lower_copy(value);
        else if (boost::algorithm::iequals(key, "AccountName")) cs.account_name = value;
        else if (boost::algorithm::iequals(key, "AccountKey")) cs.account_key = value;
        else if (boost::algorithm::iequals(key, "EndpointSuffix")) cs.endpoint_suffix = value;
        else if (boost::algorithm::iequals(key, "BlobEndpoint")) cs.blob_endpoint = value;
        else if (boost::algorithm::iequals(key, "UseDevelopmentStorage")) devStorage = boost::algorithm::iequals(value, "true");
        // Other services' endpoints (QueueEndpoint, TableEndpoint, ...) are irrelevant here.
    }

    if (devStorage) {
        if (cs.account_name.empty()) cs.account_name = DEV_ACCOUNT_NAME;
        if (cs.account_key.empty()) cs.account_key = DEV_ACCOUNT_KEY;
        if (cs.blob_endpoint.empty()) cs.blob_endpoint = DEV_BLOB_ENDPOINT;
        cs.protocol = "http";
    }

    if (cs.account_name.empty()) throwError(ErrorKind::InvalidArgument, "Connection string is missing AccountName");
    if (cs.account_key.empty()) throwError(ErrorKind::InvalidArgument, "Connection string is missing AccountKey");
    if (cs.protocol != "http" && cs.protocol != "https")
        throwError(ErrorKind::InvalidArgument, "Unsupported DefaultEndpointsProtocol: " + cs.protocol);

    while (!cs.blob_endpoint.empty() && cs.blob_endpoint.back() == '/') cs.blob_endpoint.pop_back();
    return cs;
}

std::string ConnectionString::blobServiceUrl() const {
    if (!blob_endpoint.empty()) return blob_endpoint;
    return protocol + "://" + account_name + ".blob." + endpoint_suffix;
}
