#pragma once

#include <string>

namespace unistore::cloud::azure {

struct ConnectionString {
    static constexpr const auto* DEFAULT_ENDPOINT_SUFFIX = "core.windows.net";
    static constexpr const auto* DEV_ACCOUNT_NAME = "devstoreaccount1";
    static constexpr const auto* DEV_ACCOUNT_KEY =
        "Eby8vdM02xNOcqFlqUwJPLlmEtlCDXJ1OUzFT50uSRZ6IFsuFq2UVErCz4I6tq/K1SZFPTOtr/KBHBeksoGMGw==";
    static constexpr const auto* DEV_BLOB_ENDPOINT = "http://127.0.0.1:10000/devstoreaccount1";

    std::string protocol = "https";
    std::string account_name;
    std::string account_key;      // base64, as issued by the portal
    std::string endpoint_suffix = DEFAULT_ENDPOINT_SUFFIX;
    std::string blob_endpoint;    // explicit override, empty = derived

    // Key=Value;... as issued by the portal. Throws StorageError(InvalidArgument).
    static ConnectionString parse(const std::string& raw);

    // Blob service base URL without a trailing slash.
    [[nodiscard]] std::string blobServiceUrl() const;
};

}
