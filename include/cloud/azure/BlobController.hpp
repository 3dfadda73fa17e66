#pragma once

#include "cloud/azure/ConnectionString.hpp"
#include "cloud/azure/sharedKey.hpp"
#include "storage/blob/BlobClient.hpp"
#include "util/curlWrappers.hpp"

#include <string>
#include <vector>

namespace unistore::cloud::azure {

/**
 * BlobClient over the Azure Blob Storage REST API, authenticated with the
 * account's SharedKey. Every call is one blocking libcurl request (listings
 * follow NextMarker until exhausted).
 */
class BlobController final : public storage::blob::BlobClient {
public:
    explicit BlobController(ConnectionString cs);
    ~BlobController() override;

    // #########################################################################
    // ########################### CONTAINERS ##################################
    // #########################################################################

    [[nodiscard]] bool containerExists(const std::string& container) const override;
    void createContainer(const std::string& container) const override;
    void deleteContainer(const std::string& container) const override;

    // #########################################################################
    // ############################# BLOBS #####################################
    // #########################################################################

    [[nodiscard]] bool blobExists(const std::string& container, const std::string& blob) const override;
    void putBlob(const std::string& container, const std::string& blob,
                 std::istream& content, bool overwrite) const override;
    [[nodiscard]] std::unique_ptr<std::istream> getBlob(const std::string& container,
                                                        const std::string& blob) const override;
    void deleteBlob(const std::string& container, const std::string& blob) const override;

    // #########################################################################
    // ############################ LISTING ####################################
    // #########################################################################

    [[nodiscard]] std::vector<storage::blob::BlobEntry> listByHierarchy(const std::string& container,
                                                                        const std::string& prefix,
                                                                        const std::string& delimiter) const override;
    [[nodiscard]] std::vector<storage::blob::BlobEntry> listFlat(const std::string& container,
                                                                 const std::string& prefix) const override;

    [[nodiscard]] std::string blobUri(const std::string& container, const std::string& blob) const override;

    [[nodiscard]] const ConnectionString& connection() const { return cs_; }

    // One EnumerationResults page; nextMarker is cleared on the last page.
    static std::vector<storage::blob::BlobEntry> parseListing(const std::string& xml, std::string& nextMarker);

private:
    ConnectionString cs_;
    std::string decodedKey_;
    std::string serviceUrl_;
    std::string servicePath_;  // path component of serviceUrl_ ("" or "/devstoreaccount1")

    [[nodiscard]] util::HttpResponse send(const std::string& method,
                                          const std::string& resourcePath,
                                          const QueryMap& query,
                                          HeaderMap headers,
                                          const std::string* body = nullptr) const;

    [[nodiscard]] std::vector<storage::blob::BlobEntry> list(const std::string& container,
                                                             const std::string& prefix,
                                                             const std::string& delimiter) const;

    [[noreturn]] void fail(const std::string& op, const std::string& target, const util::HttpResponse& resp) const;
};

}
