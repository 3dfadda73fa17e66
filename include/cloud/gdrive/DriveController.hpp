#pragma once

#include "cloud/gdrive/TokenSource.hpp"
#include "storage/Error.hpp"
#include "storage/drive/DriveClient.hpp"
#include "util/curlWrappers.hpp"

#include <memory>
#include <string>
#include <vector>

namespace unistore::cloud::gdrive {

static constexpr const auto* DRIVE_API_BASE = "https://www.googleapis.com/drive/v3";
static constexpr const auto* DRIVE_UPLOAD_BASE = "https://www.googleapis.com/upload/drive/v3";

/**
 * DriveClient over the Google Drive v3 REST API. Requests are blocking
 * libcurl calls carrying a bearer token from the TokenSource; search results
 * are paged until nextPageToken runs out.
 */
class DriveController final : public storage::drive::DriveClient {
public:
    explicit DriveController(std::unique_ptr<TokenSource> tokens,
                             std::string apiBase = DRIVE_API_BASE,
                             std::string uploadBase = DRIVE_UPLOAD_BASE);
    ~DriveController() override;

    [[nodiscard]] std::vector<storage::drive::DriveFile> findChildren(const std::string& parentId,
                                                                      const std::string& name,
                                                                      storage::drive::NodeFilter filter) const override;
    [[nodiscard]] std::vector<storage::drive::DriveFile> listChildren(const std::string& parentId) const override;

    storage::drive::DriveFile createFolder(const std::string& parentId, const std::string& name) const override;
    storage::drive::DriveFile uploadFile(const std::string& parentId, const std::string& name,
                                         std::istream& content) const override;
    void grantPermission(const std::string& fileId, const std::string& type, const std::string& role) const override;
    void deleteFile(const std::string& fileId) const override;
    [[nodiscard]] std::unique_ptr<std::istream> download(const std::string& fileId) const override;

    // Drive search literal: backslashes and single quotes escaped.
    static std::string escapeQueryValue(const std::string& value);

    static std::string buildSearchQuery(const std::string& parentId, const std::string& name,
                                        storage::drive::NodeFilter filter);

    // 403s caused by rate limits or quotas are transient, the rest are permission errors.
    static storage::ErrorKind classifyError(long status, const std::string& body);

private:
    std::unique_ptr<TokenSource> tokens_;
    std::string apiBase_;
    std::string uploadBase_;

    [[nodiscard]] util::HttpResponse send(const std::string& method,
                                          const std::string& url,
                                          const std::string* body = nullptr,
                                          const std::string& contentType = "application/json") const;

    [[nodiscard]] std::vector<storage::drive::DriveFile> search(const std::string& query) const;

    [[noreturn]] void fail(const std::string& op, const std::string& target, const util::HttpResponse& resp) const;
};

}
