#pragma once

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace unistore::storage::drive {

static constexpr const auto* FOLDER_MIME_TYPE = "application/vnd.google-apps.folder";
static constexpr const auto* OCTET_STREAM_MIME_TYPE = "application/octet-stream";

enum class NodeFilter { Any, Folder, File };

struct DriveFile {
    std::string id;
    std::string name;
    std::string mime_type;
    std::vector<std::string> parents;

    [[nodiscard]] bool isFolder() const { return mime_type == FOLDER_MIME_TYPE; }
};

/**
 * Handle on one ID-addressed drive account.
 *
 * Names are not unique under a parent, so lookups return every match in
 * backend order. Implementations report failures as StorageError and must
 * tolerate concurrent deleteFile() calls.
 */
class DriveClient {
public:
    virtual ~DriveClient() = default;

    // Children of parentId named exactly name, narrowed by filter.
    [[nodiscard]] virtual std::vector<DriveFile> findChildren(const std::string& parentId,
                                                              const std::string& name,
                                                              NodeFilter filter) const = 0;

    // Every child of parentId, all pages.
    [[nodiscard]] virtual std::vector<DriveFile> listChildren(const std::string& parentId) const = 0;

    virtual DriveFile createFolder(const std::string& parentId, const std::string& name) const = 0;

    virtual DriveFile uploadFile(const std::string& parentId, const std::string& name, std::istream& content) const = 0;

    virtual void grantPermission(const std::string& fileId, const std::string& type, const std::string& role) const = 0;

    virtual void deleteFile(const std::string& fileId) const = 0;

    [[nodiscard]] virtual std::unique_ptr<std::istream> download(const std::string& fileId) const = 0;
};

}
