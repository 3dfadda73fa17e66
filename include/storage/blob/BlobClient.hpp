#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace unistore::storage::blob {

struct BlobEntry {
    std::string name;       // full blob name, or the prefix (with trailing delimiter) for virtual folders
    bool is_prefix = false;
    uintmax_t size = 0;
};

/**
 * Handle on one object-store account.
 *
 * Implementations report failures as StorageError; a missing container is
 * reported as ErrorKind::NotFound.
 */
class BlobClient {
public:
    virtual ~BlobClient() = default;

    [[nodiscard]] virtual bool containerExists(const std::string& container) const = 0;
    // No-op if the container already exists.
    virtual void createContainer(const std::string& container) const = 0;
    virtual void deleteContainer(const std::string& container) const = 0;

    [[nodiscard]] virtual bool blobExists(const std::string& container, const std::string& blob) const = 0;

    // Fails with AlreadyExists when !overwrite and the blob is present.
    virtual void putBlob(const std::string& container, const std::string& blob,
                         std::istream& content, bool overwrite) const = 0;

    [[nodiscard]] virtual std::unique_ptr<std::istream> getBlob(const std::string& container,
                                                                const std::string& blob) const = 0;

    virtual void deleteBlob(const std::string& container, const std::string& blob) const = 0;

    // One level of the hierarchy under prefix, every page.
    [[nodiscard]] virtual std::vector<BlobEntry> listByHierarchy(const std::string& container,
                                                                 const std::string& prefix,
                                                                 const std::string& delimiter = "/") const = 0;

    // Every blob whose name starts with prefix, flat.
    [[nodiscard]] virtual std::vector<BlobEntry> listFlat(const std::string& container,
                                                          const std::string& prefix) const = 0;

    [[nodiscard]] virtual std::string blobUri(const std::string& container, const std::string& blob) const = 0;
};

}
