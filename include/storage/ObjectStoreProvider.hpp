#pragma once

#include "storage/Provider.hpp"
#include "storage/blob/BlobClient.hpp"

#include <memory>

namespace unistore::storage {

/**
 * Provider over a flat object store with virtual folders.
 *
 * The first path segment names the container (lower-cased), the remaining
 * segments joined with '/' form the blob name. Folders only exist as blob
 * name prefixes; listing synthesizes them from the delimiter '/'.
 */
class ObjectStoreProvider final : public Provider {
public:
    explicit ObjectStoreProvider(std::unique_ptr<blob::BlobClient> client);
    ~ObjectStoreProvider() override = default;

    [[nodiscard]] BackendType type() const override { return BackendType::ObjectStore; }

    [[nodiscard]] const blob::BlobClient& client() const { return *client_; }

protected:
    std::string addImpl(const std::string& path, std::istream& content, bool overwrite) const override;
    void removeImpl(const std::string& path) const override;
    bool existsImpl(const std::string& path) const override;
    model::ItemList listImpl(const std::string& path) const override;
    std::unique_ptr<std::istream> readImpl(const std::string& path) const override;

private:
    std::unique_ptr<blob::BlobClient> client_;
};

}
