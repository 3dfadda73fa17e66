#pragma once

#include "config/Config.hpp"
#include "storage/EndpointFactory.hpp"
#include "storage/Provider.hpp"
#include "storage/blob/BlobClient.hpp"
#include "storage/drive/DriveClient.hpp"

#include <memory>

namespace unistore::secrets {
class Provider;
}

namespace unistore::storage {

/**
 * Builds providers from the storage section of the configuration. Cloud
 * backends look their connection string / credential up in the secret
 * provider once, at construction, and hand it to the matching endpoint
 * factory.
 */
class ProviderFactory {
public:
    ProviderFactory(config::StorageConfig cfg, std::shared_ptr<secrets::Provider> secrets);

    ProviderFactory(config::StorageConfig cfg,
                    std::shared_ptr<secrets::Provider> secrets,
                    std::shared_ptr<EndpointFactory<blob::BlobClient>> blobEndpoints,
                    std::shared_ptr<EndpointFactory<drive::DriveClient>> driveEndpoints);

    [[nodiscard]] std::unique_ptr<Provider> create(BackendType type) const;

    // Backend named by storage.default_backend.
    [[nodiscard]] std::unique_ptr<Provider> createDefault() const;

private:
    config::StorageConfig cfg_;
    std::shared_ptr<secrets::Provider> secrets_;
    std::shared_ptr<EndpointFactory<blob::BlobClient>> blobEndpoints_;
    std::shared_ptr<EndpointFactory<drive::DriveClient>> driveEndpoints_;
};

}
