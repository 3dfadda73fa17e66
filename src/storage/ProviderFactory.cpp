#include "storage/ProviderFactory.hpp"
#include "storage/DriveProvider.hpp"
#include "storage/Error.hpp"
#include "storage/LocalDiskProvider.hpp"
#include "storage/ObjectStoreProvider.hpp"
#include "cloud/azure/EndpointFactory.hpp"
#include "cloud/gdrive/EndpointFactory.hpp"
#include "secrets/Provider.hpp"
#include "log/Registry.hpp"

#include <utility>

using namespace unistore::storage;
using namespace unistore::log;

ProviderFactory::ProviderFactory(config::StorageConfig cfg, std::shared_ptr<secrets::Provider> secrets)
    : ProviderFactory(std::move(cfg), std::move(secrets),
                      std::make_shared<cloud::azure::EndpointFactory>(),
                      std::make_shared<cloud::gdrive::EndpointFactory>()) {}

ProviderFactory::ProviderFactory(config::StorageConfig cfg,
                                 std::shared_ptr<secrets::Provider> secrets,
                                 std::shared_ptr<EndpointFactory<blob::BlobClient>> blobEndpoints,
                                 std::shared_ptr<EndpointFactory<drive::DriveClient>> driveEndpoints)
    : cfg_(std::move(cfg)),
      secrets_(std::move(secrets)),
      blobEndpoints_(std::move(blobEndpoints)),
      driveEndpoints_(std::move(driveEndpoints)) {}

std::unique_ptr<Provider> ProviderFactory::create(const BackendType type) const {
    switch (type) {
        case BackendType::LocalDisk:
            Registry::storage()->debug("[ProviderFactory] Local disk provider, root '{}'", cfg_.local.root.string());
            return std::make_unique<LocalDiskProvider>(cfg_.local.root);

        case BackendType::ObjectStore: {
            if (!secrets_) throwError(ErrorKind::InvalidArgument, "Object store backend requires a secret provider");
            const auto connection = secrets_->getSecret(cfg_.blob.connection_secret);
            Registry::storage()->debug("[ProviderFactory] Object store provider from secret '{}'", cfg_.blob.connection_secret);
            return std::make_unique<ObjectStoreProvider>(blobEndpoints_->createEndpoint(connection));
        }

        case BackendType::Drive: {
            if (!secrets_) throwError(ErrorKind::InvalidArgument, "Drive backend requires a secret provider");
            const auto credential = secrets_->getSecret(cfg_.drive.credential_secret);
            Registry::storage()->debug("[ProviderFactory] Drive provider from secret '{}'", cfg_.drive.credential_secret);

            DriveOptions options;
            options.root_id = cfg_.drive.root_id;
            options.delete_batch_threshold = cfg_.drive.delete_batch_threshold;
            options.share_type = cfg_.drive.share_type;
            options.share_role = cfg_.drive.share_role;
            return std::make_unique<DriveProvider>(driveEndpoints_->createEndpoint(credential), std::move(options));
        }
    }
    throwError(ErrorKind::InvalidArgument, "Unknown backend type");
}

std::unique_ptr<Provider> ProviderFactory::createDefault() const {
    return create(backend_type_from_string(cfg_.default_backend));
}
