#include <gtest/gtest.h>
#include "storage/ProviderFactory.hpp"
#include "storage/DriveProvider.hpp"
#include "storage/LocalDiskProvider.hpp"
#include "storage/Error.hpp"
#include "secrets/Provider.hpp"
#include "InMemoryBlobClient.hpp"
#include "InMemoryDriveClient.hpp"

#include <map>

using namespace unistore;
using namespace unistore::storage;

namespace {

class MapSecrets final : public secrets::Provider {
public:
    explicit MapSecrets(std::map<std::string, std::string> values) : values_(std::move(values)) {}

    [[nodiscard]] std::string getSecret(const std::string& name) const override {
        const auto it = values_.find(name);
        if (it == values_.end()) throwError(ErrorKind::NotFound, "no secret " + name);
        return it->second;
    }

private:
    std::map<std::string, std::string> values_;
};

template <typename Client, typename Fake>
class RecordingEndpoints final : public EndpointFactory<Client> {
public:
    mutable std::string lastConnection;

    [[nodiscard]] std::unique_ptr<Client> createEndpoint(const std::string& connection) const override {
        lastConnection = connection;
        return std::make_unique<Fake>();
    }
};

using BlobEndpoints = RecordingEndpoints<blob::BlobClient, test::InMemoryBlobClient>;
using DriveEndpoints = RecordingEndpoints<drive::DriveClient, test::InMemoryDriveClient>;

}

class ProviderFactoryTest : public ::testing::Test {
protected:
    config::StorageConfig cfg;
    std::shared_ptr<MapSecrets> secrets = std::make_shared<MapSecrets>(std::map<std::string, std::string>{
        {"BlobConnectionString", "AccountName=a;AccountKey=Zm9v"},
        {"DriveCredential", R"({"type":"authorized_user"})"},
    });
    std::shared_ptr<BlobEndpoints> blobEndpoints = std::make_shared<BlobEndpoints>();
    std::shared_ptr<DriveEndpoints> driveEndpoints = std::make_shared<DriveEndpoints>();

    [[nodiscard]] ProviderFactory factory(std::shared_ptr<secrets::Provider> s) const {
        return {cfg, std::move(s), blobEndpoints, driveEndpoints};
    }
};

TEST_F(ProviderFactoryTest, LocalNeedsNoSecrets) {
    cfg.local.root = "/srv/unistore";
    const auto provider = factory(nullptr).create(BackendType::LocalDisk);
    ASSERT_EQ(provider->type(), BackendType::LocalDisk);
    EXPECT_EQ(dynamic_cast<const LocalDiskProvider&>(*provider).root().string(), "/srv/unistore");
}

TEST_F(ProviderFactoryTest, ObjectStoreUsesConnectionSecret) {
    const auto provider = factory(secrets).create(BackendType::ObjectStore);
    EXPECT_EQ(provider->type(), BackendType::ObjectStore);
    EXPECT_EQ(blobEndpoints->lastConnection, "AccountName=a;AccountKey=Zm9v");
}

TEST_F(ProviderFactoryTest, DriveUsesCredentialSecretAndOptions) {
    cfg.drive.delete_batch_threshold = 12;
    const auto provider = factory(secrets).create(BackendType::Drive);
    ASSERT_EQ(provider->type(), BackendType::Drive);
    EXPECT_EQ(driveEndpoints->lastConnection, R"({"type":"authorized_user"})");
    EXPECT_EQ(dynamic_cast<const DriveProvider&>(*provider).deleteBatchThreshold(), 12u);
}

TEST_F(ProviderFactoryTest, RenamedSecretIsLookedUp) {
    cfg.blob.connection_secret = "Missing";
    try {
        (void)factory(secrets).create(BackendType::ObjectStore);
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(ProviderFactoryTest, CloudBackendsNeedSecrets) {
    EXPECT_THROW((void)factory(nullptr).create(BackendType::ObjectStore), StorageError);
    EXPECT_THROW((void)factory(nullptr).create(BackendType::Drive), StorageError);
}

TEST_F(ProviderFactoryTest, DefaultBackendFromConfig) {
    cfg.default_backend = "azure";
    EXPECT_EQ(factory(secrets).createDefault()->type(), BackendType::ObjectStore);

    cfg.default_backend = "sftp";
    EXPECT_THROW((void)factory(secrets).createDefault(), StorageError);
}

TEST_F(ProviderFactoryTest, ProvidersShareOneInterface) {
    cfg.local.root = ::testing::TempDir();
    const auto f = factory(secrets);
    for (const auto type : {BackendType::LocalDisk, BackendType::ObjectStore, BackendType::Drive}) {
        const auto provider = f.create(type);
        EXPECT_THROW((void)provider->exists("  "), StorageError) << to_string(type);
    }
}
