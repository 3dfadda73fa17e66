#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

using namespace unistore::config;

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    const auto cfg = parseConfig("");
    EXPECT_EQ(cfg.storage.default_backend, "local");
    EXPECT_EQ(cfg.storage.drive.delete_batch_threshold, 50u);
    EXPECT_EQ(cfg.storage.drive.root_id, "root");
    EXPECT_EQ(cfg.storage.blob.connection_secret, "BlobConnectionString");
    EXPECT_EQ(cfg.secrets.source, SecretSource::Env);
    EXPECT_EQ(cfg.secrets.cache_ttl, std::chrono::minutes(60));
    EXPECT_TRUE(cfg.logging.log_dir.empty());
}

TEST(ConfigTest, ParsesEverySection) {
    const auto cfg = parseConfig(R"(
logging:
  log_dir: /var/log/unistore
  log_levels:
    console_log_level: warn
    subsystem_levels:
      cloud: debug
secrets:
  source: file
  file: /tmp/secrets.yaml
  cache_ttl_minutes: 5
storage:
  default_backend: drive
  local:
    root: /srv/data
  blob:
    connection_secret: MyBlob
  drive:
    credential_secret: MyDrive
    root_id: abc123
    delete_batch_threshold: 10
    share_type: domain
    share_role: writer
)");

    EXPECT_EQ(cfg.logging.log_dir.string(), "/var/log/unistore");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.cloud, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.storage, spdlog::level::info);

    EXPECT_EQ(cfg.secrets.source, SecretSource::File);
    EXPECT_EQ(cfg.secrets.file.string(), "/tmp/secrets.yaml");
    EXPECT_EQ(cfg.secrets.cache_ttl, std::chrono::minutes(5));

    EXPECT_EQ(cfg.storage.default_backend, "drive");
    EXPECT_EQ(cfg.storage.local.root.string(), "/srv/data");
    EXPECT_EQ(cfg.storage.blob.connection_secret, "MyBlob");
    EXPECT_EQ(cfg.storage.drive.credential_secret, "MyDrive");
    EXPECT_EQ(cfg.storage.drive.root_id, "abc123");
    EXPECT_EQ(cfg.storage.drive.delete_batch_threshold, 10u);
    EXPECT_EQ(cfg.storage.drive.share_type, "domain");
    EXPECT_EQ(cfg.storage.drive.share_role, "writer");
}

TEST(ConfigTest, ZeroBatchThresholdIsRejected) {
    EXPECT_THROW((void)parseConfig("storage:\n  drive:\n    delete_batch_threshold: 0\n"), std::runtime_error);
}

TEST(ConfigTest, UnknownSecretSourceIsRejected) {
    EXPECT_THROW((void)parseConfig("secrets:\n  source: vault9000\n"), std::invalid_argument);
}

TEST(ConfigTest, NonMapRootIsRejected) {
    EXPECT_THROW((void)parseConfig("- just\n- a list\n"), std::runtime_error);
}

TEST(ConfigTest, DumpedConfigParsesBack) {
    Config cfg;
    cfg.storage.default_backend = "blob";
    cfg.storage.drive.delete_batch_threshold = 7;
    cfg.secrets.source = SecretSource::KeyVault;
    cfg.secrets.keyvault.vault_url = "https://v.vault.azure.net";

    const auto back = parseConfig(dumpConfig(cfg));
    EXPECT_EQ(back.storage.default_backend, "blob");
    EXPECT_EQ(back.storage.drive.delete_batch_threshold, 7u);
    EXPECT_EQ(back.secrets.source, SecretSource::KeyVault);
    EXPECT_EQ(back.secrets.keyvault.vault_url, "https://v.vault.azure.net");
}

TEST(ConfigRegistryTest, InitializedByTestMain) {
    EXPECT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_EQ(ConfigRegistry::get().storage.default_backend, "local");
}
