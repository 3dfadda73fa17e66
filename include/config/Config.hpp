#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace unistore::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum unistore = spdlog::level::info;   // Start-up, CLI level events
    spdlog::level::level_enum storage  = spdlog::level::info;   // Provider operations and their failures
    spdlog::level::level_enum cloud    = spdlog::level::warn;   // REST errors, not every request
    spdlog::level::level_enum secrets  = spdlog::level::warn;   // Lookup failures
    spdlog::level::level_enum config   = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty = console only
    LogLevelsConfig levels;
};

enum class SecretSource { Env, File, KeyVault };

std::string to_string(SecretSource source);
SecretSource secret_source_from_string(const std::string& str);

struct KeyVaultConfig {
    std::string vault_url;
    std::string tenant_id;
    std::string client_id;
    std::string client_secret;
};

struct SecretsConfig {
    SecretSource source = SecretSource::Env;
    std::string env_prefix = "UNISTORE_";
    std::filesystem::path file = "/etc/unistore/secrets.yaml";
    std::chrono::minutes cache_ttl = std::chrono::minutes(60);
    KeyVaultConfig keyvault;
};

struct LocalStorageConfig {
    std::filesystem::path root;  // empty = logical paths are native paths
};

struct BlobStorageConfig {
    std::string connection_secret = "BlobConnectionString";
};

struct DriveStorageConfig {
    std::string credential_secret = "DriveCredential";
    std::string root_id = "root";
    std::size_t delete_batch_threshold = 50;
    std::string share_type = "anyone";
    std::string share_role = "reader";
};

struct StorageConfig {
    std::string default_backend = "local";
    LocalStorageConfig local;
    BlobStorageConfig blob;
    DriveStorageConfig drive;
};

struct Config {
    LoggingConfig logging;
    SecretsConfig secrets;
    StorageConfig storage;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);
std::string dumpConfig(const Config& cfg);

} // namespace unistore::config
