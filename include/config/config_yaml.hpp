#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace unistore::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["unistore"] = to_std_string(spdlog::level::to_string_view(rhs.unistore));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cloud"]    = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["secrets"]  = to_std_string(spdlog::level::to_string_view(rhs.secrets));
        node["config"]   = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.unistore = spdlog::level::from_str(node["unistore"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("info"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.secrets = spdlog::level::from_str(node["secrets"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

// === KeyVaultConfig ===
template<>
struct convert<KeyVaultConfig> {
    static Node encode(const KeyVaultConfig& rhs) {
        Node node;
        node["vault_url"] = rhs.vault_url;
        node["tenant_id"] = rhs.tenant_id;
        node["client_id"] = rhs.client_id;
        node["client_secret"] = rhs.client_secret;
        return node;
    }

    static bool decode(const Node& node, KeyVaultConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.vault_url = node["vault_url"].as<std::string>("");
        rhs.tenant_id = node["tenant_id"].as<std::string>("");
        rhs.client_id = node["client_id"].as<std::string>("");
        rhs.client_secret = node["client_secret"].as<std::string>("");
        return true;
    }
};

// === SecretsConfig ===
template<>
struct convert<SecretsConfig> {
    static Node encode(const SecretsConfig& rhs) {
        Node node;
        node["source"] = to_string(rhs.source);
        node["env_prefix"] = rhs.env_prefix;
        node["file"] = rhs.file.string();
        node["cache_ttl_minutes"] = rhs.cache_ttl.count();
        node["keyvault"] = rhs.keyvault;
        return node;
    }

    static bool decode(const Node& node, SecretsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.source = secret_source_from_string(node["source"].as<std::string>("env"));
        rhs.env_prefix = node["env_prefix"].as<std::string>("UNISTORE_");
        rhs.file = node["file"].as<std::string>("/etc/unistore/secrets.yaml");
        rhs.cache_ttl = std::chrono::minutes(node["cache_ttl_minutes"].as<long>(60));
        if (node["keyvault"]) rhs.keyvault = node["keyvault"].as<KeyVaultConfig>();
        return true;
    }
};

// === LocalStorageConfig ===
template<>
struct convert<LocalStorageConfig> {
    static Node encode(const LocalStorageConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        return node;
    }

    static bool decode(const Node& node, LocalStorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("");
        return true;
    }
};

// === BlobStorageConfig ===
template<>
struct convert<BlobStorageConfig> {
    static Node encode(const BlobStorageConfig& rhs) {
        Node node;
        node["connection_secret"] = rhs.connection_secret;
        return node;
    }

    static bool decode(const Node& node, BlobStorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.connection_secret = node["connection_secret"].as<std::string>("BlobConnectionString");
        return true;
    }
};

// === DriveStorageConfig ===
template<>
struct convert<DriveStorageConfig> {
    static Node encode(const DriveStorageConfig& rhs) {
        Node node;
        node["credential_secret"] = rhs.credential_secret;
        node["root_id"] = rhs.root_id;
        node["delete_batch_threshold"] = rhs.delete_batch_threshold;
        node["share_type"] = rhs.share_type;
        node["share_role"] = rhs.share_role;
        return node;
    }

    static bool decode(const Node& node, DriveStorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.credential_secret = node["credential_secret"].as<std::string>("DriveCredential");
        rhs.root_id = node["root_id"].as<std::string>("root");
        rhs.delete_batch_threshold = node["delete_batch_threshold"].as<std::size_t>(50);
        if (rhs.delete_batch_threshold == 0) return false;
        rhs.share_type = node["share_type"].as<std::string>("anyone");
        rhs.share_role = node["share_role"].as<std::string>("reader");
        return true;
    }
};

// === StorageConfig ===
template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["default_backend"] = rhs.default_backend;
        node["local"] = rhs.local;
        node["blob"] = rhs.blob;
        node["drive"] = rhs.drive;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_backend = node["default_backend"].as<std::string>("local");
        if (node["local"]) rhs.local = node["local"].as<LocalStorageConfig>();
        if (node["blob"]) rhs.blob = node["blob"].as<BlobStorageConfig>();
        if (node["drive"]) rhs.drive = node["drive"].as<DriveStorageConfig>();
        return true;
    }
};

}
