#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace unistore::config {

std::string to_string(const SecretSource source) {
    switch (source) {
        case SecretSource::Env: return "env";
        case SecretSource::File: return "file";
        case SecretSource::KeyVault: return "keyvault";
    }
    return "env";
}

SecretSource secret_source_from_string(const std::string& str) {
    const auto s = boost::algorithm::to_lower_copy(str);
    if (s == "env") return SecretSource::Env;
    if (s == "file") return SecretSource::File;
    if (s == "keyvault") return SecretSource::KeyVault;
    throw std::invalid_argument("Unknown secrets source: " + str);
}

static Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a YAML map");

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["secrets"]) YAML::convert<SecretsConfig>::decode(node, cfg.secrets);
    if (auto node = root["storage"]) {
        if (!YAML::convert<StorageConfig>::decode(node, cfg.storage))
            throw std::runtime_error("Invalid 'storage' section in config");
    }

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["logging"] = cfg.logging;
    root["secrets"] = cfg.secrets;
    root["storage"] = cfg.storage;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
