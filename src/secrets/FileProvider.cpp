#include "secrets/FileProvider.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

using namespace unistore::secrets;
using namespace unistore::storage;
using namespace unistore::log;

FileProvider::FileProvider(const std::filesystem::path& path) : path_(path) {
    if (!std::filesystem::exists(path_))
        throwError(ErrorKind::NotFound, "Secrets file not found: " + path_.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_.string());
    } catch (const YAML::Exception& e) {
        throwError(ErrorKind::InvalidArgument, fmt::format("Failed to parse secrets file {}: {}", path_.string(), e.what()));
    }

    if (root.IsNull()) return;
    if (!root.IsMap()) throwError(ErrorKind::InvalidArgument, "Secrets file must be a YAML map: " + path_.string());

    for (const auto& it : root) {
        if (!it.second.IsScalar())
            throwError(ErrorKind::InvalidArgument,
                       fmt::format("Secret '{}' in {} is not a scalar", it.first.as<std::string>(), path_.string()));
        secrets_[it.first.as<std::string>()] = it.second.as<std::string>();
    }

    Registry::secrets()->debug("[FileProvider] Loaded {} secrets from {}", secrets_.size(), path_.string());
}

std::string FileProvider::getSecret(const std::string& name) const {
    const auto it = secrets_.find(name);
    if (it == secrets_.end()) {
        Registry::secrets()->warn("[FileProvider] Secret '{}' not present in {}", name, path_.string());
        throwError(ErrorKind::NotFound, "Secret not found: " + name);
    }
    return it->second;
}
