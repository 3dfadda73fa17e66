#pragma once

#include "secrets/Provider.hpp"

#include <filesystem>
#include <map>

namespace unistore::secrets {

// Secrets from a flat YAML map (name: value), read once at construction.
class FileProvider final : public Provider {
public:
    explicit FileProvider(const std::filesystem::path& path);

    [[nodiscard]] std::string getSecret(const std::string& name) const override;

    [[nodiscard]] size_t size() const { return secrets_.size(); }

private:
    std::filesystem::path path_;
    std::map<std::string, std::string> secrets_;
};

}
