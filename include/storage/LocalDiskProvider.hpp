#pragma once

#include "storage/Provider.hpp"

#include <filesystem>

namespace unistore::storage {

namespace fs = std::filesystem;

class LocalDiskProvider final : public Provider {
public:
    // With an empty root, logical paths are used as native paths unchanged.
    // Otherwise they are resolved underneath root and may not leave it.
    explicit LocalDiskProvider(fs::path root = {});
    ~LocalDiskProvider() override = default;

    [[nodiscard]] BackendType type() const override { return BackendType::LocalDisk; }

    [[nodiscard]] fs::path resolvePath(const std::string& path) const;
    [[nodiscard]] const fs::path& root() const { return root_; }

protected:
    std::string addImpl(const std::string& path, std::istream& content, bool overwrite) const override;
    void removeImpl(const std::string& path) const override;
    bool existsImpl(const std::string& path) const override;
    model::ItemList listImpl(const std::string& path) const override;
    std::unique_ptr<std::istream> readImpl(const std::string& path) const override;

private:
    fs::path root_;
};

}
