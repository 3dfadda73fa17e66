#pragma once

#include "storage/Provider.hpp"
#include "storage/drive/DriveClient.hpp"
#include "storage/drive/PathResolver.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace unistore::storage {

struct DriveOptions {
    std::string root_id = drive::PathResolver::DEFAULT_ROOT_ID;
    std::size_t delete_batch_threshold = 50;
    std::string share_type = "anyone";
    std::string share_role = "reader";
};

/**
 * Provider over an ID-addressed drive.
 *
 * Every path segment goes through a PathResolver. Uploaded files are shared
 * with share_type/share_role and add() returns their shareable link. Deleting
 * a name that matches several nodes removes all of them, delete_batch_threshold
 * at a time; nodes inside a batch are deleted concurrently.
 */
class DriveProvider final : public Provider {
public:
    static constexpr const auto* SHAREABLE_LINK_PREFIX = "https://drive.google.com/file/d/";
    static constexpr const auto* SHAREABLE_LINK_SUFFIX = "/view";

    explicit DriveProvider(std::unique_ptr<drive::DriveClient> client, DriveOptions options = {});
    ~DriveProvider() override = default;

    [[nodiscard]] BackendType type() const override { return BackendType::Drive; }

    [[nodiscard]] std::size_t deleteBatchThreshold() const { return options_.delete_batch_threshold; }
    [[nodiscard]] const drive::PathResolver& resolver() const { return resolver_; }

    [[nodiscard]] static std::string shareableLink(const std::string& fileId);

    // nullopt when link is not of the form .../file/d/<id>/view
    [[nodiscard]] static std::optional<std::string> extractFileId(const std::string& link);

protected:
    std::string addImpl(const std::string& path, std::istream& content, bool overwrite) const override;
    void removeImpl(const std::string& path) const override;
    bool existsImpl(const std::string& path) const override;
    model::ItemList listImpl(const std::string& path) const override;
    std::unique_ptr<std::istream> readImpl(const std::string& path) const override;

private:
    std::unique_ptr<drive::DriveClient> client_;
    DriveOptions options_;
    drive::PathResolver resolver_;

    void deleteInBatches(const std::vector<std::string>& ids) const;
};

}
