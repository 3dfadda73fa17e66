#pragma once

#include "storage/drive/DriveClient.hpp"

#include <optional>
#include <string>
#include <vector>

namespace unistore::storage::drive {

/**
 * Walks slash-delimited logical paths down an ID-addressed hierarchy.
 *
 * Each segment is looked up as "children of the current id named segment".
 * Intermediate segments only match folders; the terminal segment of
 * resolve()/resolveAll() matches any node. Duplicate names are tolerated:
 * the first match wins while walking, resolveAll() returns all of them.
 */
class PathResolver {
public:
    static constexpr const auto* DEFAULT_ROOT_ID = "root";

    explicit PathResolver(const DriveClient& client, std::string rootId = DEFAULT_ROOT_ID);

    [[nodiscard]] const std::string& rootId() const { return rootId_; }

    // Folder id of the last segment, creating every missing folder on the way.
    std::string ensureFolder(const std::vector<std::string>& segments) const;

    // Folder id of the last segment, or nullopt if any segment is missing.
    [[nodiscard]] std::optional<std::string> findFolder(const std::vector<std::string>& segments) const;

    // As findFolder(), but a missing segment is a NotFound naming it.
    [[nodiscard]] std::string resolveFolder(const std::vector<std::string>& segments) const;

    // Every node matching the terminal segment. NotFound if there is none.
    [[nodiscard]] std::vector<DriveFile> resolveAll(const std::vector<std::string>& segments) const;

    // First node matching the terminal segment.
    [[nodiscard]] DriveFile resolve(const std::vector<std::string>& segments) const;

private:
    const DriveClient& client_;
    std::string rootId_;
};

}
