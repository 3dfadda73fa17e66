#include "storage/drive/PathResolver.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"
#include "util/logicalPath.hpp"

#include <utility>

using namespace unistore::storage;
using namespace unistore::storage::drive;
using namespace unistore::log;

PathResolver::PathResolver(const DriveClient& client, std::string rootId)
    : client_(client), rootId_(std::move(rootId)) {
    if (rootId_.empty()) throw std::invalid_argument("PathResolver requires a root id");
}

std::string PathResolver::ensureFolder(const std::vector<std::string>& segments) const {
    auto current = rootId_;
    for (const auto& segment : segments) {
        const auto matches = client_.findChildren(current, segment, NodeFilter::Folder);
        if (!matches.empty()) {
            current = matches.front().id;
            continue;
        }

        const auto created = client_.createFolder(current, segment);
        Registry::storage()->debug("[PathResolver] Created folder '{}' ({}) under {}", segment, created.id, current);
        current = created.id;
    }
    return current;
}

std::optional<std::string> PathResolver::findFolder(const std::vector<std::string>& segments) const {
    auto current = rootId_;
    for (const auto& segment : segments) {
        const auto matches = client_.findChildren(current, segment, NodeFilter::Folder);
        if (matches.empty()) return std::nullopt;
        current = matches.front().id;
    }
    return current;
}

std::string PathResolver::resolveFolder(const std::vector<std::string>& segments) const {
    auto current = rootId_;
    for (const auto& segment : segments) {
        const auto matches = client_.findChildren(current, segment, NodeFilter::Folder);
        if (matches.empty())
            throwError(ErrorKind::NotFound, "Path segment '" + segment + "' not found", util::joinPath(segments));
        current = matches.front().id;
    }
    return current;
}

std::vector<DriveFile> PathResolver::resolveAll(const std::vector<std::string>& segments) const {
    if (segments.empty()) throwError(ErrorKind::InvalidArgument, "Path has no segments");

    const std::vector<std::string> parents(segments.begin(), segments.end() - 1);
    const auto parentId = resolveFolder(parents);

    auto matches = client_.findChildren(parentId, segments.back(), NodeFilter::Any);
    if (matches.empty())
        throwError(ErrorKind::NotFound, "Path segment '" + segments.back() + "' not found", util::joinPath(segments));
    return matches;
}

DriveFile PathResolver::resolve(const std::vector<std::string>& segments) const {
    return resolveAll(segments).front();
}
