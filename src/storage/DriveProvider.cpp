#include "storage/DriveProvider.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"
#include "util/logicalPath.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <regex>
#include <utility>

using namespace unistore::storage;
using namespace unistore::storage::drive;
using namespace unistore::util;
using namespace unistore::log;

namespace {

const DriveClient& requireClient(const std::unique_ptr<DriveClient>& client) {
    if (!client) throw std::invalid_argument("DriveProvider requires a DriveClient");
    return *client;
}

std::vector<std::string> parentSegments(const std::vector<std::string>& segments) {
    return {segments.begin(), segments.end() - 1};
}

}

DriveProvider::DriveProvider(std::unique_ptr<DriveClient> client, DriveOptions options)
    : client_(std::move(client)),
      options_(std::move(options)),
      resolver_(requireClient(client_), options_.root_id) {
    if (options_.delete_batch_threshold == 0) throw std::invalid_argument("delete_batch_threshold must be positive");
}

std::string DriveProvider::shareableLink(const std::string& fileId) {
    return SHAREABLE_LINK_PREFIX + fileId + SHAREABLE_LINK_SUFFIX;
}

std::optional<std::string> DriveProvider::extractFileId(const std::string& link) {
    static const std::regex pattern(R"(/file/d/([^/]+?)/view)");
    std::smatch match;
    if (std::regex_search(link, match, pattern)) return match[1].str();
    return std::nullopt;
}

std::string DriveProvider::addImpl(const std::string& path, std::istream& content, const bool overwrite) const {
    const auto segments = splitPath(path);
    if (segments.empty()) throwError(ErrorKind::InvalidArgument, "Path has no segments", path);

    const auto parentId = resolver_.ensureFolder(parentSegments(segments));
    const auto& name = segments.back();

    const auto existing = client_->findChildren(parentId, name, NodeFilter::Any);
    if (std::any_of(existing.begin(), existing.end(), [](const DriveFile& f) { return f.isFolder(); }))
        throwError(ErrorKind::AlreadyExists, "A folder named '" + name + "' already exists", path);

    if (!existing.empty()) {
        if (!overwrite) throwError(ErrorKind::AlreadyExists, "File already exists: " + name, path);
        for (const auto& f : existing) client_->deleteFile(f.id);
        Registry::storage()->info("[DriveProvider] Overwriting {} ({} previous copies removed)", path, existing.size());
    }

    const auto uploaded = client_->uploadFile(parentId, name, content);
    client_->grantPermission(uploaded.id, options_.share_type, options_.share_role);

    const auto link = shareableLink(uploaded.id);
    Registry::storage()->debug("[DriveProvider] Uploaded {} -> {}", path, link);
    return link;
}

void DriveProvider::removeImpl(const std::string& path) const {
    const auto segments = splitPath(path);
    if (segments.empty()) throwError(ErrorKind::InvalidArgument, "Path has no segments", path);
    if (segments.size() == 1 && segments.front() == "root")
        throwError(ErrorKind::InvalidArgument, "The root folder cannot be deleted", path);

    const auto matches = resolver_.resolveAll(segments);

    std::vector<std::string> ids;
    ids.reserve(matches.size());
    for (const auto& m : matches) ids.push_back(m.id);

    deleteInBatches(ids);
    Registry::storage()->debug("[DriveProvider] Deleted {} node(s) for {}", ids.size(), path);
}

void DriveProvider::deleteInBatches(const std::vector<std::string>& ids) const {
    const auto batchSize = options_.delete_batch_threshold;

    for (std::size_t start = 0; start < ids.size(); start += batchSize) {
        const auto end = std::min(start + batchSize, ids.size());

        std::vector<std::future<void>> futures;
        futures.reserve(end - start);
        for (std::size_t i = start; i < end; ++i)
            futures.push_back(std::async(std::launch::async, [this, &id = ids[i]] { client_->deleteFile(id); }));

        // Let the whole batch settle before surfacing the first failure.
        std::exception_ptr firstError;
        for (auto& f : futures) {
            try {
                f.get();
            } catch (...) {
                if (!firstError) firstError = std::current_exception();
            }
        }
        if (firstError) std::rethrow_exception(firstError);
    }
}

bool DriveProvider::existsImpl(const std::string& path) const {
    const auto segments = splitPath(path);
    if (segments.empty()) throwError(ErrorKind::InvalidArgument, "Path has no segments", path);

    const auto parentId = resolver_.findFolder(parentSegments(segments));
    if (!parentId) return false;

    return !client_->findChildren(*parentId, segments.back(), NodeFilter::Any).empty();
}

model::ItemList DriveProvider::listImpl(const std::string& path) const {
    const auto segments = splitPath(path);
    if (segments.empty()) throwError(ErrorKind::InvalidArgument, "Path has no segments", path);

    const bool isRoot = segments.size() == 1 && segments.front() == "root";
    const auto folderId = isRoot ? resolver_.rootId() : resolver_.resolveFolder(segments);

    model::ItemList items;
    for (const auto& f : client_->listChildren(folderId))
        items.push_back(std::make_shared<model::DriveItem>(
            f.name, f.isFolder() ? model::ItemKind::Folder : model::ItemKind::File, f.id, folderId));
    return items;
}

std::unique_ptr<std::istream> DriveProvider::readImpl(const std::string& path) const {
    const auto segments = splitPath(path);
    if (segments.empty()) throwError(ErrorKind::InvalidArgument, "Path has no segments", path);

    const auto file = resolver_.resolve(segments);
    if (file.isFolder()) throwError(ErrorKind::NotFound, "'" + file.name + "' is a folder, not a file", path);
    return client_->download(file.id);
}
