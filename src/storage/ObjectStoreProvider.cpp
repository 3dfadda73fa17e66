#include "storage/ObjectStoreProvider.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"
#include "util/logicalPath.hpp"

#include <algorithm>
#include <utility>

using namespace unistore::storage;
using namespace unistore::util;
using namespace unistore::log;

ObjectStoreProvider::ObjectStoreProvider(std::unique_ptr<blob::BlobClient> client)
    : client_(std::move(client)) {
    if (!client_) throw std::invalid_argument("ObjectStoreProvider requires a BlobClient");
}

std::string ObjectStoreProvider::addImpl(const std::string& path, std::istream& content, const bool overwrite) const {
    const auto [container, blobName] = splitContainerPath(path);
    if (blobName.empty())
        throwError(ErrorKind::InvalidArgument, "Path must name a blob inside container '" + container + "'", path);

    if (!client_->containerExists(container)) {
        client_->createContainer(container);
        Registry::storage()->info("[ObjectStoreProvider] Created container {}", container);
    }

    client_->putBlob(container, blobName, content, overwrite);
    Registry::storage()->debug("[ObjectStoreProvider] Uploaded {}/{}", container, blobName);
    return client_->blobUri(container, blobName);
}

void ObjectStoreProvider::removeImpl(const std::string& path) const {
    const auto [container, blobName] = splitContainerPath(path);

    if (!client_->containerExists(container))
        throwError(ErrorKind::NotFound, "Container not found: " + container, path);

    if (blobName.empty()) {
        client_->deleteContainer(container);
        Registry::storage()->info("[ObjectStoreProvider] Deleted container {}", container);
        return;
    }

    if (client_->blobExists(container, blobName)) {
        client_->deleteBlob(container, blobName);
        return;
    }

    // Not a blob: treat it as a virtual folder and drop everything under it.
    const auto blobs = client_->listFlat(container, blobName + "/");
    if (blobs.empty()) throwError(ErrorKind::NotFound, "Blob not found: " + blobName, path);

    for (const auto& b : blobs) client_->deleteBlob(container, b.name);
    Registry::storage()->debug("[ObjectStoreProvider] Deleted {} blobs under {}/{}/", blobs.size(), container, blobName);
}

bool ObjectStoreProvider::existsImpl(const std::string& path) const {
    const auto [container, blobName] = splitContainerPath(path);
    if (blobName.empty()) return false;
    return client_->blobExists(container, blobName);
}

model::ItemList ObjectStoreProvider::listImpl(const std::string& path) const {
    const auto [container, folder] = splitContainerPath(path);

    if (!client_->containerExists(container))
        throwError(ErrorKind::NotFound, "Container not found: " + container, path);

    const std::string prefix = folder.empty() ? "" : folder + "/";
    const auto entries = client_->listByHierarchy(container, prefix, "/");

    if (!prefix.empty() && entries.empty())
        throwError(ErrorKind::NotFound, "Folder not found: " + folder, path);

    model::ItemList items;
    items.reserve(entries.size());
    for (const auto& e : entries) {
        auto name = e.name.substr(std::min(prefix.size(), e.name.size()));
        if (e.is_prefix) {
            if (!name.empty() && name.back() == '/') name.pop_back();
            items.push_back(std::make_shared<model::Item>(name, model::ItemKind::Folder));
        } else {
            items.push_back(std::make_shared<model::Item>(name, model::ItemKind::File));
        }
    }
    return items;
}

std::unique_ptr<std::istream> ObjectStoreProvider::readImpl(const std::string& path) const {
    const auto [container, blobName] = splitContainerPath(path);
    if (blobName.empty())
        throwError(ErrorKind::InvalidArgument, "Path must name a blob inside container '" + container + "'", path);
    return client_->getBlob(container, blobName);
}
