#pragma once

#include "storage/Error.hpp"
#include "storage/drive/DriveClient.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace unistore::test {

// ID-addressed drive kept in memory. Duplicate names under a parent are
// allowed, as on the real backend. Calls are counted for assertions.
class InMemoryDriveClient final : public storage::drive::DriveClient {
public:
    using DriveFile = storage::drive::DriveFile;
    using NodeFilter = storage::drive::NodeFilter;

    explicit InMemoryDriveClient(std::string rootId = "root") : rootId_(std::move(rootId)) {}

    [[nodiscard]] std::vector<DriveFile> findChildren(const std::string& parentId,
                                                      const std::string& name,
                                                      const NodeFilter filter) const override {
        std::lock_guard lock(mutex_);
        ++findCalls;
        std::vector<DriveFile> out;
        for (const auto& [id, node] : nodes_) {
            if (node.file.name != name || !isChildOf(node, parentId)) continue;
            if (filter == NodeFilter::Folder && !node.file.isFolder()) continue;
            if (filter == NodeFilter::File && node.file.isFolder()) continue;
            out.push_back(node.file);
        }
        sortByCreation(out);
        return out;
    }

    [[nodiscard]] std::vector<DriveFile> listChildren(const std::string& parentId) const override {
        std::lock_guard lock(mutex_);
        std::vector<DriveFile> out;
        for (const auto& [id, node] : nodes_)
            if (isChildOf(node, parentId)) out.push_back(node.file);
        sortByCreation(out);
        return out;
    }

    DriveFile createFolder(const std::string& parentId, const std::string& name) const override {
        std::lock_guard lock(mutex_);
        ++createFolderCalls;
        return insert(parentId, name, storage::drive::FOLDER_MIME_TYPE, {});
    }

    DriveFile uploadFile(const std::string& parentId, const std::string& name, std::istream& content) const override {
        std::string data{std::istreambuf_iterator<char>(content), std::istreambuf_iterator<char>()};
        std::lock_guard lock(mutex_);
        ++uploadCalls;
        return insert(parentId, name, storage::drive::OCTET_STREAM_MIME_TYPE, std::move(data));
    }

    void grantPermission(const std::string& fileId, const std::string& type, const std::string& role) const override {
        std::lock_guard lock(mutex_);
        nodeRef(fileId).permissions.push_back(type + ":" + role);
    }

    // With settleWindow set, each delete holds until no other delete has
    // started for that long, so deletes issued together finish together and
    // are recorded as one group in deleteGroups.
    void deleteFile(const std::string& fileId) const override {
        {
            std::unique_lock lock(mutex_);
            ++inFlightDeletes_;
            ++groupSize_;
            maxConcurrentDeletes = std::max(maxConcurrentDeletes, inFlightDeletes_);
            lastDeleteStart_ = std::chrono::steady_clock::now();
            arrived_.notify_all();
            if (settleWindow.count() > 0)
                while (std::chrono::steady_clock::now() - lastDeleteStart_ < settleWindow)
                    arrived_.wait_until(lock, lastDeleteStart_ + settleWindow);
        }
        if (deleteDelay.count() > 0) std::this_thread::sleep_for(deleteDelay);

        std::lock_guard lock(mutex_);
        if (--inFlightDeletes_ == 0) {
            deleteGroups.push_back(groupSize_);
            groupSize_ = 0;
        }
        ++deleteCalls;
        if (failDeleteOf == fileId) storage::throwError(storage::ErrorKind::BackendUnavailable, "Injected failure");
        nodeRef(fileId);
        removeSubtree(fileId);
    }

    [[nodiscard]] std::unique_ptr<std::istream> download(const std::string& fileId) const override {
        std::lock_guard lock(mutex_);
        return std::make_unique<std::istringstream>(nodeRef(fileId).content);
    }

    // Seeds a node directly, bypassing the counters.
    DriveFile seedFile(const std::string& parentId, const std::string& name, std::string content = {}) {
        std::lock_guard lock(mutex_);
        return insert(parentId, name, storage::drive::OCTET_STREAM_MIME_TYPE, std::move(content));
    }

    DriveFile seedFolder(const std::string& parentId, const std::string& name) {
        std::lock_guard lock(mutex_);
        return insert(parentId, name, storage::drive::FOLDER_MIME_TYPE, {});
    }

    [[nodiscard]] std::size_t nodeCount() const {
        std::lock_guard lock(mutex_);
        return nodes_.size();
    }

    [[nodiscard]] std::vector<std::string> permissionsOf(const std::string& fileId) const {
        std::lock_guard lock(mutex_);
        return nodeRef(fileId).permissions;
    }

    mutable std::size_t findCalls = 0;
    mutable std::size_t createFolderCalls = 0;
    mutable std::size_t uploadCalls = 0;
    mutable std::size_t deleteCalls = 0;
    mutable std::size_t maxConcurrentDeletes = 0;
    mutable std::vector<std::size_t> deleteGroups;

    std::chrono::milliseconds deleteDelay{0};
    std::chrono::milliseconds settleWindow{0};
    std::string failDeleteOf;

private:
    struct Node {
        DriveFile file;
        std::string content;
        std::vector<std::string> permissions;
        std::size_t seq = 0;
    };

    std::string rootId_;
    mutable std::mutex mutex_;
    mutable std::map<std::string, Node> nodes_;
    mutable std::size_t nextId_ = 1;
    mutable std::size_t inFlightDeletes_ = 0;
    mutable std::size_t groupSize_ = 0;
    mutable std::chrono::steady_clock::time_point lastDeleteStart_;
    mutable std::condition_variable arrived_;

    static bool isChildOf(const Node& node, const std::string& parentId) {
        const auto& p = node.file.parents;
        return std::find(p.begin(), p.end(), parentId) != p.end();
    }

    void sortByCreation(std::vector<DriveFile>& files) const {
        std::sort(files.begin(), files.end(), [this](const DriveFile& a, const DriveFile& b) {
            return nodes_.at(a.id).seq < nodes_.at(b.id).seq;
        });
    }

    DriveFile insert(const std::string& parentId, const std::string& name,
                     const std::string& mime, std::string content) const {
        if (parentId != rootId_ && !nodes_.contains(parentId))
            storage::throwError(storage::ErrorKind::NotFound, "Parent not found: " + parentId);

        const auto seq = nextId_++;
        Node node;
        node.file = {"id" + std::to_string(seq), name, mime, {parentId}};
        node.content = std::move(content);
        node.seq = seq;
        const auto file = node.file;
        nodes_.emplace(file.id, std::move(node));
        return file;
    }

    Node& nodeRef(const std::string& id) const {
        const auto it = nodes_.find(id);
        if (it == nodes_.end()) storage::throwError(storage::ErrorKind::NotFound, "File not found: " + id);
        return it->second;
    }

    void removeSubtree(const std::string& id) const {
        std::vector<std::string> children;
        for (const auto& [cid, node] : nodes_)
            if (isChildOf(node, id)) children.push_back(cid);
        for (const auto& c : children) removeSubtree(c);
        nodes_.erase(id);
    }
};

}
