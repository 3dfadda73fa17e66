#pragma once

#include "storage/Error.hpp"
#include "storage/blob/BlobClient.hpp"

#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>

namespace unistore::test {

// Object store kept in memory: container -> (blob name -> content).
class InMemoryBlobClient final : public storage::blob::BlobClient {
public:
    [[nodiscard]] bool containerExists(const std::string& container) const override {
        std::lock_guard lock(mutex_);
        return containers_.contains(container);
    }

    void createContainer(const std::string& container) const override {
        std::lock_guard lock(mutex_);
        containers_.try_emplace(container);
    }

    void deleteContainer(const std::string& container) const override {
        std::lock_guard lock(mutex_);
        if (containers_.erase(container) == 0)
            storage::throwError(storage::ErrorKind::NotFound, "Container not found: " + container);
    }

    [[nodiscard]] bool blobExists(const std::string& container, const std::string& blob) const override {
        std::lock_guard lock(mutex_);
        const auto it = containers_.find(container);
        return it != containers_.end() && it->second.contains(blob);
    }

    void putBlob(const std::string& container, const std::string& blob,
                 std::istream& content, const bool overwrite) const override {
        std::string data{std::istreambuf_iterator<char>(content), std::istreambuf_iterator<char>()};

        std::lock_guard lock(mutex_);
        const auto it = containers_.find(container);
        if (it == containers_.end()) storage::throwError(storage::ErrorKind::NotFound, "Container not found: " + container);
        if (!overwrite && it->second.contains(blob))
            storage::throwError(storage::ErrorKind::AlreadyExists, "Blob already exists: " + blob);
        it->second[blob] = std::move(data);
    }

    [[nodiscard]] std::unique_ptr<std::istream> getBlob(const std::string& container,
                                                        const std::string& blob) const override {
        std::lock_guard lock(mutex_);
        return std::make_unique<std::istringstream>(blobRef(container, blob));
    }

    void deleteBlob(const std::string& container, const std::string& blob) const override {
        std::lock_guard lock(mutex_);
        blobRef(container, blob);
        containers_[container].erase(blob);
        ++deletes;
    }

    [[nodiscard]] std::vector<storage::blob::BlobEntry> listByHierarchy(const std::string& container,
                                                                        const std::string& prefix,
                                                                        const std::string& delimiter) const override {
        std::lock_guard lock(mutex_);
        std::vector<storage::blob::BlobEntry> entries;
        std::set<std::string> prefixes;

        for (const auto& [name, data] : blobsOf(container)) {
            if (name.compare(0, prefix.size(), prefix) != 0) continue;
            const auto cut = name.find(delimiter, prefix.size());
            if (cut == std::string::npos) entries.push_back({name, false, data.size()});
            else prefixes.insert(name.substr(0, cut + delimiter.size()));
        }
        for (const auto& p : prefixes) entries.push_back({p, true, 0});
        return entries;
    }

    [[nodiscard]] std::vector<storage::blob::BlobEntry> listFlat(const std::string& container,
                                                                 const std::string& prefix) const override {
        std::lock_guard lock(mutex_);
        std::vector<storage::blob::BlobEntry> entries;
        for (const auto& [name, data] : blobsOf(container))
            if (name.compare(0, prefix.size(), prefix) == 0) entries.push_back({name, false, data.size()});
        return entries;
    }

    [[nodiscard]] std::string blobUri(const std::string& container, const std::string& blob) const override {
        return "memory://account/" + container + "/" + blob;
    }

    [[nodiscard]] std::size_t blobCount(const std::string& container) const {
        std::lock_guard lock(mutex_);
        const auto it = containers_.find(container);
        return it == containers_.end() ? 0 : it->second.size();
    }

    mutable std::size_t deletes = 0;

private:
    mutable std::mutex mutex_;
    mutable std::map<std::string, std::map<std::string, std::string>> containers_;

    const std::map<std::string, std::string>& blobsOf(const std::string& container) const {
        const auto it = containers_.find(container);
        if (it == containers_.end()) storage::throwError(storage::ErrorKind::NotFound, "Container not found: " + container);
        return it->second;
    }

    const std::string& blobRef(const std::string& container, const std::string& blob) const {
        const auto& blobs = blobsOf(container);
        const auto it = blobs.find(blob);
        if (it == blobs.end()) storage::throwError(storage::ErrorKind::NotFound, "Blob not found: " + blob);
        return it->second;
    }
};

}
