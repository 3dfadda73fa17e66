#pragma once

#include "storage/model/Item.hpp"

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace unistore::storage {

enum class BackendType { LocalDisk, ObjectStore, Drive };

std::string_view to_string(BackendType type);
BackendType backend_type_from_string(const std::string& str);

/**
 * Common capability set of every storage backend.
 *
 * The public operations validate the logical path, delegate to the backend
 * hook, and funnel every failure into a StorageError that carries one of the
 * ErrorKind values and the caller's path. Failures are logged on the
 * "storage" logger before they are rethrown.
 *
 * A provider only holds its backend handle, so one instance can be used from
 * several threads at once as long as they work on different paths.
 */
class Provider {
public:
    virtual ~Provider() = default;

    Provider(const Provider&) = delete;
    Provider& operator=(const Provider&) = delete;

    // Writes the whole stream to path, creating missing containers on the way.
    // Returns the backend locator: a filesystem path, a blob URI or a shareable link.
    std::string add(const std::string& path, std::istream& content, bool overwrite = false) const;

    // Deletes the file or container at path (containers recursively).
    void remove(const std::string& path) const;

    [[nodiscard]] bool exists(const std::string& path) const;

    // Immediate children of the container at path.
    [[nodiscard]] model::ItemList list(const std::string& path) const;

    // Caller owns the returned stream.
    [[nodiscard]] std::unique_ptr<std::istream> read(const std::string& path) const;

    // Copies the entry's content into destination.
    void read(const std::string& path, std::ostream& destination) const;

    [[nodiscard]] virtual BackendType type() const = 0;

protected:
    Provider() = default;

    virtual std::string addImpl(const std::string& path, std::istream& content, bool overwrite) const = 0;
    virtual void removeImpl(const std::string& path) const = 0;
    virtual bool existsImpl(const std::string& path) const = 0;
    virtual model::ItemList listImpl(const std::string& path) const = 0;
    virtual std::unique_ptr<std::istream> readImpl(const std::string& path) const = 0;

private:
    template <typename Fn>
    auto guarded(std::string_view op, const std::string& path, Fn&& fn) const -> decltype(fn());
};

}
