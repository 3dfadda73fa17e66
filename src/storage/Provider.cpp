#include "storage/Provider.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"
#include "util/logicalPath.hpp"

#include <boost/algorithm/string.hpp>
#include <filesystem>

using namespace unistore::log;

namespace unistore::storage {

std::string_view to_string(const BackendType type) {
    switch (type) {
        case BackendType::LocalDisk: return "local";
        case BackendType::ObjectStore: return "blob";
        case BackendType::Drive: return "drive";
    }
    return "unknown";
}

BackendType backend_type_from_string(const std::string& str) {
    const auto s = boost::algorithm::to_lower_copy(str);
    if (s == "local" || s == "localdisk") return BackendType::LocalDisk;
    if (s == "blob" || s == "objectstore" || s == "azure") return BackendType::ObjectStore;
    if (s == "drive" || s == "gdrive") return BackendType::Drive;
    throwError(ErrorKind::InvalidArgument, "Unknown backend type: " + str);
}

template <typename Fn>
auto Provider::guarded(const std::string_view op, const std::string& path, Fn&& fn) const -> decltype(fn()) {
    if (util::isBlank(path)) {
        Registry::storage()->warn("[{}] {} rejected: blank path", to_string(type()), op);
        throwError(ErrorKind::InvalidArgument, "Path must not be empty", path);
    }

    try {
        return fn();
    } catch (const StorageError& e) {
        Registry::storage()->error("[{}] {} failed for '{}': {} ({})",
                                   to_string(type()), op, path, e.what(), storage::to_string(e.kind()));
        throw e.withPath(path);
    } catch (const std::filesystem::filesystem_error& e) {
        const auto kind = e.code() == std::errc::permission_denied ? ErrorKind::PermissionDenied
                        : e.code() == std::errc::no_such_file_or_directory ? ErrorKind::NotFound
                        : ErrorKind::BackendUnavailable;
        Registry::storage()->error("[{}] {} failed for '{}': {}", to_string(type()), op, path, e.what());
        throw StorageError(kind, e.what(), path);
    } catch (const std::exception& e) {
        Registry::storage()->error("[{}] {} failed for '{}': {}", to_string(type()), op, path, e.what());
        throw StorageError(ErrorKind::BackendUnavailable, e.what(), path);
    }
}

std::string Provider::add(const std::string& path, std::istream& content, const bool overwrite) const {
    return guarded("add", path, [&] { return addImpl(path, content, overwrite); });
}

void Provider::remove(const std::string& path) const {
    guarded("remove", path, [&] { removeImpl(path); });
}

bool Provider::exists(const std::string& path) const {
    return guarded("exists", path, [&] { return existsImpl(path); });
}

model::ItemList Provider::list(const std::string& path) const {
    return guarded("list", path, [&] { return listImpl(path); });
}

std::unique_ptr<std::istream> Provider::read(const std::string& path) const {
    return guarded("read", path, [&] { return readImpl(path); });
}

void Provider::read(const std::string& path, std::ostream& destination) const {
    guarded("read", path, [&] {
        const auto in = readImpl(path);
        if (in->peek() != std::istream::traits_type::eof()) destination << in->rdbuf();
        if (!destination) throwError(ErrorKind::BackendUnavailable, "Failed to write to destination stream", path);
    });
}

}
