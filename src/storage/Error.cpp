#include "storage/Error.hpp"

#include <utility>

namespace unistore::storage {

std::string_view to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::BackendUnavailable: return "BackendUnavailable";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
    }
    return "Unknown";
}

StorageError::StorageError(const ErrorKind kind, const std::string& message, std::string path)
    : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

StorageError StorageError::withPath(const std::string& path) const {
    if (path_ == path) return *this;
    return {kind_, what(), path};
}

void throwError(const ErrorKind kind, const std::string& message, const std::string& path) {
    throw StorageError(kind, message, path);
}

}
