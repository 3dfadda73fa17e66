#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace unistore::storage {

enum class ErrorKind {
    InvalidArgument,
    AlreadyExists,
    NotFound,
    BackendUnavailable,
    PermissionDenied
};

std::string_view to_string(ErrorKind kind);

class StorageError : public std::runtime_error {
public:
    StorageError(ErrorKind kind, const std::string& message, std::string path = {});

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Same kind and message, re-attributed to the logical path the caller used.
    [[nodiscard]] StorageError withPath(const std::string& path) const;

private:
    ErrorKind kind_;
    std::string path_;
};

[[noreturn]] void throwError(ErrorKind kind, const std::string& message, const std::string& path = {});

}
