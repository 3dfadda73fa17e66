#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace unistore::util {

// Empty or whitespace-only.
[[nodiscard]] bool isBlank(const std::string& s);

// Splits on '/', dropping empty segments.
[[nodiscard]] std::vector<std::string> splitPath(const std::string& path);

// Joins segments [first, last) with '/'. last == npos means "to the end".
[[nodiscard]] std::string joinPath(const std::vector<std::string>& segments,
                                   std::size_t first = 0,
                                   std::size_t last = std::string::npos);

struct ContainerPath {
    std::string container;  // lower-cased first segment
    std::string key;        // remaining segments, may be empty
};

// Throws StorageError(InvalidArgument) when the path has no segments.
[[nodiscard]] ContainerPath splitContainerPath(const std::string& path);

}
