#include "util/logicalPath.hpp"
#include "storage/Error.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>

using namespace unistore::storage;

namespace unistore::util {

bool isBlank(const std::string& s) {
    return boost::algorithm::all(s, boost::algorithm::is_space());
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, path, boost::algorithm::is_any_of("/"), boost::algorithm::token_compress_on);
    parts.erase(std::remove_if(parts.begin(), parts.end(), [](const std::string& p) { return p.empty(); }),
                parts.end());
    return parts;
}

std::string joinPath(const std::vector<std::string>& segments, const std::size_t first, const std::size_t last) {
    const auto end = std::min(last, segments.size());
    std::string out;
    for (std::size_t i = first; i < end; ++i) {
        if (!out.empty()) out += '/';
        out += segments[i];
    }
    return out;
}

ContainerPath splitContainerPath(const std::string& path) {
    const auto segments = splitPath(path);
    if (segments.empty()) throwError(ErrorKind::InvalidArgument, "Invalid path: no segments", path);
    return {boost::algorithm::to_lower_copy(segments.front()), joinPath(segments, 1)};
}

}
