#include "storage/LocalDiskProvider.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <utility>

using namespace unistore::storage;
using namespace unistore::log;

LocalDiskProvider::LocalDiskProvider(fs::path root) : root_(std::move(root)) {}

fs::path LocalDiskProvider::resolvePath(const std::string& path) const {
    if (root_.empty()) return fs::path(path);

    auto base = root_.lexically_normal();
    if (!base.has_filename() && base.has_relative_path()) base = base.parent_path();

    auto target = (base / fs::path(path).relative_path()).lexically_normal();
    const auto rel = target.lexically_relative(base);
    if (rel.empty() || *rel.begin() == "..")
        throwError(ErrorKind::InvalidArgument, "Path escapes the storage root: " + path, path);
    return target;
}

std::string LocalDiskProvider::addImpl(const std::string& path, std::istream& content, const bool overwrite) const {
    const auto target = resolvePath(path);

    if (fs::is_directory(target))
        throwError(ErrorKind::AlreadyExists, "A directory already exists at " + target.string(), path);
    if (!overwrite && fs::exists(target))
        throwError(ErrorKind::AlreadyExists, "File already exists: " + target.string(), path);

    if (target.has_parent_path()) fs::create_directories(target.parent_path());

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) throwError(ErrorKind::PermissionDenied, "Failed to open file for writing: " + target.string(), path);

    if (content.peek() != std::istream::traits_type::eof()) out << content.rdbuf();
    out.close();
    if (!out) throwError(ErrorKind::BackendUnavailable, "Failed to write file: " + target.string(), path);

    Registry::storage()->debug("[LocalDiskProvider] Wrote {}", target.string());
    return path;
}

void LocalDiskProvider::removeImpl(const std::string& path) const {
    const auto target = resolvePath(path);
    const auto status = fs::symlink_status(target);

    if (!fs::exists(status)) throwError(ErrorKind::NotFound, "No such file or directory: " + target.string(), path);

    if (fs::is_directory(status)) {
        const auto removed = fs::remove_all(target);
        Registry::storage()->debug("[LocalDiskProvider] Removed directory {} ({} entries)", target.string(), removed);
    } else {
        fs::remove(target);
        Registry::storage()->debug("[LocalDiskProvider] Removed file {}", target.string());
    }
}

bool LocalDiskProvider::existsImpl(const std::string& path) const {
    std::error_code ec;
    const bool isFile = fs::is_regular_file(resolvePath(path), ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
        throwError(ec == std::errc::permission_denied ? ErrorKind::PermissionDenied : ErrorKind::BackendUnavailable,
                   ec.message(), path);
    return isFile;
}

model::ItemList LocalDiskProvider::listImpl(const std::string& path) const {
    const auto dir = resolvePath(path);
    if (!fs::is_directory(dir)) throwError(ErrorKind::NotFound, "Not a directory: " + dir.string(), path);

    model::ItemList folders, files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        const auto name = entry.path().filename().string();
        if (entry.is_directory()) folders.push_back(std::make_shared<model::Item>(name, model::ItemKind::Folder));
        else files.push_back(std::make_shared<model::Item>(name, model::ItemKind::File));
    }

    folders.insert(folders.end(), files.begin(), files.end());
    return folders;
}

std::unique_ptr<std::istream> LocalDiskProvider::readImpl(const std::string& path) const {
    const auto target = resolvePath(path);
    if (!fs::is_regular_file(target)) throwError(ErrorKind::NotFound, "No such file: " + target.string(), path);

    auto in = std::make_unique<std::ifstream>(target, std::ios::binary);
    if (!*in) throwError(ErrorKind::PermissionDenied, "Failed to open file: " + target.string(), path);
    return in;
}
