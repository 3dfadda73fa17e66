#include "cloud/gdrive/DriveController.hpp"
#include "log/Registry.hpp"
#include "util/httpHelpers.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>
#include <unordered_set>
#include <utility>

using namespace unistore::cloud::gdrive;
using namespace unistore::storage;
using namespace unistore::storage::drive;
using namespace unistore::util;
using namespace unistore::log;
using json = nlohmann::json;

namespace {

constexpr const auto* FILE_FIELDS = "id,name,mimeType,parents";

DriveFile parseFile(const json& j) {
    DriveFile f;
    f.id = j.value("id", std::string{});
    f.name = j.value("name", std::string{});
    f.mime_type = j.value("mimeType", std::string{});
    if (j.contains("parents") && j["parents"].is_array())
        for (const auto& p : j["parents"]) f.parents.push_back(p.get<std::string>());
    return f;
}

json parseBody(const std::string& body, const std::string& op) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throwError(ErrorKind::BackendUnavailable, fmt::format("Malformed Drive response to {}: {}", op, e.what()));
    }
}

std::string makeBoundary() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return fmt::format("unistore_{:016x}", rng());
}

}

DriveController::DriveController(std::unique_ptr<TokenSource> tokens, std::string apiBase, std::string uploadBase)
    : tokens_(std::move(tokens)), apiBase_(std::move(apiBase)), uploadBase_(std::move(uploadBase)) {
    if (!tokens_) throw std::invalid_argument("DriveController requires a TokenSource");
    ensureCurlGlobalInit();
}

DriveController::~DriveController() = default;

std::string DriveController::escapeQueryValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        if (c == '\\' || c == '\'') out += '\\';
        out += c;
    }
    return out;
}

std::string DriveController::buildSearchQuery(const std::string& parentId, const std::string& name,
                                              const NodeFilter filter) {
    auto q = fmt::format("'{}' in parents and name = '{}' and trashed = false",
                         escapeQueryValue(parentId), escapeQueryValue(name));
    if (filter == NodeFilter::Folder) q += fmt::format(" and mimeType = '{}'", FOLDER_MIME_TYPE);
    else if (filter == NodeFilter::File) q += fmt::format(" and mimeType != '{}'", FOLDER_MIME_TYPE);
    return q;
}

ErrorKind DriveController::classifyError(const long status, const std::string& body) {
    if (status != 403) return errorKindFromHttpStatus(status);

    static const std::unordered_set<std::string> transient{
        "rateLimitExceeded", "userRateLimitExceeded", "quotaExceeded",
        "dailyLimitExceeded", "storageQuotaExceeded", "sharingRateLimitExceeded"};

    const auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.contains("error") || !j["error"].is_object()) return ErrorKind::PermissionDenied;

    const auto& errors = j["error"].value("errors", json::array());
    for (const auto& e : errors)
        if (e.is_object() && transient.contains(e.value("reason", std::string{}))) return ErrorKind::BackendUnavailable;
    return ErrorKind::PermissionDenied;
}

HttpResponse DriveController::send(const std::string& method,
                                   const std::string& url,
                                   const std::string* body,
                                   const std::string& contentType) const {
    SList hdrs;
    hdrs.add("Authorization: Bearer " + tokens_->accessToken());
    hdrs.add("Accept: application/json");
    if (body) hdrs.add("Content-Type: " + contentType);
    hdrs.add("Expect:");

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());

        if (method == "GET") curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        else {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
            if (body) {
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->data());
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
            }
        }
    });
}

void DriveController::fail(const std::string& op, const std::string& target, const HttpResponse& resp) const {
    Registry::cloud()->error("[DriveController] {} failed for {}: CURL={} HTTP={} Response:\n{}",
                             op, target, static_cast<int>(resp.curl), resp.http, resp.body);

    const auto kind = resp.curl != CURLE_OK ? ErrorKind::BackendUnavailable : classifyError(resp.http, resp.body);
    throwError(kind, fmt::format("Drive {} failed for {} ({})", op, target, resp.describe()));
}

std::vector<DriveFile> DriveController::search(const std::string& query) const {
    std::vector<DriveFile> files;
    std::string pageToken;

    do {
        auto url = fmt::format("{}/files?q={}&fields={}&pageSize=1000", apiBase_, urlEncode(query),
                               urlEncode(fmt::format("nextPageToken,files({})", FILE_FIELDS)));
        if (!pageToken.empty()) url += "&pageToken=" + urlEncode(pageToken);

        const auto resp = send("GET", url);
        if (!resp.ok()) fail("search", query, resp);

        const auto j = parseBody(resp.body, "search");
        if (j.contains("files") && j["files"].is_array())
            for (const auto& f : j["files"]) files.push_back(parseFile(f));

        pageToken = j.value("nextPageToken", std::string{});
    } while (!pageToken.empty());

    return files;
}

std::vector<DriveFile> DriveController::findChildren(const std::string& parentId, const std::string& name,
                                                     const NodeFilter filter) const {
    return search(buildSearchQuery(parentId, name, filter));
}

std::vector<DriveFile> DriveController::listChildren(const std::string& parentId) const {
    return search(fmt::format("'{}' in parents and trashed = false", escapeQueryValue(parentId)));
}

DriveFile DriveController::createFolder(const std::string& parentId, const std::string& name) const {
    const json meta = {
        {"name", name},
        {"mimeType", FOLDER_MIME_TYPE},
        {"parents", json::array({parentId})},
    };
    const auto body = meta.dump();

    const auto resp = send("POST", fmt::format("{}/files?fields={}", apiBase_, urlEncode(FILE_FIELDS)), &body);
    if (!resp.ok()) fail("createFolder", name, resp);

    return parseFile(parseBody(resp.body, "createFolder"));
}

DriveFile DriveController::uploadFile(const std::string& parentId, const std::string& name,
                                      std::istream& content) const {
    std::ostringstream data;
    if (content.peek() != std::istream::traits_type::eof()) data << content.rdbuf();
    if (content.bad()) throwError(ErrorKind::InvalidArgument, "Failed to read upload stream", name);

    const json meta = {
        {"name", name},
        {"parents", json::array({parentId})},
    };

    const auto boundary = makeBoundary();
    std::string body;
    body += "--" + boundary + "\r\n";
    body += "Content-Type: application/json; charset=UTF-8\r\n\r\n";
    body += meta.dump() + "\r\n";
    body += "--" + boundary + "\r\n";
    body += fmt::format("Content-Type: {}\r\n\r\n", OCTET_STREAM_MIME_TYPE);
    body += data.str() + "\r\n";
    body += "--" + boundary + "--\r\n";

    const auto url = fmt::format("{}/files?uploadType=multipart&fields={}", uploadBase_, urlEncode(FILE_FIELDS));
    const auto resp = send("POST", url, &body, "multipart/related; boundary=" + boundary);
    if (!resp.ok()) fail("uploadFile", name, resp);

    auto file = parseFile(parseBody(resp.body, "uploadFile"));
    Registry::cloud()->debug("[DriveController] Uploaded '{}' as {}", name, file.id);
    return file;
}

void DriveController::grantPermission(const std::string& fileId, const std::string& type, const std::string& role) const {
    const auto body = json{{"type", type}, {"role", role}}.dump();
    const auto resp = send("POST", fmt::format("{}/files/{}/permissions", apiBase_, urlEncode(fileId)), &body);
    if (!resp.ok()) fail("grantPermission", fileId, resp);
}

void DriveController::deleteFile(const std::string& fileId) const {
    const auto resp = send("DELETE", fmt::format("{}/files/{}", apiBase_, urlEncode(fileId)));
    if (!resp.ok()) fail("deleteFile", fileId, resp);
}

std::unique_ptr<std::istream> DriveController::download(const std::string& fileId) const {
    auto resp = send("GET", fmt::format("{}/files/{}?alt=media", apiBase_, urlEncode(fileId)));
    if (!resp.ok()) fail("download", fileId, resp);
    return std::make_unique<std::istringstream>(std::move(resp.body));
}
