#include "cloud/azure/BlobController.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"
#include "util/cryptoHelpers.hpp"
#include "util/httpHelpers.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>
#include <sstream>
#include <utility>

using namespace unistore::cloud::azure;
using namespace unistore::storage;
using namespace unistore::storage::blob;
using namespace unistore::util;
using namespace unistore::log;

namespace {

std::string containerPath(const std::string& container) {
    return "/" + urlEncode(container);
}

std::string blobPath(const std::string& container, const std::string& blob) {
    return "/" + urlEncode(container) + "/" + escapeKeyPreserveSlashes(blob);
}

const QueryMap CONTAINER_QUERY{{"restype", "container"}};

}

BlobController::BlobController(ConnectionString cs) : cs_(std::move(cs)) {
    try {
        decodedKey_ = b64Decode(cs_.account_key);
    } catch (const std::exception& e) {
        throwError(ErrorKind::InvalidArgument, fmt::format("AccountKey is not valid base64: {}", e.what()));
    }

    serviceUrl_ = cs_.blobServiceUrl();
    const auto scheme = serviceUrl_.find("://");
    const auto slash = serviceUrl_.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (slash != std::string::npos) servicePath_ = serviceUrl_.substr(slash);

    ensureCurlGlobalInit();
    Registry::cloud()->debug("[BlobController] Using blob endpoint {}", serviceUrl_);
}

BlobController::~BlobController() = default;

HttpResponse BlobController::send(const std::string& method,
                                  const std::string& resourcePath,
                                  const QueryMap& query,
                                  HeaderMap headers,
                                  const std::string* body) const {
    headers["x-ms-date"] = getRfc1123Date();
    headers["x-ms-version"] = API_VERSION;
    if (body) headers["Content-Length"] = std::to_string(body->size());

    const auto sts = buildStringToSign(method, cs_.account_name, servicePath_ + resourcePath, query, headers);

    SList hdrs;
    hdrs.add("Authorization: " + buildAuthorizationHeader(cs_.account_name, decodedKey_, sts));
    for (const auto& [k, v] : headers)
        if (k != "Content-Length") hdrs.add(k + ": " + v);
    if (!headers.contains("Content-Type")) hdrs.add("Content-Type:");  // keep curl from adding one we did not sign
    hdrs.add("Expect:");

    auto url = serviceUrl_ + resourcePath;
    if (!query.empty()) url += "?" + formEncode(query);

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());

        if (method == "HEAD") curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        else if (method == "GET") curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        else {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
            if (body) {
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->data());
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
            }
        }
    });
}

void BlobController::fail(const std::string& op, const std::string& target, const HttpResponse& resp) const {
    const auto errorCode = resp.header("x-ms-error-code");
    Registry::cloud()->error("[BlobController] {} failed for {}: CURL={} HTTP={} Code={} Response:\n{}",
                             op, target, static_cast<int>(resp.curl), resp.http, errorCode, resp.body);

    const auto kind = resp.curl != CURLE_OK ? ErrorKind::BackendUnavailable : errorKindFromHttpStatus(resp.http);
    throwError(kind, fmt::format("Azure Blob {} failed for {} ({}{}{})", op, target, resp.describe(),
                                 errorCode.empty() ? "" : ", ", errorCode));
}

// #########################################################################
// ########################### CONTAINERS ##################################
// #########################################################################

bool BlobController::containerExists(const std::string& container) const {
    const auto resp = send("HEAD", containerPath(container), CONTAINER_QUERY, {});
    if (resp.ok()) return true;
    if (resp.curl == CURLE_OK && resp.http == 404) return false;
    fail("containerExists", container, resp);
}

void BlobController::createContainer(const std::string& container) const {
    const std::string empty;
    const auto resp = send("PUT", containerPath(container), CONTAINER_QUERY, {}, &empty);
    if (resp.ok()) {
        Registry::cloud()->debug("[BlobController] Created container {}", container);
        return;
    }
    if (resp.curl == CURLE_OK && resp.http == 409) return;  // ContainerAlreadyExists
    fail("createContainer", container, resp);
}

void BlobController::deleteContainer(const std::string& container) const {
    const auto resp = send("DELETE", containerPath(container), CONTAINER_QUERY, {});
    if (!resp.ok()) fail("deleteContainer", container, resp);
}

// #########################################################################
// ############################# BLOBS #####################################
// #########################################################################

bool BlobController::blobExists(const std::string& container, const std::string& blob) const {
    const auto resp = send("HEAD", blobPath(container, blob), {}, {});
    if (resp.ok()) return true;
    if (resp.curl == CURLE_OK && resp.http == 404) return false;
    fail("blobExists", container + "/" + blob, resp);
}

void BlobController::putBlob(const std::string& container, const std::string& blob,
                             std::istream& content, const bool overwrite) const {
    std::ostringstream buffer;
    if (content.peek() != std::istream::traits_type::eof()) buffer << content.rdbuf();
    if (content.bad()) throwError(ErrorKind::InvalidArgument, "Failed to read upload stream", container + "/" + blob);
    const auto body = buffer.str();

    HeaderMap headers{
        {"Content-Type", "application/octet-stream"},
        {"x-ms-blob-type", "BlockBlob"},
    };
    if (!overwrite) headers["If-None-Match"] = "*";

    const auto resp = send("PUT", blobPath(container, blob), {}, std::move(headers), &body);
    if (!resp.ok()) fail("putBlob", container + "/" + blob, resp);

    Registry::cloud()->debug("[BlobController] Uploaded {}/{} ({} bytes)", container, blob, body.size());
}

std::unique_ptr<std::istream> BlobController::getBlob(const std::string& container, const std::string& blob) const {
    auto resp = send("GET", blobPath(container, blob), {}, {});
    if (!resp.ok()) fail("getBlob", container + "/" + blob, resp);
    return std::make_unique<std::istringstream>(std::move(resp.body));
}

void BlobController::deleteBlob(const std::string& container, const std::string& blob) const {
    const auto resp = send("DELETE", blobPath(container, blob), {}, {});
    if (!resp.ok()) fail("deleteBlob", container + "/" + blob, resp);
}

std::string BlobController::blobUri(const std::string& container, const std::string& blob) const {
    return serviceUrl_ + blobPath(container, blob);
}

// #########################################################################
// ############################ LISTING ####################################
// #########################################################################

std::vector<BlobEntry> BlobController::listByHierarchy(const std::string& container,
                                                       const std::string& prefix,
                                                       const std::string& delimiter) const {
    return list(container, prefix, delimiter);
}

std::vector<BlobEntry> BlobController::listFlat(const std::string& container, const std::string& prefix) const {
    return list(container, prefix, "");
}

std::vector<BlobEntry> BlobController::list(const std::string& container,
                                            const std::string& prefix,
                                            const std::string& delimiter) const {
    std::vector<BlobEntry> entries;
    std::string marker;

    do {
        QueryMap query{{"restype", "container"}, {"comp", "list"}};
        if (!prefix.empty()) query["prefix"] = prefix;
        if (!delimiter.empty()) query["delimiter"] = delimiter;
        if (!marker.empty()) query["marker"] = marker;

        const auto resp = send("GET", containerPath(container), query, {});
        if (!resp.ok()) fail("list", container + "/" + prefix, resp);

        auto page = parseListing(resp.body, marker);
        entries.insert(entries.end(), std::make_move_iterator(page.begin()), std::make_move_iterator(page.end()));
    } while (!marker.empty());

    return entries;
}

std::vector<BlobEntry> BlobController::parseListing(const std::string& xml, std::string& nextMarker) {
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result) throwError(ErrorKind::BackendUnavailable, fmt::format("Malformed listing response: {}", result.description()));

    const pugi::xml_node root = doc.child("EnumerationResults");
    if (!root) throwError(ErrorKind::BackendUnavailable, "Listing response has no EnumerationResults");

    std::vector<BlobEntry> entries;
    for (pugi::xml_node node : root.child("Blobs").children()) {
        const std::string tag = node.name();
        if (tag == "Blob") {
            entries.push_back({node.child_value("Name"), false,
                               node.child("Properties").child("Content-Length").text().as_ullong()});
        } else if (tag == "BlobPrefix") {
            entries.push_back({node.child_value("Name"), true, 0});
        }
    }

    nextMarker = root.child_value("NextMarker");
    return entries;
}
