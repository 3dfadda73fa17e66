#include "cloud/gdrive/TokenSource.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"
#include "util/httpHelpers.hpp"

#include <fmt/format.h>
#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <nlohmann/json.hpp>
#include <utility>

using namespace unistore::cloud::gdrive;
using namespace unistore::storage;
using namespace unistore::util;
using namespace unistore::log;
using json = nlohmann::json;

namespace {

std::string requireField(const json& j, const char* field) {
    if (!j.contains(field) || !j[field].is_string() || j[field].get<std::string>().empty())
        throwError(ErrorKind::InvalidArgument, fmt::format("Drive credential is missing '{}'", field));
    return j[field].get<std::string>();
}

}

std::unique_ptr<TokenSource> TokenSource::fromJson(const std::string& credentialJson, std::string scope) {
    json j;
    try {
        j = json::parse(credentialJson);
    } catch (const json::parse_error& e) {
        throwError(ErrorKind::InvalidArgument, fmt::format("Drive credential is not valid JSON: {}", e.what()));
    }
    if (!j.is_object()) throwError(ErrorKind::InvalidArgument, "Drive credential must be a JSON object");

    const auto type = j.value("type", std::string{});
    const auto tokenUri = j.value("token_uri", std::string(DEFAULT_TOKEN_URI));

    if (type == "service_account")
        return std::make_unique<ServiceAccountTokenSource>(
            requireField(j, "client_email"), requireField(j, "private_key"),
            j.value("private_key_id", std::string{}), tokenUri, std::move(scope));

    if (type == "authorized_user")
        return std::make_unique<AuthorizedUserTokenSource>(
            requireField(j, "client_id"), requireField(j, "client_secret"),
            requireField(j, "refresh_token"), tokenUri, std::move(scope));

    throwError(ErrorKind::InvalidArgument, fmt::format("Unsupported Drive credential type '{}'", type));
}

TokenSource::TokenSource(const Kind kind, std::string tokenUri, std::string scope)
    : kind_(kind), tokenUri_(std::move(tokenUri)), scope_(std::move(scope)) {}

std::string TokenSource::accessToken() const {
    std::lock_guard lock(mutex_);
    const auto now = std::chrono::system_clock::now();
    if (cached_.value.empty() || now + REFRESH_MARGIN >= cached_.expires_at) {
        cached_ = fetch();
        Registry::cloud()->debug("[TokenSource] Obtained access token, expires in {}s",
            std::chrono::duration_cast<std::chrono::seconds>(cached_.expires_at - now).count());
    }
    return cached_.value;
}

AccessToken TokenSource::fetch() const {
    const auto body = tokenRequestBody();

    SList hdrs;
    hdrs.add("Content-Type: application/x-www-form-urlencoded");
    hdrs.add("Accept: application/json");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, tokenUri_.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    });

    if (!resp.ok()) {
        Registry::cloud()->error("[TokenSource] Token request failed: CURL={} HTTP={} Response:\n{}",
                                 static_cast<int>(resp.curl), resp.http, resp.body);
        // invalid_grant / invalid_client come back as 400 or 401
        const auto kind = resp.curl != CURLE_OK ? ErrorKind::BackendUnavailable
                        : resp.http == 400 || resp.http == 401 ? ErrorKind::PermissionDenied
                        : errorKindFromHttpStatus(resp.http);
        throwError(kind, "OAuth token request failed (" + resp.describe() + ")");
    }

    json j;
    try {
        j = json::parse(resp.body);
    } catch (const json::parse_error& e) {
        throwError(ErrorKind::BackendUnavailable, fmt::format("Malformed token response: {}", e.what()));
    }

    if (!j.contains("access_token") || !j["access_token"].is_string())
        throwError(ErrorKind::BackendUnavailable, "Token response has no access_token");

    AccessToken token;
    token.value = j["access_token"].get<std::string>();
    token.expires_at = std::chrono::system_clock::now() + std::chrono::seconds(j.value("expires_in", 3600));
    return token;
}

// #########################################################################
// ########################## SERVICE ACCOUNT ##############################
// #########################################################################

ServiceAccountTokenSource::ServiceAccountTokenSource(std::string clientEmail, std::string privateKey,
                                                     std::string privateKeyId, std::string tokenUri,
                                                     std::string scope)
    : TokenSource(Kind::ServiceAccount, std::move(tokenUri), std::move(scope)),
      clientEmail_(std::move(clientEmail)),
      privateKey_(std::move(privateKey)),
      privateKeyId_(std::move(privateKeyId)) {}

std::string ServiceAccountTokenSource::buildAssertion(const std::chrono::system_clock::time_point now) const {
    using traits = jwt::traits::nlohmann_json;

    auto builder = jwt::create<traits>()
        .set_type("JWT")
        .set_issuer(clientEmail_)
        .set_audience(tokenUri_)
        .set_issued_at(now)
        .set_expires_at(now + std::chrono::hours(1))
        .set_payload_claim("scope", jwt::basic_claim<traits>(scope_));
    if (!privateKeyId_.empty()) builder.set_key_id(privateKeyId_);

    try {
        return builder.sign(jwt::algorithm::rs256{"", privateKey_, "", ""});
    } catch (const std::exception& e) {
        throwError(ErrorKind::InvalidArgument, fmt::format("Failed to sign service account assertion: {}", e.what()));
    }
}

std::string ServiceAccountTokenSource::tokenRequestBody() const {
    return formEncode({
        {"grant_type", "urn:ietf:params:oauth:grant-type:jwt-bearer"},
        {"assertion", buildAssertion(std::chrono::system_clock::now())},
    });
}

// #########################################################################
// ########################## AUTHORIZED USER ##############################
// #########################################################################

AuthorizedUserTokenSource::AuthorizedUserTokenSource(std::string clientId, std::string clientSecret,
                                                     std::string refreshToken, std::string tokenUri,
                                                     std::string scope)
    : TokenSource(Kind::AuthorizedUser, std::move(tokenUri), std::move(scope)),
      clientId_(std::move(clientId)),
      clientSecret_(std::move(clientSecret)),
      refreshToken_(std::move(refreshToken)) {}

std::string AuthorizedUserTokenSource::tokenRequestBody() const {
    return formEncode({
        {"grant_type", "refresh_token"},
        {"client_id", clientId_},
        {"client_secret", clientSecret_},
        {"refresh_token", refreshToken_},
    });
}
