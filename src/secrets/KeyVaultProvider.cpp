#include "secrets/KeyVaultProvider.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"
#include "util/httpHelpers.hpp"

#include <cctype>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <utility>

using namespace unistore::secrets;
using namespace unistore::storage;
using namespace unistore::util;
using namespace unistore::log;
using json = nlohmann::json;

KeyVaultProvider::KeyVaultProvider(KeyVaultSettings settings) : settings_(std::move(settings)) {
    if (settings_.vault_url.empty() || settings_.tenant_id.empty() ||
        settings_.client_id.empty() || settings_.client_secret.empty())
        throwError(ErrorKind::InvalidArgument, "Key Vault requires vault_url, tenant_id, client_id and client_secret");

    while (!settings_.vault_url.empty() && settings_.vault_url.back() == '/') settings_.vault_url.pop_back();
    ensureCurlGlobalInit();
}

std::string KeyVaultProvider::vaultSecretName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (const unsigned char c : name) out += std::isalnum(c) ? static_cast<char>(c) : '-';
    return out;
}

std::string KeyVaultProvider::bearerToken() const {
    std::lock_guard lock(tokenMutex_);
    const auto now = std::chrono::system_clock::now();
    if (!token_.empty() && now + std::chrono::seconds(60) < tokenExpiresAt_) return token_;

    const auto body = formEncode({
        {"grant_type", "client_credentials"},
        {"client_id", settings_.client_id},
        {"client_secret", settings_.client_secret},
        {"scope", SCOPE},
    });
    const auto url = fmt::format("{}/{}/oauth2/v2.0/token", settings_.authority, settings_.tenant_id);

    SList hdrs;
    hdrs.add("Content-Type: application/x-www-form-urlencoded");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    });

    if (!resp.ok()) {
        Registry::secrets()->error("[KeyVaultProvider] Token request failed: CURL={} HTTP={} Response:\n{}",
                                   static_cast<int>(resp.curl), resp.http, resp.body);
        const auto kind = resp.curl != CURLE_OK ? ErrorKind::BackendUnavailable
                        : resp.http == 400 || resp.http == 401 ? ErrorKind::PermissionDenied
                        : errorKindFromHttpStatus(resp.http);
        throwError(kind, "Key Vault token request failed (" + resp.describe() + ")");
    }

    const auto j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.contains("access_token"))
        throwError(ErrorKind::BackendUnavailable, "Key Vault token response has no access_token");

    token_ = j["access_token"].get<std::string>();
    tokenExpiresAt_ = now + std::chrono::seconds(j.value("expires_in", 3600));
    return token_;
}

std::string KeyVaultProvider::getSecret(const std::string& name) const {
    const auto url = fmt::format("{}/secrets/{}?api-version={}", settings_.vault_url,
                                 urlEncode(vaultSecretName(name)), API_VERSION);

    SList hdrs;
    hdrs.add("Authorization: Bearer " + bearerToken());
    hdrs.add("Accept: application/json");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    });

    if (!resp.ok()) {
        Registry::secrets()->error("[KeyVaultProvider] Failed to fetch secret '{}': CURL={} HTTP={}",
                                   name, static_cast<int>(resp.curl), resp.http);
        const auto kind = resp.curl != CURLE_OK ? ErrorKind::BackendUnavailable : errorKindFromHttpStatus(resp.http);
        throwError(kind, fmt::format("Key Vault lookup of '{}' failed ({})", name, resp.describe()));
    }

    const auto j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.contains("value") || !j["value"].is_string())
        throwError(ErrorKind::BackendUnavailable, "Key Vault response for '" + name + "' has no value");

    return j["value"].get<std::string>();
}
