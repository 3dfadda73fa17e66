#pragma once

#include "secrets/Provider.hpp"

#include <chrono>
#include <mutex>
#include <string>

namespace unistore::secrets {

struct KeyVaultSettings {
    std::string vault_url;      // https://<name>.vault.azure.net
    std::string tenant_id;
    std::string client_id;
    std::string client_secret;
    std::string authority = "https://login.microsoftonline.com";
};

/**
 * Secrets from Azure Key Vault over REST.
 *
 * Authenticates as an app registration with the client-credentials grant;
 * the bearer token is cached until shortly before it expires. Secret names
 * are mapped onto the vault's alphabet (alphanumerics and '-').
 */
class KeyVaultProvider final : public Provider {
public:
    static constexpr const auto* API_VERSION = "7.4";
    static constexpr const auto* SCOPE = "https://vault.azure.net/.default";

    explicit KeyVaultProvider(KeyVaultSettings settings);

    [[nodiscard]] std::string getSecret(const std::string& name) const override;

    [[nodiscard]] static std::string vaultSecretName(const std::string& name);

private:
    KeyVaultSettings settings_;

    mutable std::mutex tokenMutex_;
    mutable std::string token_;
    mutable std::chrono::system_clock::time_point tokenExpiresAt_;

    [[nodiscard]] std::string bearerToken() const;
};

}
