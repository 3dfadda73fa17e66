#include "secrets/Provider.hpp"
#include "secrets/CachingProvider.hpp"
#include "secrets/EnvProvider.hpp"
#include "secrets/FileProvider.hpp"
#include "secrets/KeyVaultProvider.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

using namespace unistore::log;

namespace unistore::secrets {

std::unique_ptr<Provider> fromConfig(const config::SecretsConfig& cfg) {
    std::unique_ptr<Provider> provider;

    switch (cfg.source) {
        case config::SecretSource::Env:
            provider = std::make_unique<EnvProvider>(cfg.env_prefix);
            break;
        case config::SecretSource::File:
            provider = std::make_unique<FileProvider>(cfg.file);
            break;
        case config::SecretSource::KeyVault:
            provider = std::make_unique<KeyVaultProvider>(KeyVaultSettings{
                cfg.keyvault.vault_url, cfg.keyvault.tenant_id, cfg.keyvault.client_id, cfg.keyvault.client_secret});
            break;
    }

    Registry::secrets()->debug("[secrets] Using '{}' secret source", config::to_string(cfg.source));

    if (cfg.cache_ttl.count() <= 0) return provider;
    return std::make_unique<CachingProvider>(std::move(provider), cfg.cache_ttl);
}

}
