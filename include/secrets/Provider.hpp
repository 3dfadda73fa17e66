#pragma once

#include <memory>
#include <string>

namespace unistore::config {
struct SecretsConfig;
}

namespace unistore::secrets {

// Named secret lookup. Fails with StorageError(NotFound) for unknown names and
// StorageError(BackendUnavailable) when the secret store cannot be reached.
class Provider {
public:
    virtual ~Provider() = default;

    [[nodiscard]] virtual std::string getSecret(const std::string& name) const = 0;
};

// Provider selected by cfg.source, wrapped in a CachingProvider when cfg.cache_ttl is positive.
std::unique_ptr<Provider> fromConfig(const config::SecretsConfig& cfg);

}
