#pragma once

#include "secrets/Provider.hpp"

namespace unistore::secrets {

// Secrets from environment variables: "BlobConnectionString" with prefix
// "UNISTORE_" is read from UNISTORE_BLOBCONNECTIONSTRING.
class EnvProvider final : public Provider {
public:
    explicit EnvProvider(std::string prefix = "UNISTORE_");

    [[nodiscard]] std::string getSecret(const std::string& name) const override;

    [[nodiscard]] static std::string variableName(const std::string& prefix, const std::string& name);

private:
    std::string prefix_;
};

}
