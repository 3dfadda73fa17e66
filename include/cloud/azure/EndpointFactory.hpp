#pragma once

#include "storage/EndpointFactory.hpp"
#include "storage/blob/BlobClient.hpp"

namespace unistore::cloud::azure {

// Connection string -> BlobController
class EndpointFactory final : public storage::EndpointFactory<storage::blob::BlobClient> {
public:
    [[nodiscard]] std::unique_ptr<storage::blob::BlobClient> createEndpoint(const std::string& connection) const override;
};

}
