#pragma once

#include "storage/EndpointFactory.hpp"
#include "storage/drive/DriveClient.hpp"

namespace unistore::cloud::gdrive {

// Credential JSON -> DriveController
class EndpointFactory final : public storage::EndpointFactory<storage::drive::DriveClient> {
public:
    [[nodiscard]] std::unique_ptr<storage::drive::DriveClient> createEndpoint(const std::string& connection) const override;
};

}
