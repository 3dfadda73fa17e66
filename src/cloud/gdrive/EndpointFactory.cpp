#include "cloud/gdrive/EndpointFactory.hpp"
#include "cloud/gdrive/DriveController.hpp"
#include "cloud/gdrive/TokenSource.hpp"

using namespace unistore::cloud::gdrive;

std::unique_ptr<unistore::storage::drive::DriveClient> EndpointFactory::createEndpoint(const std::string& connection) const {
    return std::make_unique<DriveController>(TokenSource::fromJson(connection));
}
