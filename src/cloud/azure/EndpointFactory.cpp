#include "cloud/azure/EndpointFactory.hpp"
#include "cloud/azure/BlobController.hpp"
#include "cloud/azure/ConnectionString.hpp"

using namespace unistore::cloud::azure;

std::unique_ptr<unistore::storage::blob::BlobClient> EndpointFactory::createEndpoint(const std::string& connection) const {
    return std::make_unique<BlobController>(ConnectionString::parse(connection));
}
