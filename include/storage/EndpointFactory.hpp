#pragma once

#include <memory>
#include <string>

namespace unistore::storage {

// Turns a connection string or credential bundle into a backend handle.
template <typename T>
class EndpointFactory {
public:
    virtual ~EndpointFactory() = default;

    [[nodiscard]] virtual std::unique_ptr<T> createEndpoint(const std::string& connection) const = 0;
};

}
