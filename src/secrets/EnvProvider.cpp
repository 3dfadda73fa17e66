#include "secrets/EnvProvider.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"

#include <cctype>
#include <cstdlib>
#include <utility>

using namespace unistore::secrets;
using namespace unistore::storage;
using namespace unistore::log;

EnvProvider::EnvProvider(std::string prefix) : prefix_(std::move(prefix)) {}

std::string EnvProvider::variableName(const std::string& prefix, const std::string& name) {
    std::string var = prefix;
    for (const unsigned char c : name) var += std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    return var;
}

std::string EnvProvider::getSecret(const std::string& name) const {
    const auto var = variableName(prefix_, name);
    const char* value = std::getenv(var.c_str());
    if (!value) {
        Registry::secrets()->warn("[EnvProvider] Secret '{}' not set (expected ${})", name, var);
        throwError(ErrorKind::NotFound, "Secret not found in environment: " + var);
    }
    return value;
}
