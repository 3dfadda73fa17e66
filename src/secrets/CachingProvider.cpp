#include "secrets/CachingProvider.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <utility>

using namespace unistore::secrets;
using namespace unistore::log;

CachingProvider::CachingProvider(std::unique_ptr<Provider> inner, const std::chrono::steady_clock::duration ttl)
    : inner_(std::move(inner)), ttl_(ttl) {
    if (!inner_) throw std::invalid_argument("CachingProvider requires an inner provider");
}

std::string CachingProvider::getSecret(const std::string& name) const {
    {
        std::lock_guard lock(mutex_);
        const auto it = cache_.find(name);
        if (it != cache_.end() && std::chrono::steady_clock::now() < it->second.expires_at) return it->second.value;
    }

    auto value = inner_->getSecret(name);

    std::lock_guard lock(mutex_);
    cache_[name] = {value, std::chrono::steady_clock::now() + ttl_};
    Registry::secrets()->debug("[CachingProvider] Cached secret '{}'", name);
    return value;
}

void CachingProvider::invalidate(const std::string& name) const {
    std::lock_guard lock(mutex_);
    cache_.erase(name);
}

void CachingProvider::clear() const {
    std::lock_guard lock(mutex_);
    cache_.clear();
}
