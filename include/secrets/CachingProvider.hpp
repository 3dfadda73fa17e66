#pragma once

#include "secrets/Provider.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace unistore::secrets {

// Remembers each secret for an absolute ttl after it was fetched. Failed
// lookups are not cached.
class CachingProvider final : public Provider {
public:
    static constexpr std::chrono::minutes DEFAULT_TTL{60};

    explicit CachingProvider(std::unique_ptr<Provider> inner,
                             std::chrono::steady_clock::duration ttl = DEFAULT_TTL);

    [[nodiscard]] std::string getSecret(const std::string& name) const override;

    void invalidate(const std::string& name) const;
    void clear() const;

private:
    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expires_at;
    };

    std::unique_ptr<Provider> inner_;
    std::chrono::steady_clock::duration ttl_;

    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, Entry> cache_;
};

}
