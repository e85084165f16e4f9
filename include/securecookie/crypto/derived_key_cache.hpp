#pragma once
#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include "securecookie/crypto/derived_key.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
namespace securecookie::crypto {
/**
 * @brief Process-wide cache of derived keys.
 *
 * Keyed by (BLAKE2b digest of the secret, label, iterations, size); the secret
 * itself is never stored. The map lock is held only for lookup/insert. Each
 * entry has its own lock held across the derivation, so concurrent first users
 * of one key wait for a single derivation instead of each paying for it.
 * Populated entries are immutable. Failed derivations are not cached.
 */
class DerivedKeyCache {
public:
    static DerivedKeyCache& Instance();
    DerivedKeyCache() = default;
    DerivedKeyCache(const DerivedKeyCache&) = delete;
    DerivedKeyCache& operator=(const DerivedKeyCache&) = delete;
    DerivedKeyCache(DerivedKeyCache&&) = delete;
    DerivedKeyCache& operator=(DerivedKeyCache&&) = delete;
    ~DerivedKeyCache() = default;
    Result<std::shared_ptr<const DerivedKey>, CookieFailure> GetOrDerive(
        std::span<const uint8_t> secret,
        std::string_view purpose,
        uint32_t iterations,
        size_t output_size);
    [[nodiscard]] size_t Size() const;
    [[nodiscard]] uint64_t DerivationCount() const noexcept;
    void Clear();
private:
    struct CacheKey {
        std::vector<uint8_t> secret_digest;
        std::string purpose;
        uint32_t iterations;
        size_t output_size;
        bool operator==(const CacheKey& other) const {
            return iterations == other.iterations &&
                   output_size == other.output_size &&
                   purpose == other.purpose &&
                   secret_digest == other.secret_digest;
        }
        struct Hash {
            size_t operator()(const CacheKey& key) const;
        };
    };
    struct Entry {
        std::mutex lock;
        std::shared_ptr<const DerivedKey> key;
    };
    std::shared_ptr<Entry> FindOrInsert(CacheKey cache_key);
    mutable std::mutex lock_;
    std::unordered_map<CacheKey, std::shared_ptr<Entry>, CacheKey::Hash> entries_;
    std::atomic<uint64_t> derivations_{0};
};
}
