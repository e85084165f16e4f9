#include "securecookie/crypto/derived_key_cache.hpp"
#include "securecookie/crypto/key_derivation.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/core/constants.hpp"
#include "securecookie/debug/cookie_logger.hpp"

#include <functional>

namespace securecookie::crypto {

DerivedKeyCache& DerivedKeyCache::Instance() {
    static DerivedKeyCache instance;
    return instance;
}

size_t DerivedKeyCache::CacheKey::Hash::operator()(const CacheKey& key) const {
    const std::string_view digest(
        reinterpret_cast<const char*>(key.secret_digest.data()),
        key.secret_digest.size());
    size_t seed = std::hash<std::string_view>{}(digest);
    const auto mix = [&seed](const size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    mix(std::hash<std::string>{}(key.purpose));
    mix(std::hash<uint32_t>{}(key.iterations));
    mix(std::hash<size_t>{}(key.output_size));
    return seed;
}

std::shared_ptr<DerivedKeyCache::Entry> DerivedKeyCache::FindOrInsert(CacheKey cache_key) {
    std::lock_guard<std::mutex> guard(lock_);
    auto it = entries_.find(cache_key);
    if (it != entries_.end()) {
        return it->second;
    }
    auto entry = std::make_shared<Entry>();
    entries_.emplace(std::move(cache_key), entry);
    return entry;
}

Result<std::shared_ptr<const DerivedKey>, CookieFailure> DerivedKeyCache::GetOrDerive(
    std::span<const uint8_t> secret,
    std::string_view purpose,
    const uint32_t iterations,
    const size_t output_size) {
    using KeyResult = Result<std::shared_ptr<const DerivedKey>, CookieFailure>;

    if (auto check = KeyDerivation::ValidateParameters(secret, purpose, iterations, output_size);
        check.IsErr()) {
        return KeyResult::Err(std::move(check).UnwrapErr());
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return KeyResult::Err(CookieFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto entry = FindOrInsert(CacheKey{
        SodiumInterop::GenericHash(secret, kSecretDigestBytes),
        std::string(purpose),
        iterations,
        output_size});

    std::lock_guard<std::mutex> entry_guard(entry->lock);
    if (entry->key) {
        debug::LogKeyDerivation(purpose, iterations, output_size, true);
        return KeyResult::Ok(entry->key);
    }

    auto material_result = KeyDerivation::DeriveKeyBytes(secret, purpose, iterations, output_size);
    if (material_result.IsErr()) {
        return KeyResult::Err(std::move(material_result).UnwrapErr());
    }
    auto material = std::move(material_result).Unwrap();
    auto sealed = DerivedKey::Seal(material, purpose);
    WipeQuietly(material);
    if (sealed.IsErr()) {
        return KeyResult::Err(CookieFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }

    entry->key = std::make_shared<DerivedKey>(std::move(sealed).Unwrap());
    derivations_.fetch_add(1, std::memory_order_relaxed);
    debug::LogKeyDerivation(purpose, iterations, output_size, false);
    return KeyResult::Ok(entry->key);
}

size_t DerivedKeyCache::Size() const {
    std::lock_guard<std::mutex> guard(lock_);
    size_t populated = 0;
    for (const auto& [key, entry] : entries_) {
        std::lock_guard<std::mutex> entry_guard(entry->lock);
        if (entry->key) {
            ++populated;
        }
    }
    return populated;
}

uint64_t DerivedKeyCache::DerivationCount() const noexcept {
    return derivations_.load(std::memory_order_relaxed);
}

void DerivedKeyCache::Clear() {
    std::lock_guard<std::mutex> guard(lock_);
    entries_.clear();
}

}
