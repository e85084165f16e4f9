#include "securecookie/crypto/hmac_sha512.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/core/constants.hpp"

#include <sodium.h>

namespace securecookie::crypto {

static_assert(crypto_auth_hmacsha512_BYTES == kHmacSha512Bytes);

Result<std::vector<uint8_t>, CookieFailure> HmacSha512::Compute(
    std::span<const uint8_t> key,
    std::initializer_list<std::span<const uint8_t>> parts) {
    if (key.empty()) {
        return Result<std::vector<uint8_t>, CookieFailure>::Err(
            CookieFailure::Config("HMAC key cannot be empty"));
    }
    crypto_auth_hmacsha512_state state;
    if (crypto_auth_hmacsha512_init(&state, key.data(), key.size()) != 0) {
        return Result<std::vector<uint8_t>, CookieFailure>::Err(
            CookieFailure::Crypto("Failed to initialize HMAC-SHA512"));
    }
    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (crypto_auth_hmacsha512_update(&state, part.data(), part.size()) != 0) {
            sodium_memzero(&state, sizeof(state));
            return Result<std::vector<uint8_t>, CookieFailure>::Err(
                CookieFailure::Crypto("HMAC-SHA512 update failed"));
        }
    }
    std::vector<uint8_t> mac(kHmacSha512Bytes);
    const int rc = crypto_auth_hmacsha512_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    if (rc != 0) {
        return Result<std::vector<uint8_t>, CookieFailure>::Err(
            CookieFailure::Crypto("HMAC-SHA512 finalization failed"));
    }
    return Result<std::vector<uint8_t>, CookieFailure>::Ok(std::move(mac));
}

Result<bool, CookieFailure> HmacSha512::Verify(
    std::span<const uint8_t> key,
    std::initializer_list<std::span<const uint8_t>> parts,
    std::span<const uint8_t> expected_tag) {
    auto computed = Compute(key, parts);
    if (computed.IsErr()) {
        return Result<bool, CookieFailure>::Err(std::move(computed).UnwrapErr());
    }
    auto mac = std::move(computed).Unwrap();
    const bool matches = SodiumInterop::ConstantTimeEquals(mac, expected_tag);
    WipeQuietly(mac);
    return Result<bool, CookieFailure>::Ok(matches);
}

}
