#pragma once
#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace securecookie::crypto {
/**
 * AES-256-GCM over OpenSSL EVP.
 *
 * Stateless: the caller supplies a nonce that must never repeat under one key.
 * MessageEncryptor draws a fresh random 12-byte nonce per cookie; at the
 * volumes a single key sees for cookies the 2^-32 collision bound of random
 * 96-bit nonces is not approached.
 *
 * Output layout is ciphertext || 16-byte tag.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CookieFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    /**
     * Fails with IntegrityError when the GCM tag does not verify.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, CookieFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
