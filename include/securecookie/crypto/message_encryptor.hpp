#pragma once

#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include "securecookie/crypto/derived_key.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace securecookie::crypto {

/**
 * @brief Authenticated encryption of opaque payloads into envelope strings.
 *
 * Encrypt-then-MAC: AES-256-GCM under the 32-byte encryption key, then
 * HMAC-SHA512 under the independent 64-byte signing key over
 * (domain || iv || ciphertext). On the way back the HMAC is checked in
 * constant time before AES-GCM ever sees the ciphertext.
 *
 * Immutable after construction and safe to share between threads.
 */
class MessageEncryptor {
public:
    /**
     * @brief Derive both keys from @p secret via the process-wide key cache.
     *
     * Expensive on first use per (secret, iterations); cheap afterwards.
     *
     * @return ConfigError for an empty secret or zero iterations
     */
    [[nodiscard]] static Result<MessageEncryptor, CookieFailure> Create(
        std::span<const uint8_t> secret,
        uint32_t iterations);

    [[nodiscard]] static Result<MessageEncryptor, CookieFailure> FromKeys(
        std::shared_ptr<const DerivedKey> encryption_key,
        std::shared_ptr<const DerivedKey> signing_key);

    /**
     * @brief Encrypt and sign under a fresh random IV.
     */
    [[nodiscard]] Result<std::string, CookieFailure> EncryptAndSign(
        std::span<const uint8_t> plaintext) const;

    [[nodiscard]] Result<std::string, CookieFailure> EncryptAndSign(
        std::string_view plaintext) const;

    /**
     * @brief Verify then decrypt.
     *
     * @return ParseError for a malformed envelope, IntegrityError when the
     *         tag does not match (nothing is decrypted in that case)
     */
    [[nodiscard]] Result<std::vector<uint8_t>, CookieFailure> DecryptAndVerify(
        std::string_view envelope) const;

private:
    MessageEncryptor(
        std::shared_ptr<const DerivedKey> encryption_key,
        std::shared_ptr<const DerivedKey> signing_key) noexcept
        : encryption_key_(std::move(encryption_key))
        , signing_key_(std::move(signing_key)) {}

    std::shared_ptr<const DerivedKey> encryption_key_;
    std::shared_ptr<const DerivedKey> signing_key_;
};

}
