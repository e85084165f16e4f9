#pragma once

#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include "securecookie/crypto/derived_key.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace securecookie::crypto {

/**
 * @brief Purpose-specific key stretching from a master secret.
 *
 * PBKDF2-HMAC-SHA256 with the master secret as password and the purpose
 * label as salt. Same (secret, label, iterations, size) always yields the same
 * key; distinct labels give independent keys.
 *
 * Derivation is deliberately slow. Request paths should use DeriveCached(),
 * which derives once per process and shares the result.
 */
class KeyDerivation {
public:
    /**
     * @brief Fill @p output with key material.
     *
     * @return ConfigError for an empty secret, empty label, zero iterations or
     *         an output size of zero or above kMaxDerivedKeyBytes
     */
    static Result<Unit, CookieFailure> DeriveKey(
        std::span<const uint8_t> secret,
        std::string_view purpose,
        uint32_t iterations,
        std::span<uint8_t> output);

    static Result<std::vector<uint8_t>, CookieFailure> DeriveKeyBytes(
        std::span<const uint8_t> secret,
        std::string_view purpose,
        uint32_t iterations,
        size_t output_size);

    /**
     * @brief Derive through the process-wide DerivedKeyCache.
     */
    static Result<std::shared_ptr<const DerivedKey>, CookieFailure> DeriveCached(
        std::span<const uint8_t> secret,
        std::string_view purpose,
        uint32_t iterations,
        size_t output_size);

    static Result<Unit, CookieFailure> ValidateParameters(
        std::span<const uint8_t> secret,
        std::string_view purpose,
        uint32_t iterations,
        size_t output_size);

private:
    KeyDerivation() = delete;
};

}
