#pragma once

#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include "securecookie/configuration/cookie_config.hpp"
#include "securecookie/crypto/message_encryptor.hpp"
#include "securecookie/http/cookie.hpp"

#include <cstdint>
#include <string_view>

namespace securecookie::cookies {

/**
 * @brief Encrypts and signs the value field of a single cookie.
 *
 * Construction derives both keys and is therefore expensive the first time a
 * given (secret, iterations) pair is seen; build one per process and share it.
 */
class CookieEncryptor {
public:
    [[nodiscard]] static Result<CookieEncryptor, CookieFailure> Create(
        std::string_view secret,
        uint32_t iterations);

    [[nodiscard]] static Result<CookieEncryptor, CookieFailure> Create(
        const configuration::EncryptorConfig& config);

    explicit CookieEncryptor(crypto::MessageEncryptor encryptor) noexcept
        : encryptor_(std::move(encryptor)) {}

    /// Replace the cookie value with its envelope.
    [[nodiscard]] Result<Unit, CookieFailure> Protect(http::Cookie& cookie) const;

    /**
     * @brief Replace an envelope value with the verified plaintext.
     *
     * An empty value is NotFound, exactly as if the cookie were absent. On
     * failure the cookie is left untouched.
     */
    [[nodiscard]] Result<Unit, CookieFailure> Reveal(http::Cookie& cookie) const;

private:
    crypto::MessageEncryptor encryptor_;
};

}
