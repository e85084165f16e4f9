#include "securecookie/cookies/cookie_encryptor.hpp"
#include "securecookie/crypto/sodium_interop.hpp"

#include <fmt/core.h>

namespace securecookie::cookies {

Result<CookieEncryptor, CookieFailure> CookieEncryptor::Create(
    std::string_view secret,
    const uint32_t iterations) {
    return Create(configuration::EncryptorConfig::FromString(secret, iterations));
}

Result<CookieEncryptor, CookieFailure> CookieEncryptor::Create(
    const configuration::EncryptorConfig& config) {
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<CookieEncryptor, CookieFailure>::Err(std::move(valid).UnwrapErr());
    }
    return crypto::MessageEncryptor::Create(config.secret, config.iterations)
        .Map([](crypto::MessageEncryptor encryptor) {
            return CookieEncryptor(std::move(encryptor));
        });
}

Result<Unit, CookieFailure> CookieEncryptor::Protect(http::Cookie& cookie) const {
    auto envelope = encryptor_.EncryptAndSign(std::string_view(cookie.value));
    if (envelope.IsErr()) {
        return Result<Unit, CookieFailure>::Err(std::move(envelope).UnwrapErr());
    }
    crypto::WipeQuietly(cookie.value);
    cookie.value = std::move(envelope).Unwrap();
    return Result<Unit, CookieFailure>::Ok(unit);
}

Result<Unit, CookieFailure> CookieEncryptor::Reveal(http::Cookie& cookie) const {
    if (cookie.value.empty()) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::NotFound(fmt::format("Cookie '{}' has no value", cookie.name)));
    }
    auto plaintext = encryptor_.DecryptAndVerify(cookie.value);
    if (plaintext.IsErr()) {
        return Result<Unit, CookieFailure>::Err(std::move(plaintext).UnwrapErr());
    }
    auto bytes = std::move(plaintext).Unwrap();
    cookie.value.assign(bytes.begin(), bytes.end());
    crypto::WipeQuietly(bytes);
    return Result<Unit, CookieFailure>::Ok(unit);
}

}
