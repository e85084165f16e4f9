#pragma once

#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include "securecookie/core/constants.hpp"
#include "securecookie/configuration/cookie_config.hpp"
#include "securecookie/cookies/cookie_encryptor.hpp"
#include "securecookie/cookies/value_encoder.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/debug/cookie_logger.hpp"
#include "securecookie/http/cookie.hpp"
#include "securecookie/interfaces/i_request.hpp"
#include "securecookie/interfaces/i_response_writer.hpp"

#include <fmt/core.h>

#include <memory>
#include <string>
#include <string_view>

namespace securecookie::cookies {

/**
 * @brief Sets, reads and deletes named cookies whose values are encoded then
 *        encrypted and signed.
 *
 * Holds its encryptor and encoder for its whole lifetime; both are immutable,
 * so one store may serve concurrent requests.
 *
 * @tparam TValue application value type understood by the encoder
 */
template<typename TValue>
class SecureCookieStore {
public:
    SecureCookieStore(
        std::shared_ptr<const CookieEncryptor> encryptor,
        std::shared_ptr<const IValueEncoder<TValue>> encoder) noexcept
        : encryptor_(std::move(encryptor))
        , encoder_(std::move(encoder)) {}

    /**
     * @brief encode -> protect -> attach attributes -> emit.
     *
     * Returns the cookie actually written. On any failure the response is not
     * touched.
     *
     * @return ConfigError for an invalid name, Path or Domain, EncodeError when encoding fails
     *         or the Set-Cookie header would exceed kMaxSetCookieBytes
     */
    [[nodiscard]] Result<http::Cookie, CookieFailure> Set(
        interfaces::IResponseWriter& response,
        std::string_view name,
        const configuration::CookieOptions& options,
        const TValue& value) const {
        using CookieResult = Result<http::Cookie, CookieFailure>;
        http::Cookie cookie = http::Cookie::FromOptions(std::string(name), {}, options);
        if (auto attributes = http::CheckCookieAttributes(cookie); attributes.IsErr()) {
            return CookieResult::Err(std::move(attributes).UnwrapErr());
        }
        auto encoded = encoder_->Encode(value);
        if (encoded.IsErr()) {
            return CookieResult::Err(std::move(encoded).UnwrapErr());
        }
        cookie.value = std::move(encoded).Unwrap();
        if (auto protect = encryptor_->Protect(cookie); protect.IsErr()) {
            crypto::WipeQuietly(cookie.value);
            return CookieResult::Err(std::move(protect).UnwrapErr());
        }
        const std::string header = cookie.ToSetCookieHeader();
        if (header.size() > kMaxSetCookieBytes) {
            return CookieResult::Err(
                CookieFailure::Encode(fmt::format(
                    "Cookie '{}' is {} bytes, over the {} byte limit",
                    name, header.size(), kMaxSetCookieBytes)));
        }
        response.AddHeader(kSetCookieHeader, header);
        debug::LogCookieEvent("set", name);
        return CookieResult::Ok(std::move(cookie));
    }

    /**
     * @brief Look up @p name, reveal it and decode into @p value.
     *
     * Returns the revealed cookie (plaintext value, no attributes: requests do
     * not carry them).
     *
     * @return NotFound when the request has no such cookie or it is empty,
     *         otherwise the specific Parse/Integrity/Decode failure
     */
    Result<http::Cookie, CookieFailure> Get(
        const interfaces::IRequest& request,
        std::string_view name,
        TValue& value) const {
        using CookieResult = Result<http::Cookie, CookieFailure>;
        auto raw = request.Cookie(name);
        if (!raw.has_value()) {
            return CookieResult::Err(
                CookieFailure::NotFound(fmt::format("No cookie named '{}'", name)));
        }
        http::Cookie cookie;
        cookie.name = std::string(name);
        cookie.value = std::move(*raw);
        if (auto reveal = encryptor_->Reveal(cookie); reveal.IsErr()) {
            return CookieResult::Err(std::move(reveal).UnwrapErr());
        }
        auto decoded = encoder_->Decode(cookie.value, value);
        if (decoded.IsErr()) {
            crypto::WipeQuietly(cookie.value);
            return CookieResult::Err(std::move(decoded).UnwrapErr());
        }
        return CookieResult::Ok(std::move(cookie));
    }

    /**
     * @brief Emit an empty, already expired cookie.
     *
     * Only Domain, Path, Secure and HttpOnly are taken from @p options; the
     * client needs them to match the cookie it holds.
     *
     * @return ConfigError for an invalid name, Path or Domain; nothing is written
     */
    Result<http::Cookie, CookieFailure> Delete(
        interfaces::IResponseWriter& response,
        std::string_view name,
        const configuration::CookieOptions& options = {}) const {
        http::Cookie cookie;
        cookie.name = std::string(name);
        cookie.domain = options.domain;
        cookie.path = options.path;
        cookie.secure = options.secure;
        cookie.http_only = options.http_only;
        cookie.max_age = -1;
        if (auto attributes = http::CheckCookieAttributes(cookie); attributes.IsErr()) {
            return Result<http::Cookie, CookieFailure>::Err(std::move(attributes).UnwrapErr());
        }
        http::SetCookie(response, cookie);
        debug::LogCookieEvent("delete", name);
        return Result<http::Cookie, CookieFailure>::Ok(std::move(cookie));
    }

    [[nodiscard]] const CookieEncryptor& Encryptor() const noexcept { return *encryptor_; }

    [[nodiscard]] const IValueEncoder<TValue>& Encoder() const noexcept { return *encoder_; }

private:
    std::shared_ptr<const CookieEncryptor> encryptor_;
    std::shared_ptr<const IValueEncoder<TValue>> encoder_;
};

}
