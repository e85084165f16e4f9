#pragma once

#include "securecookie/configuration/cookie_config.hpp"
#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include "securecookie/interfaces/i_response_writer.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace securecookie::http {

using configuration::CookieOptions;
using configuration::SameSite;

/**
 * @brief One HTTP cookie as it travels in a Set-Cookie header.
 *
 * max_age is in seconds: 0 omits the attribute, a negative value deletes the
 * cookie (`Max-Age=0`).
 */
struct Cookie {
    std::string name;
    std::string value;
    std::string path;
    std::string domain;
    std::optional<std::chrono::system_clock::time_point> expires;
    int64_t max_age = 0;
    bool secure = false;
    bool http_only = false;
    SameSite same_site = SameSite::Default;
    bool partitioned = false;

    [[nodiscard]] static Cookie FromOptions(
        std::string name,
        std::string value,
        const CookieOptions& options);

    /**
     * @brief Serialize as the value of a Set-Cookie header.
     *
     * Returns an empty string when the name is not a valid token or Path or
     * Domain would break out of their attribute.
     */
    [[nodiscard]] std::string ToSetCookieHeader() const;
};

/// RFC 6265 token: visible ASCII except separators.
[[nodiscard]] bool IsValidCookieName(std::string_view name) noexcept;

/// RFC 6265 cookie-octets (space and comma tolerated, they get quoted).
[[nodiscard]] bool IsValidCookieValue(std::string_view value) noexcept;

/// Path attribute: visible ASCII and space, no `;`.
[[nodiscard]] bool IsValidCookiePath(std::string_view path) noexcept;

/**
 * @brief Domain attribute: a hostname (one leading dot tolerated) or an IPv4
 *        literal.
 *
 * Labels are 1-63 letters, digits or hyphens and do not start or end with a
 * hyphen; at most 253 characters in total.
 */
[[nodiscard]] bool IsValidCookieDomain(std::string_view domain) noexcept;

/// ConfigError naming the first of name, Path or Domain that cannot be emitted.
[[nodiscard]] Result<Unit, CookieFailure> CheckCookieAttributes(const Cookie& cookie);

/// IMF-fixdate, e.g. `Sun, 06 Nov 1994 08:49:37 GMT`.
[[nodiscard]] std::string FormatHttpDate(std::chrono::system_clock::time_point when);

/// Adds one Set-Cookie header. Cookies failing CheckCookieAttributes are dropped.
void SetCookie(interfaces::IResponseWriter& writer, const Cookie& cookie);

/**
 * @brief Parse a request `Cookie:` header into (name, value) pairs in order.
 *
 * Pairs with an invalid name or value are skipped; surrounding double quotes
 * are removed from values.
 */
[[nodiscard]] std::vector<std::pair<std::string, std::string>> ParseCookieHeader(
    std::string_view header);

}
