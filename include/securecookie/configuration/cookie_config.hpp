#pragma once

#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include "securecookie/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace securecookie::configuration {

/// SameSite attribute of a Set-Cookie header.
///
/// Default emits no SameSite attribute at all and leaves the choice to the
/// user agent.
enum class SameSite : uint8_t {
    Default = 0,
    Lax = 1,
    Strict = 2,
    None = 3
};

/// Per-cookie attributes
///
/// Pure policy data with no cryptographic role. A fresh value is built for
/// every request (see session::ICookiePolicy) and never persisted.
///
/// MaxAge semantics follow Set-Cookie:
/// - positive: `Max-Age=N`
/// - zero: attribute omitted (session cookie unless Expires is set)
/// - negative: `Max-Age=0`, the cookie is deleted immediately
struct CookieOptions {
    std::string domain;
    std::string path;
    bool http_only = false;
    bool secure = false;
    std::chrono::seconds max_age{0};
    std::optional<std::chrono::system_clock::time_point> expires;
    bool partitioned = false;
    SameSite same_site = SameSite::Default;
};

/// Inputs to CookieEncryptor / MessageEncryptor construction
///
/// The secret is the process-wide master secret. It is never serialized or
/// logged, and the holder of this struct owns it.
struct EncryptorConfig {
    std::vector<uint8_t> secret;
    uint32_t iterations = kDefaultIterations;

    [[nodiscard]] static EncryptorConfig FromString(
        std::string_view secret,
        uint32_t iterations = kDefaultIterations);

    /// ConfigError for an empty secret or zero iterations.
    [[nodiscard]] Result<Unit, CookieFailure> Validate() const;
};

/// Inputs to CookieSessionManager and HostCookiePolicy
class SessionConfig {
public:
    std::string cookie_name;
    std::string trusted_domain;
    std::chrono::seconds max_age{0};
    SameSite same_site = SameSite::Default;
    bool http_only = true;

    /// `session`, 30 days, SameSite=Lax, HttpOnly, no trusted domain.
    [[nodiscard]] static SessionConfig Default();

    [[nodiscard]] SessionConfig WithTrustedDomain(std::string domain) const {
        SessionConfig copy = *this;
        copy.trusted_domain = std::move(domain);
        return copy;
    }

    [[nodiscard]] SessionConfig WithCookieName(std::string name) const {
        SessionConfig copy = *this;
        copy.cookie_name = std::move(name);
        return copy;
    }

    /// ConfigError unless cookie_name is a valid RFC 6265 token, trusted_domain is
    /// empty or a hostname, and max_age is non-negative.
    [[nodiscard]] Result<Unit, CookieFailure> Validate() const;
};

}
