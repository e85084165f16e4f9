#include "securecookie/configuration/cookie_config.hpp"
#include "securecookie/http/cookie.hpp"

#include <fmt/core.h>

namespace securecookie::configuration {

namespace {
    constexpr std::chrono::seconds kDefaultSessionMaxAge{30 * 24 * 60 * 60};
}

EncryptorConfig EncryptorConfig::FromString(std::string_view secret, const uint32_t iterations) {
    EncryptorConfig config;
    config.secret.assign(secret.begin(), secret.end());
    config.iterations = iterations;
    return config;
}

Result<Unit, CookieFailure> EncryptorConfig::Validate() const {
    if (secret.empty()) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config("Master secret must not be empty"));
    }
    if (iterations == 0) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config("Iteration count must be at least 1"));
    }
    return Result<Unit, CookieFailure>::Ok(unit);
}

SessionConfig SessionConfig::Default() {
    SessionConfig config;
    config.cookie_name = "session";
    config.max_age = kDefaultSessionMaxAge;
    config.same_site = SameSite::Lax;
    config.http_only = true;
    return config;
}

Result<Unit, CookieFailure> SessionConfig::Validate() const {
    if (!http::IsValidCookieName(cookie_name)) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config(fmt::format("Invalid session cookie name '{}'", cookie_name)));
    }
    if (!trusted_domain.empty() && !http::IsValidCookieDomain(trusted_domain)) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config("Trusted domain must be a hostname"));
    }
    if (max_age.count() < 0) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config("Session max age must not be negative"));
    }
    return Result<Unit, CookieFailure>::Ok(unit);
}

}
