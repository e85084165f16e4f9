#pragma once

#include "securecookie/configuration/cookie_config.hpp"
#include "securecookie/interfaces/i_request.hpp"

#include <string_view>

namespace securecookie::session {

/// Chooses the attributes of the session cookie for one request.
class ICookiePolicy {
public:
    virtual ~ICookiePolicy() = default;
    [[nodiscard]] virtual configuration::CookieOptions OptionsFor(
        const interfaces::IRequest& request) const = 0;
};

/**
 * @brief Host-based attributes.
 *
 * Loopback hosts (`localhost`, `127.0.0.0/8`, `::1`, port optional) get a
 * non-Secure, host-only cookie so plain-HTTP development works. Every other
 * host gets Secure and the trusted domain. Path is always `/`; HttpOnly,
 * SameSite and MaxAge come from the session config.
 */
class HostCookiePolicy final : public ICookiePolicy {
public:
    explicit HostCookiePolicy(configuration::SessionConfig config)
        : config_(std::move(config)) {}

    [[nodiscard]] configuration::CookieOptions OptionsFor(
        const interfaces::IRequest& request) const override;

    /// @p host may carry a port (`localhost:8080`, `[::1]:3000`).
    [[nodiscard]] static bool IsLoopbackHost(std::string_view host);

private:
    configuration::SessionConfig config_;
};

/// Same options for every request.
class FixedCookiePolicy final : public ICookiePolicy {
public:
    explicit FixedCookiePolicy(configuration::CookieOptions options)
        : options_(std::move(options)) {}

    [[nodiscard]] configuration::CookieOptions OptionsFor(
        const interfaces::IRequest&) const override {
        return options_;
    }

private:
    configuration::CookieOptions options_;
};

}
