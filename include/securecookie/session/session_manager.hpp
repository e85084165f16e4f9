#pragma once

#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include "securecookie/configuration/cookie_config.hpp"
#include "securecookie/cookies/cookie_encryptor.hpp"
#include "securecookie/cookies/secure_cookie_store.hpp"
#include "securecookie/cookies/value_encoder.hpp"
#include "securecookie/session/cookie_policy.hpp"
#include "securecookie/session/session.hpp"
#include "securecookie/interfaces/i_request.hpp"
#include "securecookie/interfaces/i_response_writer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace google::protobuf {
class Message;
}

namespace securecookie::session {

class ISessionManager {
public:
    virtual ~ISessionManager() = default;

    /**
     * @brief Load the request's session into @p session and validate it.
     *
     * NotFound when there is no session cookie. Any other rejected-session
     * failure means a cookie was present but unusable. On failure @p session
     * is left cleared.
     */
    [[nodiscard]] virtual Result<Unit, CookieFailure> Current(
        const interfaces::IRequest& request,
        ISession& session) const = 0;

    /// Persist @p session, replacing whatever the client holds.
    [[nodiscard]] virtual Result<Unit, CookieFailure> Update(
        interfaces::IResponseWriter& response,
        const interfaces::IRequest& request,
        const ISession& session) const = 0;
};

enum class SessionOrigin : uint8_t {
    Resumed = 0,
    Started = 1
};

/**
 * @brief Session manager that keeps the whole session in one secure cookie.
 *
 * No server-side storage. Cookie attributes come from the injected policy,
 * HostCookiePolicy over the session config unless one is given.
 */
class CookieSessionManager final : public ISessionManager {
public:
    using Store = cookies::SecureCookieStore<google::protobuf::Message>;

    [[nodiscard]] static Result<CookieSessionManager, CookieFailure> Create(
        std::shared_ptr<const cookies::CookieEncryptor> encryptor,
        configuration::SessionConfig config,
        std::shared_ptr<const ICookiePolicy> policy = nullptr,
        std::shared_ptr<const cookies::IValueEncoder<google::protobuf::Message>> encoder = nullptr);

    [[nodiscard]] Result<Unit, CookieFailure> Current(
        const interfaces::IRequest& request,
        ISession& session) const override;

    [[nodiscard]] Result<Unit, CookieFailure> Update(
        interfaces::IResponseWriter& response,
        const interfaces::IRequest& request,
        const ISession& session) const override;

    /// Tell the client to drop the session cookie.
    Result<Unit, CookieFailure> End(
        interfaces::IResponseWriter& response,
        const interfaces::IRequest& request) const;

    /**
     * @brief Current, falling back to @p factory for any rejected session.
     *
     * Only rejected sessions (see CookieFailure::IsRejectedSession) start a
     * new one; Config and Crypto failures are returned as they are.
     */
    [[nodiscard]] Result<SessionOrigin, CookieFailure> CurrentOrStart(
        const interfaces::IRequest& request,
        ISession& session,
        const SessionFactory& factory) const;

    [[nodiscard]] const std::string& CookieName() const noexcept { return config_.cookie_name; }

    [[nodiscard]] const ICookiePolicy& Policy() const noexcept { return *policy_; }

private:
    CookieSessionManager(
        Store store,
        configuration::SessionConfig config,
        std::shared_ptr<const ICookiePolicy> policy)
        : store_(std::move(store))
        , config_(std::move(config))
        , policy_(std::move(policy)) {}

    Store store_;
    configuration::SessionConfig config_;
    std::shared_ptr<const ICookiePolicy> policy_;
};

}
