#pragma once
#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include "securecookie/interfaces/i_request.hpp"
#include <functional>
#include <memory>
namespace google::protobuf {
class Message;
}
namespace securecookie::session {
/**
 * @brief Application session carried in a cookie.
 *
 * The manager only moves State() in and out of the cookie. What the state
 * means, and whether it still fits the request it arrived on, is up to the
 * implementation.
 */
class ISession {
public:
    virtual ~ISession() = default;
    [[nodiscard]] virtual const google::protobuf::Message& State() const = 0;
    [[nodiscard]] virtual google::protobuf::Message& MutableState() = 0;
    /// ValidationError when the state does not belong to @p request.
    [[nodiscard]] virtual Result<Unit, CookieFailure> Validate(
        const interfaces::IRequest& request) const = 0;
};
/// Resets @p session to a fresh state for @p request.
using SessionFactory = std::function<Result<Unit, CookieFailure>(
    const interfaces::IRequest& request, ISession& session)>;
}
