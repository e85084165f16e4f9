#pragma once

#include "securecookie/session/session.hpp"
#include "securecookie/session_state.pb.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace securecookie::session {

/**
 * @brief Session bound to the client that started it.
 *
 * Stores a user id together with BLAKE2b fingerprints of the User-Agent
 * header and the remote address. Validate recomputes both from the current
 * request and compares them in constant time. Raw header values never enter
 * the cookie.
 */
class FingerprintSession final : public ISession {
public:
    FingerprintSession() = default;

    /// Populate for @p request. Replaces any previous state.
    [[nodiscard]] Result<Unit, CookieFailure> Start(
        const interfaces::IRequest& request,
        std::string user_id);

    [[nodiscard]] const google::protobuf::Message& State() const override { return state_; }

    [[nodiscard]] google::protobuf::Message& MutableState() override { return state_; }

    [[nodiscard]] Result<Unit, CookieFailure> Validate(
        const interfaces::IRequest& request) const override;

    [[nodiscard]] const std::string& UserId() const noexcept { return state_.user_id(); }

    [[nodiscard]] int64_t IssuedAt() const noexcept { return state_.issued_at(); }

    [[nodiscard]] const proto::FingerprintSessionState& Proto() const noexcept { return state_; }

    [[nodiscard]] static std::vector<uint8_t> Fingerprint(
        std::string_view purpose,
        std::string_view value);

private:
    proto::FingerprintSessionState state_;
};

}
