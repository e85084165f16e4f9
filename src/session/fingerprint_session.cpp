#include "securecookie/session/fingerprint_session.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/core/constants.hpp"

#include <chrono>

namespace securecookie::session {

namespace {
    constexpr std::string_view kAgentPurpose = "user-agent";
    constexpr std::string_view kAddressPurpose = "remote-address";

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    bool Matches(const std::string& stored, const std::vector<uint8_t>& computed) {
        return crypto::SodiumInterop::ConstantTimeEquals(AsBytes(stored), computed);
    }
}

std::vector<uint8_t> FingerprintSession::Fingerprint(
    std::string_view purpose,
    std::string_view value) {
    std::string input(kFingerprintContext);
    input += '\0';
    input += purpose;
    input += '\0';
    input += value;
    return crypto::SodiumInterop::GenericHash(AsBytes(input), kFingerprintBytes);
}

Result<Unit, CookieFailure> FingerprintSession::Start(
    const interfaces::IRequest& request,
    std::string user_id) {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    const auto agent = Fingerprint(kAgentPurpose, request.Header(kUserAgentHeader).value_or(""));
    const auto address = Fingerprint(kAddressPurpose, request.RemoteAddress());
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch());

    state_.Clear();
    state_.set_user_id(std::move(user_id));
    state_.set_agent_fingerprint(agent.data(), agent.size());
    state_.set_address_fingerprint(address.data(), address.size());
    state_.set_issued_at(now.count());
    return Result<Unit, CookieFailure>::Ok(unit);
}

Result<Unit, CookieFailure> FingerprintSession::Validate(const interfaces::IRequest& request) const {
    if (state_.agent_fingerprint().size() != kFingerprintBytes ||
        state_.address_fingerprint().size() != kFingerprintBytes) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Validation("Session carries no client fingerprint"));
    }
    const auto agent = Fingerprint(kAgentPurpose, request.Header(kUserAgentHeader).value_or(""));
    const auto address = Fingerprint(kAddressPurpose, request.RemoteAddress());
    const bool agent_ok = Matches(state_.agent_fingerprint(), agent);
    const bool address_ok = Matches(state_.address_fingerprint(), address);
    if (!(agent_ok & address_ok)) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Validation("Session fingerprint does not match the request"));
    }
    return Result<Unit, CookieFailure>::Ok(unit);
}

}
