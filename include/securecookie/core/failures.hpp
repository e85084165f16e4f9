#pragma once
#include <string>
#include <string_view>
#include <utility>
namespace securecookie {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    AllocationFailed,
    WriteOperationFailed
};
enum class CookieFailureType {
    Config,
    Parse,
    Integrity,
    Decode,
    Encode,
    NotFound,
    Validation,
    Crypto
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
};
/**
 * @brief Failure reported by every fallible securecookie operation.
 *
 * `message` is a server-side diagnostic. It may say which check failed and must
 * never be echoed to an HTTP client; use ClientMessage() for that.
 */
class CookieFailure {
public:
    CookieFailureType type;
    std::string message;
    CookieFailure(const CookieFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CookieFailure Config(std::string msg) {
        return {CookieFailureType::Config, std::move(msg)};
    }
    static CookieFailure Parse(std::string msg) {
        return {CookieFailureType::Parse, std::move(msg)};
    }
    static CookieFailure Integrity(std::string msg) {
        return {CookieFailureType::Integrity, std::move(msg)};
    }
    static CookieFailure Decode(std::string msg) {
        return {CookieFailureType::Decode, std::move(msg)};
    }
    static CookieFailure Encode(std::string msg) {
        return {CookieFailureType::Encode, std::move(msg)};
    }
    static CookieFailure NotFound(std::string msg) {
        return {CookieFailureType::NotFound, std::move(msg)};
    }
    static CookieFailure Validation(std::string msg) {
        return {CookieFailureType::Validation, std::move(msg)};
    }
    static CookieFailure Crypto(std::string msg) {
        return {CookieFailureType::Crypto, std::move(msg)};
    }
    static CookieFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Crypto(sf.message);
    }
    [[nodiscard]] bool Is(const CookieFailureType t) const noexcept {
        return type == t;
    }
    /// True when the request simply carries no usable session: absent, malformed,
    /// forged, undecodable or failing self-validation.
    [[nodiscard]] bool IsRejectedSession() const noexcept {
        switch (type) {
            case CookieFailureType::Parse:
            case CookieFailureType::Integrity:
            case CookieFailureType::Decode:
            case CookieFailureType::NotFound:
            case CookieFailureType::Validation:
                return true;
            default:
                return false;
        }
    }
    /// Identical for every rejected-session kind so clients cannot tell the checks apart.
    [[nodiscard]] std::string_view ClientMessage() const noexcept {
        return IsRejectedSession() ? std::string_view("no valid session")
                                   : std::string_view("internal error");
    }
};
std::string_view ToString(CookieFailureType type) noexcept;
}
