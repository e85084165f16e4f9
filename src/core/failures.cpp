#include "securecookie/core/failures.hpp"

namespace securecookie {

std::string_view ToString(const CookieFailureType type) noexcept {
    switch (type) {
        case CookieFailureType::Config: return "ConfigError";
        case CookieFailureType::Parse: return "ParseError";
        case CookieFailureType::Integrity: return "IntegrityError";
        case CookieFailureType::Decode: return "DecodeError";
        case CookieFailureType::Encode: return "EncodeError";
        case CookieFailureType::NotFound: return "NotFound";
        case CookieFailureType::Validation: return "ValidationError";
        case CookieFailureType::Crypto: return "CryptoError";
    }
    return "UnknownError";
}

}
