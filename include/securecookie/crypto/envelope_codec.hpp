#pragma once
#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
namespace securecookie::crypto {
struct EnvelopeParts {
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;
};
/**
 * @brief Text form of an encrypted cookie value.
 *
 *   base64url(iv) "." base64url(ciphertext || gcm_tag) "." base64url(hmac)
 *
 * Segments are unpadded URL-safe base64, so '.' never occurs inside one.
 * Parse() checks every length before any byte is used and reports all
 * structural problems as ParseError.
 */
class EnvelopeCodec {
public:
    [[nodiscard]] static std::string Serialize(const EnvelopeParts& parts);
    [[nodiscard]] static Result<EnvelopeParts, CookieFailure> Parse(std::string_view envelope);
private:
    EnvelopeCodec() = delete;
};
}
