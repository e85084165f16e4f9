#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace securecookie {

inline constexpr size_t kEncryptionKeyBytes = 32;
inline constexpr size_t kSigningKeyBytes = 64;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;
inline constexpr size_t kHmacSha512Bytes = 64;
inline constexpr size_t kFingerprintBytes = 32;
inline constexpr size_t kSecretDigestBytes = 32;

inline constexpr uint32_t kDefaultIterations = 65536;
inline constexpr size_t kMaxDerivedKeyBytes = 1024;

inline constexpr std::string_view kEncryptionKeyLabel = "encrypted cookie";
inline constexpr std::string_view kSigningKeyLabel = "signed encrypted cookie";

inline constexpr std::string_view kEnvelopeDomain = "securecookie-envelope-v1";
inline constexpr char kEnvelopeSeparator = '.';
inline constexpr size_t kEnvelopeSegments = 3;
inline constexpr size_t kMaxEnvelopeChars = 8192;

constexpr size_t Base64UrlLength(const size_t bytes) noexcept {
    return (bytes * 4 + 2) / 3;
}

// Largest plaintext whose envelope still fits in kMaxEnvelopeChars.
inline constexpr size_t kMaxPlaintextBytes =
    (kMaxEnvelopeChars - (kEnvelopeSegments - 1)
        - Base64UrlLength(kAesGcmNonceBytes)
        - Base64UrlLength(kHmacSha512Bytes)) * 3 / 4
    - kAesGcmTagBytes;

inline constexpr size_t kMaxSetCookieBytes = 4096;

inline constexpr char kBinaryPayloadVersion = '\x01';
inline constexpr size_t kMaxCookieDomainChars = 253;
inline constexpr size_t kMaxDomainLabelChars = 63;

inline constexpr std::string_view kSetCookieHeader = "Set-Cookie";
inline constexpr std::string_view kCookieHeader = "Cookie";
inline constexpr std::string_view kUserAgentHeader = "User-Agent";

inline constexpr std::string_view kFingerprintContext = "securecookie-fingerprint-v1";

}
