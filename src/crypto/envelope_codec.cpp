#include "securecookie/crypto/envelope_codec.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/core/constants.hpp"

#include <fmt/core.h>
#include <array>

namespace securecookie::crypto {

namespace {
    using PartsResult = Result<EnvelopeParts, CookieFailure>;

    Result<std::vector<uint8_t>, CookieFailure> DecodeSegment(
        std::string_view segment,
        const char* name) {
        if (segment.empty()) {
            return Result<std::vector<uint8_t>, CookieFailure>::Err(
                CookieFailure::Parse(fmt::format("Envelope {} segment is empty", name)));
        }
        auto decoded = SodiumInterop::Base64UrlDecode(segment);
        if (!decoded.has_value()) {
            return Result<std::vector<uint8_t>, CookieFailure>::Err(
                CookieFailure::Parse(fmt::format("Envelope {} segment is not valid base64url", name)));
        }
        return Result<std::vector<uint8_t>, CookieFailure>::Ok(std::move(*decoded));
    }
}

std::string EnvelopeCodec::Serialize(const EnvelopeParts& parts) {
    std::string out;
    out.reserve((parts.iv.size() + parts.ciphertext.size() + parts.tag.size()) * 4 / 3 + 8);
    out += SodiumInterop::Base64UrlEncode(parts.iv);
    out += kEnvelopeSeparator;
    out += SodiumInterop::Base64UrlEncode(parts.ciphertext);
    out += kEnvelopeSeparator;
    out += SodiumInterop::Base64UrlEncode(parts.tag);
    return out;
}

PartsResult EnvelopeCodec::Parse(std::string_view envelope) {
    if (envelope.size() > kMaxEnvelopeChars) {
        return PartsResult::Err(
            CookieFailure::Parse(
                fmt::format("Envelope exceeds {} characters", kMaxEnvelopeChars)));
    }

    std::array<std::string_view, kEnvelopeSegments> segments;
    size_t count = 0;
    size_t start = 0;
    while (true) {
        const size_t pos = envelope.find(kEnvelopeSeparator, start);
        if (count == kEnvelopeSegments) {
            return PartsResult::Err(
                CookieFailure::Parse("Envelope has too many segments"));
        }
        if (pos == std::string_view::npos) {
            segments[count++] = envelope.substr(start);
            break;
        }
        segments[count++] = envelope.substr(start, pos - start);
        start = pos + 1;
    }
    if (count != kEnvelopeSegments) {
        return PartsResult::Err(
            CookieFailure::Parse(
                fmt::format("Envelope must have {} segments, got {}", kEnvelopeSegments, count)));
    }

    auto iv = DecodeSegment(segments[0], "iv");
    if (iv.IsErr()) {
        return PartsResult::Err(std::move(iv).UnwrapErr());
    }
    auto ciphertext = DecodeSegment(segments[1], "ciphertext");
    if (ciphertext.IsErr()) {
        return PartsResult::Err(std::move(ciphertext).UnwrapErr());
    }
    auto tag = DecodeSegment(segments[2], "tag");
    if (tag.IsErr()) {
        return PartsResult::Err(std::move(tag).UnwrapErr());
    }

    EnvelopeParts parts{
        .iv = std::move(iv).Unwrap(),
        .ciphertext = std::move(ciphertext).Unwrap(),
        .tag = std::move(tag).Unwrap()
    };
    if (parts.iv.size() != kAesGcmNonceBytes) {
        return PartsResult::Err(
            CookieFailure::Parse(
                fmt::format("Envelope IV must be {} bytes, got {}", kAesGcmNonceBytes, parts.iv.size())));
    }
    if (parts.ciphertext.size() < kAesGcmTagBytes) {
        return PartsResult::Err(
            CookieFailure::Parse(
                fmt::format("Envelope ciphertext must be at least {} bytes, got {}",
                    kAesGcmTagBytes, parts.ciphertext.size())));
    }
    if (parts.tag.size() != kHmacSha512Bytes) {
        return PartsResult::Err(
            CookieFailure::Parse(
                fmt::format("Envelope tag must be {} bytes, got {}", kHmacSha512Bytes, parts.tag.size())));
    }
    return PartsResult::Ok(std::move(parts));
}

}
