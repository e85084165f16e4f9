#include <catch2/catch_test_macros.hpp>
#include "securecookie/crypto/message_encryptor.hpp"
#include "securecookie/crypto/envelope_codec.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/core/constants.hpp"
#include "helpers/test_fixtures.hpp"
#include <algorithm>
#include <string>
#include <vector>
using namespace securecookie;
using namespace securecookie::crypto;
using securecookie::test::MakeMessageEncryptor;
namespace {
bool IsIntegrityError(const CookieFailure& failure) {
    return failure.Is(CookieFailureType::Integrity);
}
// Flip every bit of one envelope component in turn; each forgery must fail integrity.
void RequireEveryBitFlipRejected(
    const MessageEncryptor& encryptor,
    const EnvelopeParts& original,
    std::vector<uint8_t> EnvelopeParts::*component) {
    const size_t bytes = (original.*component).size();
    for (size_t i = 0; i < bytes; ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            auto forged = original;
            (forged.*component)[i] ^= static_cast<uint8_t>(1u << bit);
            auto result = encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(forged));
            INFO("byte " << i << " bit " << bit);
            REQUIRE(result.IsErrAnd(IsIntegrityError));
        }
    }
}
}
TEST_CASE("Attacks - Single bit flips in any envelope component", "[attacks][tamper]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto encryptor = MakeMessageEncryptor();
    for (const std::string payload : {std::string(), std::string("{\"uid\":42}"), std::string(300, 'z')}) {
        const auto envelope = encryptor.EncryptAndSign(std::string_view(payload)).Unwrap();
        const auto parts = EnvelopeCodec::Parse(envelope).Unwrap();
        RequireEveryBitFlipRejected(encryptor, parts, &EnvelopeParts::iv);
        RequireEveryBitFlipRejected(encryptor, parts, &EnvelopeParts::ciphertext);
        RequireEveryBitFlipRejected(encryptor, parts, &EnvelopeParts::tag);
    }
}
TEST_CASE("Attacks - Bit flips in the envelope string never decrypt", "[attacks][tamper]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto encryptor = MakeMessageEncryptor();
    const auto envelope = encryptor.EncryptAndSign(std::string_view("{\"uid\":42}")).Unwrap();
    for (size_t i = 0; i < envelope.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            auto forged = envelope;
            forged[i] = static_cast<char>(forged[i] ^ (1 << bit));
            auto result = encryptor.DecryptAndVerify(forged);
            INFO("char " << i << " bit " << bit);
            REQUIRE(result.IsErr());
            const auto type = result.UnwrapErr().type;
            REQUIRE((type == CookieFailureType::Parse || type == CookieFailureType::Integrity));
        }
    }
}
TEST_CASE("Attacks - Structural forgeries", "[attacks][tamper]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto encryptor = MakeMessageEncryptor();
    const auto a = EnvelopeCodec::Parse(encryptor.EncryptAndSign(std::string_view("alice")).Unwrap()).Unwrap();
    const auto b = EnvelopeCodec::Parse(encryptor.EncryptAndSign(std::string_view("mallory")).Unwrap()).Unwrap();
    SECTION("Splicing the IV of one envelope onto another") {
        auto spliced = b;
        spliced.iv = a.iv;
        REQUIRE(encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(spliced)).IsErrAnd(IsIntegrityError));
    }
    SECTION("Swapping tags between envelopes") {
        auto swapped = b;
        swapped.tag = a.tag;
        REQUIRE(encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(swapped)).IsErrAnd(IsIntegrityError));
    }
    SECTION("Truncated ciphertext") {
        auto truncated = a;
        truncated.ciphertext.pop_back();
        REQUIRE(encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(truncated)).IsErrAnd(IsIntegrityError));
    }
    SECTION("Appended ciphertext") {
        auto extended = a;
        extended.ciphertext.push_back(0x00);
        REQUIRE(encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(extended)).IsErrAnd(IsIntegrityError));
    }
    SECTION("All-zero tag") {
        auto zeroed = a;
        std::fill(zeroed.tag.begin(), zeroed.tag.end(), 0);
        REQUIRE(encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(zeroed)).IsErrAnd(IsIntegrityError));
    }
    SECTION("Client sees the same message for every rejection") {
        auto forged = a;
        forged.tag[0] ^= 1;
        const auto integrity = encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(forged)).UnwrapErr();
        const auto parse = encryptor.DecryptAndVerify("garbage").UnwrapErr();
        REQUIRE(integrity.ClientMessage() == parse.ClientMessage());
    }
}
