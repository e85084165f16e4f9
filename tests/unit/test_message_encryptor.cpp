#include <catch2/catch_test_macros.hpp>
#include "securecookie/crypto/message_encryptor.hpp"
#include "securecookie/crypto/aes_gcm.hpp"
#include "securecookie/crypto/key_derivation.hpp"
#include "securecookie/crypto/envelope_codec.hpp"
#include "securecookie/crypto/hmac_sha512.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/core/constants.hpp"
#include "helpers/test_fixtures.hpp"
#include <string>
#include <vector>
using namespace securecookie;
using namespace securecookie::crypto;
using securecookie::test::Bytes;
using securecookie::test::kTestIterations;
using securecookie::test::MakeMessageEncryptor;
TEST_CASE("MessageEncryptor - Round trip", "[encryptor]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto encryptor = MakeMessageEncryptor();
    SECTION("Payloads of assorted sizes") {
        for (const size_t size : {size_t{0}, size_t{1}, size_t{15}, size_t{16}, size_t{17}, size_t{1000}}) {
            const auto payload = SodiumInterop::GetRandomBytes(size);
            auto envelope = encryptor.EncryptAndSign(payload);
            REQUIRE(envelope.IsOk());
            auto opened = encryptor.DecryptAndVerify(envelope.Unwrap());
            REQUIRE(opened.IsOk());
            REQUIRE(opened.Unwrap() == payload);
        }
    }
    SECTION("Text payload") {
        auto envelope = encryptor.EncryptAndSign(std::string_view("{\"uid\":42}"));
        REQUIRE(envelope.IsOk());
        const auto opened = encryptor.DecryptAndVerify(envelope.Unwrap()).Unwrap();
        REQUIRE(std::string(opened.begin(), opened.end()) == "{\"uid\":42}");
    }
    SECTION("Fresh IV every time") {
        const auto a = encryptor.EncryptAndSign(std::string_view("same")).Unwrap();
        const auto b = encryptor.EncryptAndSign(std::string_view("same")).Unwrap();
        REQUIRE(a != b);
        REQUIRE(EnvelopeCodec::Parse(a).Unwrap().iv != EnvelopeCodec::Parse(b).Unwrap().iv);
    }
    SECTION("Plaintext does not appear in the envelope") {
        const auto envelope = encryptor.EncryptAndSign(std::string_view("visible-marker")).Unwrap();
        REQUIRE(envelope.find("visible-marker") == std::string::npos);
    }
}
TEST_CASE("MessageEncryptor - Shared secret interoperates", "[encryptor]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto enc_key = KeyDerivation::DeriveCached(Bytes(test::kTestSecret), kEncryptionKeyLabel, kTestIterations, kEncryptionKeyBytes);
    auto sign_key = KeyDerivation::DeriveCached(Bytes(test::kTestSecret), kSigningKeyLabel, kTestIterations, kSigningKeyBytes);
    auto from_keys = MessageEncryptor::FromKeys(enc_key.Unwrap(), sign_key.Unwrap());
    REQUIRE(from_keys.IsOk());
    const auto derived = MakeMessageEncryptor();
    const auto envelope = from_keys.Unwrap().EncryptAndSign(std::string_view("portable")).Unwrap();
    REQUIRE(derived.DecryptAndVerify(envelope).IsOk());
}
TEST_CASE("MessageEncryptor - Verification precedes decryption", "[encryptor][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto encryptor = MakeMessageEncryptor();
    const auto envelope = encryptor.EncryptAndSign(std::string_view("payload")).Unwrap();
    auto parts = EnvelopeCodec::Parse(envelope).Unwrap();
    SECTION("Ciphertext re-signed with the right key but broken GCM tag is still an integrity failure") {
        auto sign_key = KeyDerivation::DeriveCached(
            Bytes(test::kTestSecret), kSigningKeyLabel, kTestIterations, kSigningKeyBytes).Unwrap();
        parts.ciphertext.back() ^= 0x01;
        parts.tag = HmacSha512::Compute(sign_key->View(), {Bytes(kEnvelopeDomain), parts.iv, parts.ciphertext}).Unwrap();
        auto result = encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(parts));
        REQUIRE(result.IsErrAnd([](const CookieFailure& f) { return f.Is(CookieFailureType::Integrity); }));
    }
    SECTION("Tag forged with the encryption key is rejected") {
        auto enc_key = KeyDerivation::DeriveCached(
            Bytes(test::kTestSecret), kEncryptionKeyLabel, kTestIterations, kEncryptionKeyBytes).Unwrap();
        parts.tag = HmacSha512::Compute(enc_key->View(), {Bytes(kEnvelopeDomain), parts.iv, parts.ciphertext}).Unwrap();
        auto result = encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(parts));
        REQUIRE(result.IsErrAnd([](const CookieFailure& f) { return f.Is(CookieFailureType::Integrity); }));
    }
    SECTION("Tag over the parts without the domain prefix is rejected") {
        auto sign_key = KeyDerivation::DeriveCached(
            Bytes(test::kTestSecret), kSigningKeyLabel, kTestIterations, kSigningKeyBytes).Unwrap();
        parts.tag = HmacSha512::Compute(sign_key->View(), {parts.iv, parts.ciphertext}).Unwrap();
        auto result = encryptor.DecryptAndVerify(EnvelopeCodec::Serialize(parts));
        REQUIRE(result.IsErrAnd([](const CookieFailure& f) { return f.Is(CookieFailureType::Integrity); }));
    }
}
TEST_CASE("MessageEncryptor - Envelope is bound to the domain string", "[encryptor][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto encryptor = MakeMessageEncryptor();
    const auto parts = EnvelopeCodec::Parse(
        encryptor.EncryptAndSign(std::string_view("payload")).Unwrap()).Unwrap();
    auto sign_key = KeyDerivation::DeriveCached(
        Bytes(test::kTestSecret), kSigningKeyLabel, kTestIterations, kSigningKeyBytes).Unwrap();
    auto enc_key = KeyDerivation::DeriveCached(
        Bytes(test::kTestSecret), kEncryptionKeyLabel, kTestIterations, kEncryptionKeyBytes).Unwrap();
    REQUIRE(HmacSha512::Compute(sign_key->View(), {Bytes(kEnvelopeDomain), parts.iv, parts.ciphertext})
        .Unwrap() == parts.tag);
    auto opened = AesGcm::Decrypt(enc_key->View(), parts.iv, parts.ciphertext, Bytes(kEnvelopeDomain));
    REQUIRE(opened.IsOk());
    const auto expected = Bytes("payload");
    REQUIRE(opened.Unwrap() == std::vector<uint8_t>(expected.begin(), expected.end()));
    REQUIRE(AesGcm::Decrypt(enc_key->View(), parts.iv, parts.ciphertext).IsErrAnd(
        [](const CookieFailure& f) { return f.Is(CookieFailureType::Integrity); }));
}
TEST_CASE("MessageEncryptor - Plaintext size limit", "[encryptor][config]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto encryptor = MakeMessageEncryptor();
    SECTION("Largest plaintext still fits in a parseable envelope") {
        const std::vector<uint8_t> largest(kMaxPlaintextBytes, 0x5A);
        auto envelope = encryptor.EncryptAndSign(largest);
        REQUIRE(envelope.IsOk());
        REQUIRE(envelope.Unwrap().size() <= kMaxEnvelopeChars);
        auto opened = encryptor.DecryptAndVerify(envelope.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == largest);
    }
    SECTION("One byte more is a config error") {
        const std::vector<uint8_t> oversized(kMaxPlaintextBytes + 1, 0x5A);
        REQUIRE(encryptor.EncryptAndSign(oversized).IsErrAnd(
            [](const CookieFailure& f) { return f.Is(CookieFailureType::Config); }));
    }
}
TEST_CASE("MessageEncryptor - Construction errors", "[encryptor][config]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto is_config = [](const CookieFailure& f) { return f.Is(CookieFailureType::Config); };
    REQUIRE(MessageEncryptor::Create({}, kTestIterations).IsErrAnd(is_config));
    REQUIRE(MessageEncryptor::Create(Bytes("secret"), 0).IsErrAnd(is_config));
    auto sign_key = KeyDerivation::DeriveCached(
        Bytes(test::kTestSecret), kSigningKeyLabel, kTestIterations, kSigningKeyBytes).Unwrap();
    REQUIRE(MessageEncryptor::FromKeys(nullptr, sign_key).IsErrAnd(is_config));
    REQUIRE(MessageEncryptor::FromKeys(sign_key, sign_key).IsErrAnd(is_config));
}
