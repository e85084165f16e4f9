#include "securecookie/crypto/message_encryptor.hpp"
#include "securecookie/crypto/aes_gcm.hpp"
#include "securecookie/crypto/envelope_codec.hpp"
#include "securecookie/crypto/hmac_sha512.hpp"
#include "securecookie/crypto/key_derivation.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/core/constants.hpp"
#include "securecookie/debug/cookie_logger.hpp"

#include <fmt/core.h>

namespace securecookie::crypto {

namespace {
    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    std::span<const uint8_t> DomainBytes() {
        return AsBytes(kEnvelopeDomain);
    }
}

Result<MessageEncryptor, CookieFailure> MessageEncryptor::Create(
    std::span<const uint8_t> secret,
    const uint32_t iterations) {
    auto encryption_key = KeyDerivation::DeriveCached(
        secret, kEncryptionKeyLabel, iterations, kEncryptionKeyBytes);
    if (encryption_key.IsErr()) {
        return Result<MessageEncryptor, CookieFailure>::Err(
            std::move(encryption_key).UnwrapErr());
    }
    auto signing_key = KeyDerivation::DeriveCached(
        secret, kSigningKeyLabel, iterations, kSigningKeyBytes);
    if (signing_key.IsErr()) {
        return Result<MessageEncryptor, CookieFailure>::Err(
            std::move(signing_key).UnwrapErr());
    }
    return FromKeys(std::move(encryption_key).Unwrap(), std::move(signing_key).Unwrap());
}

Result<MessageEncryptor, CookieFailure> MessageEncryptor::FromKeys(
    std::shared_ptr<const DerivedKey> encryption_key,
    std::shared_ptr<const DerivedKey> signing_key) {
    if (!encryption_key || encryption_key->IsInvalid() ||
        encryption_key->Size() != kEncryptionKeyBytes) {
        return Result<MessageEncryptor, CookieFailure>::Err(
            CookieFailure::Config(
                fmt::format("Encryption key must be {} bytes", kEncryptionKeyBytes)));
    }
    if (!signing_key || signing_key->IsInvalid() ||
        signing_key->Size() != kSigningKeyBytes) {
        return Result<MessageEncryptor, CookieFailure>::Err(
            CookieFailure::Config(
                fmt::format("Signing key must be {} bytes", kSigningKeyBytes)));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<MessageEncryptor, CookieFailure>::Err(
            CookieFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    return Result<MessageEncryptor, CookieFailure>::Ok(
        MessageEncryptor(std::move(encryption_key), std::move(signing_key)));
}

Result<std::string, CookieFailure> MessageEncryptor::EncryptAndSign(
    std::span<const uint8_t> plaintext) const {
    if (plaintext.size() > kMaxPlaintextBytes) {
        return Result<std::string, CookieFailure>::Err(
            CookieFailure::Config(
                fmt::format("Plaintext of {} bytes exceeds the {} byte envelope capacity",
                    plaintext.size(), kMaxPlaintextBytes)));
    }
    EnvelopeParts parts;
    parts.iv = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);

    auto encrypted = AesGcm::Encrypt(encryption_key_->View(), parts.iv, plaintext, DomainBytes());
    if (encrypted.IsErr()) {
        return Result<std::string, CookieFailure>::Err(std::move(encrypted).UnwrapErr());
    }
    parts.ciphertext = std::move(encrypted).Unwrap();

    auto tag = HmacSha512::Compute(signing_key_->View(), {DomainBytes(), parts.iv, parts.ciphertext});
    if (tag.IsErr()) {
        return Result<std::string, CookieFailure>::Err(std::move(tag).UnwrapErr());
    }
    parts.tag = std::move(tag).Unwrap();

    return Result<std::string, CookieFailure>::Ok(EnvelopeCodec::Serialize(parts));
}

Result<std::string, CookieFailure> MessageEncryptor::EncryptAndSign(
    std::string_view plaintext) const {
    return EncryptAndSign(AsBytes(plaintext));
}

Result<std::vector<uint8_t>, CookieFailure> MessageEncryptor::DecryptAndVerify(
    std::string_view envelope) const {
    using BytesResult = Result<std::vector<uint8_t>, CookieFailure>;

    auto parsed = EnvelopeCodec::Parse(envelope);
    if (parsed.IsErr()) {
        debug::LogEnvelopeRejected(parsed.UnwrapErr().type);
        return BytesResult::Err(std::move(parsed).UnwrapErr());
    }
    const auto parts = std::move(parsed).Unwrap();

    auto verified = HmacSha512::Verify(
        signing_key_->View(), {DomainBytes(), parts.iv, parts.ciphertext}, parts.tag);
    if (verified.IsErr()) {
        return BytesResult::Err(std::move(verified).UnwrapErr());
    }
    if (!verified.Unwrap()) {
        debug::LogEnvelopeRejected(CookieFailureType::Integrity);
        return BytesResult::Err(
            CookieFailure::Integrity("Envelope signature verification failed"));
    }

    auto decrypted = AesGcm::Decrypt(encryption_key_->View(), parts.iv, parts.ciphertext, DomainBytes());
    if (decrypted.IsErr()) {
        debug::LogEnvelopeRejected(decrypted.UnwrapErr().type);
    }
    return decrypted;
}

}
