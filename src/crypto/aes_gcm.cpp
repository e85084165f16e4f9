#include "securecookie/crypto/aes_gcm.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/core/constants.hpp"
#include "securecookie/core/openssl_constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <fmt/core.h>
#include <limits>
#include <memory>
#include <string>
namespace securecookie::crypto {
using OpenSSL = OpenSSLConstants;
using BytesResult = Result<std::vector<uint8_t>, CookieFailure>;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[OpenSSL::ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    CookieFailure OpenSSLFailure(const char* step) {
        return CookieFailure::Crypto(fmt::format("{}: {}", step, GetOpenSSLError()));
    }
    Result<Unit, CookieFailure> CheckKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, CookieFailure>::Err(
                CookieFailure::Config(
                    fmt::format("AES-256-GCM key must be {} bytes, got {}",
                        kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return Result<Unit, CookieFailure>::Err(
                CookieFailure::Parse(
                    fmt::format("AES-GCM nonce must be {} bytes, got {}",
                        kAesGcmNonceBytes, nonce.size())));
        }
        return Result<Unit, CookieFailure>::Ok(unit);
    }
    constexpr size_t kMaxEvpInput = static_cast<size_t>(std::numeric_limits<int>::max());
    Result<Unit, CookieFailure> CheckInputSizes(
        std::span<const uint8_t> data,
        std::span<const uint8_t> associated_data) {
        if (data.size() > kMaxEvpInput - kAesGcmTagBytes || associated_data.size() > kMaxEvpInput) {
            return Result<Unit, CookieFailure>::Err(
                CookieFailure::Config(
                    fmt::format("AES-GCM input too large: {} bytes, {} bytes associated data",
                        data.size(), associated_data.size())));
        }
        return Result<Unit, CookieFailure>::Ok(unit);
    }
    /// Creates a context keyed for one direction and feeds the associated data.
    Result<EVP_CIPHER_CTX_ptr, CookieFailure> InitContext(
        const bool encrypt,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) {
        using CtxResult = Result<EVP_CIPHER_CTX_ptr, CookieFailure>;
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return CtxResult::Err(OpenSSLFailure("Failed to create cipher context"));
        }
        const int enc = encrypt ? 1 : 0;
        if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc)
                != OpenSSL::SUCCESS) {
            return CtxResult::Err(OpenSSLFailure("Failed to initialize AES-256-GCM"));
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                               static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
            return CtxResult::Err(OpenSSLFailure("Failed to set nonce length"));
        }
        if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc)
                != OpenSSL::SUCCESS) {
            return CtxResult::Err(OpenSSLFailure("Failed to set key and nonce"));
        }
        if (!associated_data.empty()) {
            int outlen = 0;
            if (EVP_CipherUpdate(ctx.get(), nullptr, &outlen,
                                 associated_data.data(),
                                 static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
                return CtxResult::Err(OpenSSLFailure("Failed to add associated data"));
            }
        }
        return CtxResult::Ok(std::move(ctx));
    }
}
BytesResult AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckKeyAndNonce(key, nonce); check.IsErr()) {
        return BytesResult::Err(std::move(check).UnwrapErr());
    }
    if (auto check = CheckInputSizes(plaintext, associated_data); check.IsErr()) {
        return BytesResult::Err(std::move(check).UnwrapErr());
    }
    auto ctx_result = InitContext(true, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return BytesResult::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();
    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(OpenSSLFailure("Encryption failed"));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(OpenSSLFailure("Encryption finalization failed"));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(kAesGcmTagBytes),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(OpenSSLFailure("Failed to get authentication tag"));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return BytesResult::Ok(std::move(output));
}
BytesResult AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckKeyAndNonce(key, nonce); check.IsErr()) {
        return BytesResult::Err(std::move(check).UnwrapErr());
    }
    if (auto check = CheckInputSizes(ciphertext_with_tag, associated_data); check.IsErr()) {
        return BytesResult::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return BytesResult::Err(
            CookieFailure::Parse(
                fmt::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    const auto ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());
    auto ctx_result = InitContext(false, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return BytesResult::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(OpenSSLFailure("Decryption failed"));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(kAesGcmTagBytes),
                           tag.data()) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(OpenSSLFailure("Failed to set authentication tag"));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(
            CookieFailure::Integrity("AES-GCM authentication tag verification failed"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return BytesResult::Ok(std::move(output));
}
}
