#include "securecookie/crypto/key_derivation.hpp"
#include "securecookie/crypto/derived_key_cache.hpp"
#include "securecookie/core/constants.hpp"
#include "securecookie/core/openssl_constants.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace securecookie::crypto {

using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_KDF_Deleter {
        void operator()(EVP_KDF* kdf) const {
            if (kdf) {
                EVP_KDF_free(kdf);
            }
        }
    };
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EVP_KDF_ptr = std::unique_ptr<EVP_KDF, EVP_KDF_Deleter>;
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, CookieFailure> KeyDerivation::ValidateParameters(
    std::span<const uint8_t> secret,
    std::string_view purpose,
    const uint32_t iterations,
    const size_t output_size) {
    if (secret.empty()) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config("Key derivation secret cannot be empty"));
    }
    if (purpose.empty()) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config("Key derivation purpose label cannot be empty"));
    }
    if (iterations == 0) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config("Key derivation iteration count must be positive"));
    }
    if (output_size == 0 || output_size > kMaxDerivedKeyBytes) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config(
                fmt::format("Derived key size must be between 1 and {} bytes, got {}",
                    kMaxDerivedKeyBytes, output_size)));
    }
    return Result<Unit, CookieFailure>::Ok(unit);
}

Result<Unit, CookieFailure> KeyDerivation::DeriveKey(
    std::span<const uint8_t> secret,
    std::string_view purpose,
    const uint32_t iterations,
    std::span<uint8_t> output) {
    if (auto check = ValidateParameters(secret, purpose, iterations, output.size()); check.IsErr()) {
        return check;
    }

    EVP_KDF_ptr kdf(EVP_KDF_fetch(nullptr, OpenSSL::ALGORITHM_PBKDF2.data(), nullptr));
    if (!kdf) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Crypto("Failed to fetch PBKDF2 algorithm"));
    }
    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Crypto("Failed to create PBKDF2 context"));
    }

    unsigned int iteration_count = iterations;
    // The iteration floor is enforced above; skip the SP 800-132 lower bounds.
    int pkcs5_mode = 1;
    OSSL_PARAM params[6];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>(OpenSSL::ALGORITHM_SHA256.data()), 0);
    params[1] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_PASSWORD, const_cast<uint8_t*>(secret.data()), secret.size());
    params[2] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_SALT, const_cast<char*>(purpose.data()), purpose.size());
    params[3] = OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iteration_count);
    params[4] = OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5_mode);
    params[5] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSL::SUCCESS) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Crypto(
                fmt::format("PBKDF2 derivation failed for label '{}'", purpose)));
    }
    return Result<Unit, CookieFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CookieFailure> KeyDerivation::DeriveKeyBytes(
    std::span<const uint8_t> secret,
    std::string_view purpose,
    const uint32_t iterations,
    const size_t output_size) {
    if (auto check = ValidateParameters(secret, purpose, iterations, output_size); check.IsErr()) {
        return Result<std::vector<uint8_t>, CookieFailure>::Err(std::move(check).UnwrapErr());
    }
    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(secret, purpose, iterations, output);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, CookieFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, CookieFailure>::Ok(std::move(output));
}

Result<std::shared_ptr<const DerivedKey>, CookieFailure> KeyDerivation::DeriveCached(
    std::span<const uint8_t> secret,
    std::string_view purpose,
    const uint32_t iterations,
    const size_t output_size) {
    return DerivedKeyCache::Instance().GetOrDerive(secret, purpose, iterations, output_size);
}

}
