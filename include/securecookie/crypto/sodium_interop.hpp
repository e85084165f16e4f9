#pragma once

#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace securecookie::crypto {

/**
 * @brief Thin wrappers over the libsodium primitives the cookie layer needs.
 *
 * Initialize() must succeed before anything else here is used. It is
 * thread-safe and idempotent.
 */
class SodiumInterop {
public:
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide (sodium_memzero).
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time equality. Buffers of different length compare unequal.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Unpadded URL-safe base64.
     */
    static std::string Base64UrlEncode(std::span<const uint8_t> data);

    /**
     * @brief Strict inverse of Base64UrlEncode.
     *
     * Returns nullopt for characters outside the alphabet, padding, or
     * non-canonical trailing bits.
     */
    static std::optional<std::vector<uint8_t>> Base64UrlDecode(std::string_view encoded);

    /**
     * @brief Keyed or unkeyed BLAKE2b (crypto_generichash).
     */
    static std::vector<uint8_t> GenericHash(
        std::span<const uint8_t> data,
        size_t output_size,
        std::span<const uint8_t> key = {});

    /**
     * @brief sodium_malloc: guard-paged, mlocked, wiped on free.
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 64 * 1024 * 1024;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
};

inline void WipeQuietly(std::vector<uint8_t>& bytes) {
    if (!bytes.empty()) {
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
        (void) _wipe;
    }
}

inline void WipeQuietly(std::string& text) {
    if (!text.empty()) {
        auto _wipe = SodiumInterop::SecureWipe(
            std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
        (void) _wipe;
    }
}

}
