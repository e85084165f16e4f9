#include "securecookie/crypto/sodium_interop.hpp"

#include <sodium.h>
#include <fmt/core.h>

namespace securecookie::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("Failed to initialize libsodium"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("Libsodium not initialized"));
    }
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                fmt::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

std::string SodiumInterop::Base64UrlEncode(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    // encoded length includes the terminating NUL
    encoded.resize(encoded.size() - 1);
    return encoded;
}

std::optional<std::vector<uint8_t>> SodiumInterop::Base64UrlDecode(std::string_view encoded) {
    std::vector<uint8_t> decoded(encoded.size() * 3 / 4 + 1);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(
            decoded.data(), decoded.size(),
            encoded.data(), encoded.size(),
            nullptr, &decoded_len, &end,
            sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) {
        return std::nullopt;
    }
    if (end != encoded.data() + encoded.size()) {
        return std::nullopt;
    }
    decoded.resize(decoded_len);
    return decoded;
}

std::vector<uint8_t> SodiumInterop::GenericHash(
    std::span<const uint8_t> data,
    size_t output_size,
    std::span<const uint8_t> key) {
    std::vector<uint8_t> output(output_size);
    crypto_generichash(
        output.data(),
        output.size(),
        data.data(),
        data.size(),
        key.empty() ? nullptr : key.data(),
        key.size());
    return output;
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
