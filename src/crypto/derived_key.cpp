#include "securecookie/crypto/derived_key.hpp"
#include "securecookie/crypto/sodium_interop.hpp"

#include <sodium.h>
#include <fmt/core.h>
#include <cstring>

namespace securecookie::crypto {

Result<DerivedKey, SodiumFailure> DerivedKey::Seal(
    std::span<const uint8_t> material,
    std::string_view purpose) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<DerivedKey, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("Libsodium not initialized"));
    }
    if (material.empty()) {
        return Result<DerivedKey, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Cannot seal empty key material"));
    }

    void* ptr = SodiumInterop::AllocateSecure(material.size());
    if (ptr == nullptr) {
        return Result<DerivedKey, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                fmt::format("Failed to allocate {} bytes of secure memory for '{}'",
                    material.size(), purpose)));
    }
    std::memcpy(ptr, material.data(), material.size());

    if (sodium_mprotect_readonly(ptr) != 0) {
        SodiumInterop::FreeSecure(ptr);
        return Result<DerivedKey, SodiumFailure>::Err(
            SodiumFailure::WriteOperationFailed(
                fmt::format("Failed to mark key '{}' read-only", purpose)));
    }

    return Result<DerivedKey, SodiumFailure>::Ok(
        DerivedKey(ptr, material.size(), std::string(purpose)));
}

DerivedKey::~DerivedKey() {
    Release();
}

DerivedKey::DerivedKey(DerivedKey&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_)
    , purpose_(std::move(other.purpose_)) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

DerivedKey& DerivedKey::operator=(DerivedKey&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = other.ptr_;
        size_ = other.size_;
        purpose_ = std::move(other.purpose_);
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void DerivedKey::Release() noexcept {
    if (ptr_ != nullptr) {
        // sodium_free restores write access before wiping.
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

}
