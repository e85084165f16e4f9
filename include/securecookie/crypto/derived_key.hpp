#pragma once

#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace securecookie::crypto {

/**
 * @brief Key material held in libsodium guarded memory.
 *
 * The bytes are written once by Seal() and the pages are then switched to
 * read-only, so a cached key can be shared between threads without locking.
 * Move-only; the memory is wiped and released on destruction.
 */
class DerivedKey {
public:
    static Result<DerivedKey, SodiumFailure> Seal(
        std::span<const uint8_t> material,
        std::string_view purpose);

    ~DerivedKey();

    DerivedKey(DerivedKey&& other) noexcept;
    DerivedKey& operator=(DerivedKey&& other) noexcept;

    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;

    [[nodiscard]] std::span<const uint8_t> View() const noexcept {
        return {static_cast<const uint8_t*>(ptr_), size_};
    }

    [[nodiscard]] size_t Size() const noexcept { return size_; }

    [[nodiscard]] const std::string& Purpose() const noexcept { return purpose_; }

    [[nodiscard]] bool IsInvalid() const noexcept { return ptr_ == nullptr; }

private:
    DerivedKey(void* ptr, size_t size, std::string purpose) noexcept
        : ptr_(ptr), size_(size), purpose_(std::move(purpose)) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
    std::string purpose_;
};

}
