#pragma once
#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"
#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>
namespace securecookie::crypto {
/**
 * @brief HMAC-SHA512 (libsodium) over the concatenation of several parts.
 *
 * Accepts keys of any non-empty length; the cookie signing key is 64 bytes.
 */
class HmacSha512 {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CookieFailure> Compute(
        std::span<const uint8_t> key,
        std::initializer_list<std::span<const uint8_t>> parts);
    /**
     * @brief Recompute and compare against @p expected_tag in constant time.
     *
     * @return Ok(true) on match, Ok(false) on mismatch (including wrong length)
     */
    [[nodiscard]] static Result<bool, CookieFailure> Verify(
        std::span<const uint8_t> key,
        std::initializer_list<std::span<const uint8_t>> parts,
        std::span<const uint8_t> expected_tag);
private:
    HmacSha512() = delete;
};
}
