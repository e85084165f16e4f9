#pragma once

/**
 * @file cookie_logger.hpp
 * @brief Debug tracing for key derivation, envelope handling and sessions.
 *
 * Compiled in only when SECURECOOKIE_DEBUG_LOG is defined
 * (CMake: -DSECURECOOKIE_DEBUG_LOG=ON). Only metadata is ever printed:
 * labels, sizes, cookie names and failure kinds. Secrets, derived keys,
 * plaintexts and envelope contents never reach the log.
 */

#include "securecookie/core/failures.hpp"

#include <cstdint>
#include <cstdio>
#include <string_view>

namespace securecookie::debug {

#ifdef SECURECOOKIE_DEBUG_LOG

inline void LogKeyDerivation(
    std::string_view purpose,
    uint32_t iterations,
    size_t output_size,
    bool cache_hit) {
    fprintf(stdout, "[SECURECOOKIE-DEBUG] KDF label='%.*s' iterations=%u bytes=%zu %s\n",
        static_cast<int>(purpose.size()), purpose.data(),
        iterations,
        output_size,
        cache_hit ? "cache-hit" : "derived");
    fflush(stdout);
}

inline void LogEnvelopeRejected(CookieFailureType type) {
    const auto name = ToString(type);
    fprintf(stdout, "[SECURECOOKIE-DEBUG] ENVELOPE rejected: %.*s\n",
        static_cast<int>(name.size()), name.data());
    fflush(stdout);
}

inline void LogCookieEvent(std::string_view operation, std::string_view cookie_name) {
    fprintf(stdout, "[SECURECOOKIE-DEBUG] COOKIE %.*s name='%.*s'\n",
        static_cast<int>(operation.size()), operation.data(),
        static_cast<int>(cookie_name.size()), cookie_name.data());
    fflush(stdout);
}

inline void LogSessionRejected(std::string_view cookie_name, CookieFailureType type) {
    const auto name = ToString(type);
    fprintf(stdout, "[SECURECOOKIE-DEBUG] SESSION rejected cookie='%.*s': %.*s\n",
        static_cast<int>(cookie_name.size()), cookie_name.data(),
        static_cast<int>(name.size()), name.data());
    fflush(stdout);
}

#else // !SECURECOOKIE_DEBUG_LOG

inline void LogKeyDerivation(std::string_view, uint32_t, size_t, bool) {}
inline void LogEnvelopeRejected(CookieFailureType) {}
inline void LogCookieEvent(std::string_view, std::string_view) {}
inline void LogSessionRejected(std::string_view, CookieFailureType) {}

#endif // SECURECOOKIE_DEBUG_LOG

}
