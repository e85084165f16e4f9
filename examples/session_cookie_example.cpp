/**
 * @file session_cookie_example.cpp
 * @brief Issue, read back, reject and delete a fingerprinted session cookie
 */

#include "securecookie/configuration/cookie_config.hpp"
#include "securecookie/cookies/cookie_encryptor.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "securecookie/http/memory_request.hpp"
#include "securecookie/http/memory_response.hpp"
#include "securecookie/session/fingerprint_session.hpp"
#include "securecookie/session/session_manager.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace securecookie;
using namespace securecookie::session;

namespace {

void print_headers(const http::MemoryResponse& response) {
    for (const auto& header : response.SetCookieHeaders()) {
        std::cout << "   Set-Cookie: " << header << std::endl;
    }
}

http::MemoryRequest browser_request(const std::string& host) {
    http::MemoryRequest request(host, "198.51.100.4");
    request.SetHeader("User-Agent", "ExampleBrowser/1.0");
    return request;
}

}

int main() {
    std::cout << "=== securecookie - Session Cookie Example ===" << std::endl;
    std::cout << std::endl;

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize libsodium: " << init.UnwrapErr().message << std::endl;
        return 1;
    }

    const char* env_secret = std::getenv("SECURECOOKIE_SECRET");
    const std::string secret = env_secret != nullptr && *env_secret != '\0'
        ? std::string(env_secret)
        : std::string("demo-secret-change-me-in-production");
    if (env_secret == nullptr) {
        std::cout << "SECURECOOKIE_SECRET not set, using the demo secret" << std::endl;
    }

    // 1. Derive keys (slow, once per process)
    std::cout << "1. Deriving cookie keys..." << std::endl;
    auto encryptor = cookies::CookieEncryptor::Create(
        configuration::EncryptorConfig::FromString(secret));
    if (encryptor.IsErr()) {
        std::cerr << "Configuration error: " << encryptor.UnwrapErr().message << std::endl;
        return 1;
    }
    auto manager_result = CookieSessionManager::Create(
        std::make_shared<cookies::CookieEncryptor>(std::move(encryptor).Unwrap()),
        configuration::SessionConfig::Default().WithTrustedDomain("example.com"));
    if (manager_result.IsErr()) {
        std::cerr << "Configuration error: " << manager_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto manager = std::move(manager_result).Unwrap();
    std::cout << "   ✓ Ready" << std::endl << std::endl;

    // 2. Issue on loopback and on a public host
    FingerprintSession session;
    for (const std::string host : {"localhost:8080", "app.example.com"}) {
        std::cout << "2. Issuing a session for " << host << std::endl;
        const auto request = browser_request(host);
        if (auto started = session.Start(request, "user-42"); started.IsErr()) {
            std::cerr << "Failed to start session: " << started.UnwrapErr().message << std::endl;
            return 1;
        }
        http::MemoryResponse response;
        if (auto updated = manager.Update(response, request, session); updated.IsErr()) {
            std::cerr << "Failed to set cookie: " << updated.UnwrapErr().message << std::endl;
            return 1;
        }
        print_headers(response);

        // 3. Read it back on the next request
        auto next = browser_request(host);
        next.AddCookiesFrom(response);
        FingerprintSession loaded;
        auto current = manager.Current(next, loaded);
        if (current.IsErr()) {
            std::cerr << "Session did not round-trip: " << current.UnwrapErr().message << std::endl;
            return 1;
        }
        std::cout << "3. Read back user '" << loaded.UserId() << "'" << std::endl;

        // 4. Tamper with it
        auto value = next.Cookie(manager.CookieName()).value_or("");
        value[value.size() / 2] = value[value.size() / 2] == 'A' ? 'B' : 'A';
        auto forged = browser_request(host);
        forged.AddCookie(manager.CookieName(), value);
        FingerprintSession rejected;
        auto tampered = manager.Current(forged, rejected);
        if (tampered.IsOk()) {
            std::cerr << "Tampered cookie was accepted" << std::endl;
            return 1;
        }
        std::cout << "4. Tampered cookie -> client sees \"" << tampered.UnwrapErr().ClientMessage()
                  << "\" (server log: " << ToString(tampered.UnwrapErr().type) << ")" << std::endl;

        // 5. Log out
        http::MemoryResponse logout;
        if (auto ended = manager.End(logout, next); ended.IsErr()) {
            std::cerr << "Failed to delete cookie: " << ended.UnwrapErr().message << std::endl;
            return 1;
        }
        std::cout << "5. Deleting the session" << std::endl;
        print_headers(logout);
        std::cout << std::endl;
    }

    std::cout << "=== Done ===" << std::endl;
    return 0;
}
