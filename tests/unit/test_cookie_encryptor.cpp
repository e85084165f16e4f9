#include <catch2/catch_test_macros.hpp>
#include "securecookie/cookies/cookie_encryptor.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "helpers/test_fixtures.hpp"
using namespace securecookie;
using namespace securecookie::cookies;
using securecookie::test::MakeCookieEncryptor;
TEST_CASE("CookieEncryptor - Protect and reveal", "[cookie_encryptor]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto encryptor = MakeCookieEncryptor();
    http::Cookie cookie;
    cookie.name = "sess";
    cookie.value = "plain value";
    cookie.path = "/";
    REQUIRE(encryptor->Protect(cookie).IsOk());
    REQUIRE(cookie.value != "plain value");
    REQUIRE(http::IsValidCookieValue(cookie.value));
    REQUIRE(cookie.path == "/");
    SECTION("Reveal restores the value in place") {
        REQUIRE(encryptor->Reveal(cookie).IsOk());
        REQUIRE(cookie.value == "plain value");
    }
    SECTION("Failed reveal leaves the cookie untouched") {
        cookie.value.back() = cookie.value.back() == 'A' ? 'B' : 'A';
        const auto before = cookie.value;
        REQUIRE(encryptor->Reveal(cookie).IsErr());
        REQUIRE(cookie.value == before);
    }
}
TEST_CASE("CookieEncryptor - Empty value means absent", "[cookie_encryptor]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto encryptor = MakeCookieEncryptor();
    http::Cookie cookie;
    cookie.name = "sess";
    auto result = encryptor->Reveal(cookie);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().Is(CookieFailureType::NotFound));
    REQUIRE_FALSE(result.UnwrapErr().Is(CookieFailureType::Integrity));
}
TEST_CASE("CookieEncryptor - Configuration", "[cookie_encryptor][config]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    REQUIRE(CookieEncryptor::Create("", test::kTestIterations).IsErrAnd(
        [](const CookieFailure& f) { return f.Is(CookieFailureType::Config); }));
    REQUIRE(CookieEncryptor::Create("secret", 0).IsErrAnd(
        [](const CookieFailure& f) { return f.Is(CookieFailureType::Config); }));
    auto config = configuration::EncryptorConfig::FromString(test::kTestSecret, test::kTestIterations);
    REQUIRE(CookieEncryptor::Create(config).IsOk());
}
