#include <catch2/catch_test_macros.hpp>
#include "securecookie/session/session_manager.hpp"
#include "securecookie/session/fingerprint_session.hpp"
#include "securecookie/http/memory_request.hpp"
#include "securecookie/http/memory_response.hpp"
#include "securecookie/crypto/sodium_interop.hpp"
#include "helpers/test_fixtures.hpp"
#include "test_payload.pb.h"
#include <memory>
#include <string>
using namespace securecookie;
using namespace securecookie::session;
using securecookie::http::MemoryRequest;
using securecookie::http::MemoryResponse;
using securecookie::test::MakeCookieEncryptor;
using securecookie::test::UserPayload;
namespace {
// Rejects sessions without a positive uid.
class UserSession final : public ISession {
public:
    [[nodiscard]] const google::protobuf::Message& State() const override { return payload; }
    [[nodiscard]] google::protobuf::Message& MutableState() override { return payload; }
    [[nodiscard]] Result<Unit, CookieFailure> Validate(const interfaces::IRequest&) const override {
        if (payload.uid() <= 0) {
            return Result<Unit, CookieFailure>::Err(CookieFailure::Validation("uid must be positive"));
        }
        return Result<Unit, CookieFailure>::Ok(unit);
    }
    UserPayload payload;
};
CookieSessionManager MakeManager(std::shared_ptr<const ICookiePolicy> policy = nullptr) {
    auto config = configuration::SessionConfig::Default()
        .WithCookieName("sess")
        .WithTrustedDomain("example.com");
    auto manager = CookieSessionManager::Create(MakeCookieEncryptor(), config, std::move(policy));
    REQUIRE(manager.IsOk());
    return std::move(manager).Unwrap();
}
http::Cookie OnlyCookie(const CookieSessionManager& manager, const MemoryResponse& response) {
    const auto headers = response.SetCookieHeaders();
    REQUIRE(headers.size() == 1);
    REQUIRE(headers[0].rfind(manager.CookieName() + "=", 0) == 0);
    http::Cookie cookie;
    cookie.name = manager.CookieName();
    cookie.secure = headers[0].find("; Secure") != std::string::npos;
    const auto domain = headers[0].find("; Domain=");
    if (domain != std::string::npos) {
        const auto start = domain + 9;
        cookie.domain = headers[0].substr(start, headers[0].find(';', start) - start);
    }
    const auto path = headers[0].find("; Path=");
    if (path != std::string::npos) {
        const auto start = path + 7;
        cookie.path = headers[0].substr(start, headers[0].find(';', start) - start);
    }
    return cookie;
}
}
TEST_CASE("CookieSessionManager - Update then Current", "[session][manager]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto manager = MakeManager();
    MemoryRequest first("localhost:8080");
    MemoryResponse response;
    UserSession session;
    session.payload.set_uid(42);
    session.payload.set_name("ada");
    REQUIRE(manager.Update(response, first, session).IsOk());

    MemoryRequest next("localhost:8080");
    next.AddCookiesFrom(response);
    UserSession loaded;
    REQUIRE(manager.Current(next, loaded).IsOk());
    REQUIRE(loaded.payload.uid() == 42);
    REQUIRE(loaded.payload.name() == "ada");
}
TEST_CASE("CookieSessionManager - Host-derived attributes", "[session][manager][policy]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto manager = MakeManager();
    UserSession session;
    session.payload.set_uid(1);
    SECTION("Loopback host") {
        MemoryResponse response;
        REQUIRE(manager.Update(response, MemoryRequest("localhost:8080"), session).IsOk());
        const auto cookie = OnlyCookie(manager, response);
        REQUIRE_FALSE(cookie.secure);
        REQUIRE(cookie.domain.empty());
        REQUIRE(cookie.path == "/");
    }
    SECTION("Public host") {
        MemoryResponse response;
        REQUIRE(manager.Update(response, MemoryRequest("app.example.com"), session).IsOk());
        const auto cookie = OnlyCookie(manager, response);
        REQUIRE(cookie.secure);
        REQUIRE(cookie.domain == "example.com");
        REQUIRE(cookie.path == "/");
        REQUIRE(response.SetCookieHeaders()[0].find("; HttpOnly") != std::string::npos);
        REQUIRE(response.SetCookieHeaders()[0].find("; SameSite=Lax") != std::string::npos);
    }
    SECTION("Injected policy overrides the host rule") {
        configuration::CookieOptions fixed;
        fixed.path = "/api";
        const auto custom = MakeManager(std::make_shared<FixedCookiePolicy>(fixed));
        MemoryResponse response;
        REQUIRE(custom.Update(response, MemoryRequest("app.example.com"), session).IsOk());
        const auto cookie = OnlyCookie(custom, response);
        REQUIRE_FALSE(cookie.secure);
        REQUIRE(cookie.path == "/api");
    }
}
TEST_CASE("CookieSessionManager - Rejected sessions", "[session][manager]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto manager = MakeManager();
    UserSession loaded;
    SECTION("No cookie is NotFound") {
        auto current = manager.Current(MemoryRequest("localhost"), loaded);
        REQUIRE(current.IsErrAnd([](const CookieFailure& f) { return f.Is(CookieFailureType::NotFound); }));
    }
    SECTION("Self-validation failure is reported and the state cleared") {
        UserSession invalid;
        invalid.payload.set_uid(-5);
        invalid.payload.set_name("mallory");
        MemoryResponse response;
        REQUIRE(manager.Update(response, MemoryRequest("localhost"), invalid).IsOk());
        MemoryRequest next("localhost");
        next.AddCookiesFrom(response);
        auto current = manager.Current(next, loaded);
        REQUIRE(current.IsErrAnd([](const CookieFailure& f) { return f.Is(CookieFailureType::Validation); }));
        REQUIRE(loaded.payload.name().empty());
        REQUIRE(current.UnwrapErr().ClientMessage() == "no valid session");
    }
    SECTION("Cookie from another secret is an integrity failure") {
        auto config = configuration::SessionConfig::Default().WithCookieName("sess");
        auto foreign = CookieSessionManager::Create(MakeCookieEncryptor("a-different-secret"), config).Unwrap();
        UserSession session;
        session.payload.set_uid(9);
        MemoryResponse response;
        REQUIRE(foreign.Update(response, MemoryRequest("localhost"), session).IsOk());
        MemoryRequest next("localhost");
        next.AddCookiesFrom(response);
        auto current = manager.Current(next, loaded);
        REQUIRE(current.IsErrAnd([](const CookieFailure& f) { return f.Is(CookieFailureType::Integrity); }));
    }
}
TEST_CASE("CookieSessionManager - End and CurrentOrStart", "[session][manager]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto manager = MakeManager();
    SECTION("End deletes with the policy's domain") {
        MemoryResponse response;
        REQUIRE(manager.End(response, MemoryRequest("app.example.com")).IsOk());
        REQUIRE(response.SetCookieHeaders() == std::vector<std::string>{
            "sess=; Path=/; Domain=example.com; Max-Age=0; HttpOnly; Secure"});
    }
    SECTION("Missing session starts a new one") {
        UserSession session;
        const SessionFactory factory = [](const interfaces::IRequest&, ISession& fresh) {
            auto& user = static_cast<UserSession&>(fresh);
            user.payload.set_uid(1000);
            return Result<Unit, CookieFailure>::Ok(unit);
        };
        auto origin = manager.CurrentOrStart(MemoryRequest("localhost"), session, factory);
        REQUIRE(origin.IsOk());
        REQUIRE(origin.Unwrap() == SessionOrigin::Started);
        REQUIRE(session.payload.uid() == 1000);
    }
    SECTION("Tampered session starts a new one") {
        MemoryRequest request("localhost");
        request.AddCookie("sess", "AAAA.AAAA.AAAA");
        UserSession session;
        const SessionFactory factory = [](const interfaces::IRequest&, ISession&) {
            return Result<Unit, CookieFailure>::Ok(unit);
        };
        REQUIRE(manager.CurrentOrStart(request, session, factory).Unwrap() == SessionOrigin::Started);
    }
    SECTION("Valid session is resumed") {
        UserSession session;
        session.payload.set_uid(7);
        MemoryResponse response;
        REQUIRE(manager.Update(response, MemoryRequest("localhost"), session).IsOk());
        MemoryRequest next("localhost");
        next.AddCookiesFrom(response);
        UserSession loaded;
        auto origin = manager.CurrentOrStart(next, loaded, nullptr);
        REQUIRE(origin.Unwrap() == SessionOrigin::Resumed);
        REQUIRE(loaded.payload.uid() == 7);
    }
}
TEST_CASE("CookieSessionManager - Fingerprint sessions", "[session][manager][fingerprint]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto manager = MakeManager();
    MemoryRequest login("app.example.com", "198.51.100.4");
    login.SetHeader(kUserAgentHeader, "Browser/1.0");
    FingerprintSession session;
    REQUIRE(session.Start(login, "user-42").IsOk());
    MemoryResponse response;
    REQUIRE(manager.Update(response, login, session).IsOk());
    SECTION("Same client resumes") {
        MemoryRequest next("app.example.com", "198.51.100.4");
        next.SetHeader(kUserAgentHeader, "Browser/1.0");
        next.AddCookiesFrom(response);
        FingerprintSession loaded;
        REQUIRE(manager.Current(next, loaded).IsOk());
        REQUIRE(loaded.UserId() == "user-42");
    }
    SECTION("Stolen cookie replayed elsewhere fails validation") {
        MemoryRequest thief("app.example.com", "203.0.113.66");
        thief.SetHeader(kUserAgentHeader, "Browser/1.0");
        thief.AddCookiesFrom(response);
        FingerprintSession loaded;
        auto current = manager.Current(thief, loaded);
        REQUIRE(current.IsErrAnd([](const CookieFailure& f) { return f.Is(CookieFailureType::Validation); }));
        REQUIRE(loaded.UserId().empty());
    }
}
TEST_CASE("CookieSessionManager - Construction", "[session][manager][config]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto bad_name = configuration::SessionConfig::Default().WithCookieName("bad name");
    REQUIRE(CookieSessionManager::Create(MakeCookieEncryptor(), bad_name).IsErrAnd(
        [](const CookieFailure& f) { return f.Is(CookieFailureType::Config); }));
    REQUIRE(CookieSessionManager::Create(nullptr, configuration::SessionConfig::Default()).IsErrAnd(
        [](const CookieFailure& f) { return f.Is(CookieFailureType::Config); }));
}
