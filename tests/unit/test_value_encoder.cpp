#include <catch2/catch_test_macros.hpp>
#include "securecookie/cookies/value_encoder.hpp"
#include "test_payload.pb.h"
#include <string>
using namespace securecookie;
using namespace securecookie::cookies;
using securecookie::test::UserPayload;
using securecookie::test::UserPayloadV2;
namespace {
bool IsDecodeError(const CookieFailure& failure) {
    return failure.Is(CookieFailureType::Decode);
}
}
TEST_CASE("ValueEncoder - Null encoder", "[encoder]") {
    const NullEncoder encoder;
    const std::string value = "already a string; with = signs";
    auto encoded = encoder.Encode(value);
    REQUIRE(encoded.IsOk());
    REQUIRE(encoded.Unwrap() == value);
    std::string decoded;
    REQUIRE(encoder.Decode(encoded.Unwrap(), decoded).IsOk());
    REQUIRE(decoded == value);
}
TEST_CASE("ValueEncoder - Protobuf JSON", "[encoder][json]") {
    const ProtobufJsonEncoder encoder;
    SECTION("Uses proto field names") {
        UserPayload payload;
        payload.set_uid(42);
        auto encoded = encoder.Encode(payload);
        REQUIRE(encoded.IsOk());
        REQUIRE(encoded.Unwrap() == "{\"uid\":42}");
    }
    SECTION("Decodes into the caller's message") {
        UserPayload out;
        REQUIRE(encoder.Decode("{\"uid\":42,\"name\":\"ada\",\"roles\":[\"admin\"]}", out).IsOk());
        REQUIRE(out.uid() == 42);
        REQUIRE(out.name() == "ada");
        REQUIRE(out.roles_size() == 1);
        REQUIRE(out.roles(0) == "admin");
    }
    SECTION("Unknown fields are ignored") {
        UserPayloadV2 newer;
        newer.set_uid(7);
        newer.set_locale("uk-UA");
        UserPayload older;
        REQUIRE(encoder.Decode(encoder.Encode(newer).Unwrap(), older).IsOk());
        REQUIRE(older.uid() == 7);
    }
    SECTION("Empty and malformed payloads are decode errors") {
        UserPayload out;
        REQUIRE(encoder.Decode("", out).IsErrAnd(IsDecodeError));
        REQUIRE(encoder.Decode("{\"uid\":", out).IsErrAnd(IsDecodeError));
        REQUIRE(encoder.Decode("{\"uid\":\"not a number\"}", out).IsErrAnd(IsDecodeError));
        REQUIRE(encoder.Decode("[1,2,3]", out).IsErrAnd(IsDecodeError));
    }
    SECTION("Decode replaces previous contents") {
        UserPayload out;
        out.set_name("stale");
        REQUIRE(encoder.Decode("{\"uid\":1}", out).IsOk());
        REQUIRE(out.name().empty());
    }
}
TEST_CASE("ValueEncoder - Protobuf binary", "[encoder][binary]") {
    const ProtobufBinaryEncoder encoder;
    UserPayload payload;
    payload.set_uid(42);
    payload.set_name("ada");
    payload.add_roles("admin");
    payload.add_roles("audit");
    SECTION("Round trip") {
        UserPayload out;
        REQUIRE(encoder.Decode(encoder.Encode(payload).Unwrap(), out).IsOk());
        REQUIRE(out.uid() == 42);
        REQUIRE(out.name() == "ada");
        REQUIRE(out.roles_size() == 2);
    }
    SECTION("Message with every field at its default") {
        const UserPayload defaults;
        auto encoded = encoder.Encode(defaults);
        REQUIRE(encoded.IsOk());
        REQUIRE_FALSE(encoded.Unwrap().empty());
        UserPayload out;
        out.set_uid(9);
        REQUIRE(encoder.Decode(encoded.Unwrap(), out).IsOk());
        REQUIRE(out.uid() == 0);
        REQUIRE(out.name().empty());
        REQUIRE(out.roles_size() == 0);
    }
    SECTION("Unknown version byte is a decode error") {
        std::string bytes = encoder.Encode(payload).Unwrap();
        bytes[0] = '\x02';
        UserPayload out;
        REQUIRE(encoder.Decode(bytes, out).IsErrAnd(IsDecodeError));
        REQUIRE(encoder.Decode(bytes.substr(1), out).IsErrAnd(IsDecodeError));
    }
    SECTION("Deterministic output") {
        REQUIRE(encoder.Encode(payload).Unwrap() == encoder.Encode(payload).Unwrap());
    }
    SECTION("Empty and truncated payloads are decode errors") {
        UserPayload out;
        REQUIRE(encoder.Decode("", out).IsErrAnd(IsDecodeError));
        const auto bytes = encoder.Encode(payload).Unwrap();
        REQUIRE(encoder.Decode(std::string_view(bytes).substr(0, bytes.size() - 3), out).IsErrAnd(IsDecodeError));
    }
}
