#pragma once

#include "securecookie/core/result.hpp"
#include "securecookie/core/failures.hpp"

#include <string>
#include <string_view>

namespace google::protobuf {
class Message;
}

namespace securecookie::cookies {

/**
 * @brief Converts an application value to and from the cookie payload string.
 *
 * Decode writes into a caller-owned value so that the concrete type (for
 * protobuf, the generated message class) stays with the caller.
 */
template<typename TValue>
class IValueEncoder {
public:
    using value_type = TValue;

    virtual ~IValueEncoder() = default;

    [[nodiscard]] virtual Result<std::string, CookieFailure> Encode(const TValue& value) const = 0;

    /// DecodeError for an empty or malformed payload.
    [[nodiscard]] virtual Result<Unit, CookieFailure> Decode(
        std::string_view payload,
        TValue& value) const = 0;
};

/// Identity encoder for values that already are strings.
class NullEncoder final : public IValueEncoder<std::string> {
public:
    [[nodiscard]] Result<std::string, CookieFailure> Encode(const std::string& value) const override;
    [[nodiscard]] Result<Unit, CookieFailure> Decode(
        std::string_view payload,
        std::string& value) const override;
};

/**
 * @brief Protobuf JSON mapping. The structured default.
 *
 * Field names use the proto names (`uid`, not `Uid`). Unknown fields are
 * ignored on decode so older cookies survive added fields.
 */
class ProtobufJsonEncoder final : public IValueEncoder<google::protobuf::Message> {
public:
    [[nodiscard]] Result<std::string, CookieFailure> Encode(
        const google::protobuf::Message& value) const override;
    [[nodiscard]] Result<Unit, CookieFailure> Decode(
        std::string_view payload,
        google::protobuf::Message& value) const override;
};

/**
 * @brief Protobuf wire format with deterministic serialization.
 *
 * The payload is one version byte followed by the message, so a message with
 * every field at its default still encodes to a non-empty payload.
 */
class ProtobufBinaryEncoder final : public IValueEncoder<google::protobuf::Message> {
public:
    [[nodiscard]] Result<std::string, CookieFailure> Encode(
        const google::protobuf::Message& value) const override;
    [[nodiscard]] Result<Unit, CookieFailure> Decode(
        std::string_view payload,
        google::protobuf::Message& value) const override;
};

}
