#include "securecookie/cookies/value_encoder.hpp"
#include "securecookie/core/constants.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <fmt/core.h>

namespace securecookie::cookies {

Result<std::string, CookieFailure> NullEncoder::Encode(const std::string& value) const {
    return Result<std::string, CookieFailure>::Ok(value);
}

Result<Unit, CookieFailure> NullEncoder::Decode(std::string_view payload, std::string& value) const {
    value.assign(payload.begin(), payload.end());
    return Result<Unit, CookieFailure>::Ok(unit);
}

Result<std::string, CookieFailure> ProtobufJsonEncoder::Encode(
    const google::protobuf::Message& value) const {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    std::string json;
    if (const auto status = google::protobuf::util::MessageToJsonString(value, &json, options);
        !status.ok()) {
        return Result<std::string, CookieFailure>::Err(
            CookieFailure::Encode(fmt::format("JSON encoding of {} failed: {}",
                value.GetTypeName(), status.ToString())));
    }
    return Result<std::string, CookieFailure>::Ok(std::move(json));
}

Result<Unit, CookieFailure> ProtobufJsonEncoder::Decode(
    std::string_view payload,
    google::protobuf::Message& value) const {
    if (payload.empty()) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Decode("Empty JSON payload"));
    }
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    value.Clear();
    if (const auto status = google::protobuf::util::JsonStringToMessage(
            std::string(payload), &value, options);
        !status.ok()) {
        value.Clear();
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Decode(fmt::format("JSON decoding into {} failed: {}",
                value.GetTypeName(), status.ToString())));
    }
    return Result<Unit, CookieFailure>::Ok(unit);
}

Result<std::string, CookieFailure> ProtobufBinaryEncoder::Encode(
    const google::protobuf::Message& value) const {
    std::string bytes(1, kBinaryPayloadVersion);
    {
        google::protobuf::io::StringOutputStream stream(&bytes);
        google::protobuf::io::CodedOutputStream coded(&stream);
        coded.SetSerializationDeterministic(true);
        if (!value.SerializeToCodedStream(&coded) || coded.HadError()) {
            return Result<std::string, CookieFailure>::Err(
                CookieFailure::Encode(fmt::format("Binary encoding of {} failed",
                    value.GetTypeName())));
        }
    }
    return Result<std::string, CookieFailure>::Ok(std::move(bytes));
}

Result<Unit, CookieFailure> ProtobufBinaryEncoder::Decode(
    std::string_view payload,
    google::protobuf::Message& value) const {
    if (payload.empty()) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Decode("Empty binary payload"));
    }
    if (payload.front() != kBinaryPayloadVersion) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Decode(fmt::format("Unknown binary payload version {:#04x}",
                static_cast<unsigned char>(payload.front()))));
    }
    payload.remove_prefix(1);
    if (!value.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
        value.Clear();
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Decode(fmt::format("Binary decoding into {} failed",
                value.GetTypeName())));
    }
    return Result<Unit, CookieFailure>::Ok(unit);
}

}
