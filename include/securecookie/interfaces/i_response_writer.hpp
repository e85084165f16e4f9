#pragma once
#include <string>
#include <string_view>
namespace securecookie::interfaces {
class IResponseWriter {
public:
    virtual ~IResponseWriter() = default;
    /// Appends a header line. Repeated names are kept, in order.
    virtual void AddHeader(std::string_view name, std::string_view value) = 0;
};
}
