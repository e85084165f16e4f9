#pragma once
#include <optional>
#include <string>
#include <string_view>
namespace securecookie::interfaces {
class IRequest {
public:
    virtual ~IRequest() = default;
    /// Value of the first cookie called @p name, empty-valued cookies included.
    [[nodiscard]] virtual std::optional<std::string> Cookie(std::string_view name) const = 0;
    /// Host as sent by the client, port included when present.
    [[nodiscard]] virtual std::string Host() const = 0;
    [[nodiscard]] virtual std::optional<std::string> Header(std::string_view name) const = 0;
    [[nodiscard]] virtual std::string RemoteAddress() const = 0;
};
}
