#pragma once
#include "securecookie/interfaces/i_request.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace securecookie::http {
class MemoryResponse;
/**
 * @brief In-memory request for tests, examples and embedding behind other servers.
 *
 * Header lookups are case-insensitive. Cookies are read from every `Cookie`
 * header in order.
 */
class MemoryRequest final : public interfaces::IRequest {
public:
    MemoryRequest() = default;
    explicit MemoryRequest(std::string host, std::string remote_address = {})
        : host_(std::move(host)), remote_address_(std::move(remote_address)) {}

    [[nodiscard]] std::optional<std::string> Cookie(std::string_view name) const override;
    [[nodiscard]] std::string Host() const override { return host_; }
    [[nodiscard]] std::optional<std::string> Header(std::string_view name) const override;
    [[nodiscard]] std::string RemoteAddress() const override { return remote_address_; }

    MemoryRequest& SetHost(std::string host);
    MemoryRequest& SetRemoteAddress(std::string remote_address);
    /// Replaces every header called @p name.
    MemoryRequest& SetHeader(std::string_view name, std::string value);
    MemoryRequest& AddHeader(std::string name, std::string value);
    /// Appends `name=value` as its own Cookie header.
    MemoryRequest& AddCookie(std::string_view name, std::string_view value);
    /**
     * @brief Carry the cookies a response set back as request cookies.
     *
     * Only the name=value pair of each Set-Cookie header is kept. Cookies the
     * response deleted (Max-Age=0) are skipped.
     */
    MemoryRequest& AddCookiesFrom(const MemoryResponse& response);

private:
    std::string host_;
    std::string remote_address_;
    std::vector<std::pair<std::string, std::string>> headers_;
};
}
