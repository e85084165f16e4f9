#pragma once
#include "securecookie/interfaces/i_response_writer.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace securecookie::http {
/// Response writer that records headers in memory, in emission order.
class MemoryResponse final : public interfaces::IResponseWriter {
public:
    void AddHeader(std::string_view name, std::string_view value) override;
    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& Headers() const noexcept {
        return headers_;
    }
    /// All values for @p name, compared case-insensitively.
    [[nodiscard]] std::vector<std::string> Values(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> SetCookieHeaders() const;
    [[nodiscard]] bool Empty() const noexcept { return headers_.empty(); }
    void Clear() noexcept { headers_.clear(); }
private:
    std::vector<std::pair<std::string, std::string>> headers_;
};
}
