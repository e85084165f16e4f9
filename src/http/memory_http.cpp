#include "securecookie/http/memory_request.hpp"
#include "securecookie/http/memory_response.hpp"
#include "securecookie/http/cookie.hpp"
#include "securecookie/core/constants.hpp"

#include <algorithm>
#include <cctype>

namespace securecookie::http {

namespace {
    bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
        return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
                return std::tolower(static_cast<unsigned char>(x)) ==
                       std::tolower(static_cast<unsigned char>(y));
            });
    }
}

void MemoryResponse::AddHeader(std::string_view name, std::string_view value) {
    headers_.emplace_back(std::string(name), std::string(value));
}

std::vector<std::string> MemoryResponse::Values(std::string_view name) const {
    std::vector<std::string> values;
    for (const auto& [header_name, value] : headers_) {
        if (EqualsIgnoreCase(header_name, name)) {
            values.push_back(value);
        }
    }
    return values;
}

std::vector<std::string> MemoryResponse::SetCookieHeaders() const {
    return Values(kSetCookieHeader);
}

std::optional<std::string> MemoryRequest::Cookie(std::string_view name) const {
    for (const auto& [header_name, value] : headers_) {
        if (!EqualsIgnoreCase(header_name, kCookieHeader)) {
            continue;
        }
        for (auto& [cookie_name, cookie_value] : ParseCookieHeader(value)) {
            if (cookie_name == name) {
                return std::move(cookie_value);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> MemoryRequest::Header(std::string_view name) const {
    for (const auto& [header_name, value] : headers_) {
        if (EqualsIgnoreCase(header_name, name)) {
            return value;
        }
    }
    return std::nullopt;
}

MemoryRequest& MemoryRequest::SetHost(std::string host) {
    host_ = std::move(host);
    return *this;
}

MemoryRequest& MemoryRequest::SetRemoteAddress(std::string remote_address) {
    remote_address_ = std::move(remote_address);
    return *this;
}

MemoryRequest& MemoryRequest::SetHeader(std::string_view name, std::string value) {
    std::erase_if(headers_, [name](const auto& header) {
        return EqualsIgnoreCase(header.first, name);
    });
    headers_.emplace_back(std::string(name), std::move(value));
    return *this;
}

MemoryRequest& MemoryRequest::AddHeader(std::string name, std::string value) {
    headers_.emplace_back(std::move(name), std::move(value));
    return *this;
}

MemoryRequest& MemoryRequest::AddCookie(std::string_view name, std::string_view value) {
    std::string pair(name);
    pair += '=';
    pair += value;
    headers_.emplace_back(std::string(kCookieHeader), std::move(pair));
    return *this;
}

MemoryRequest& MemoryRequest::AddCookiesFrom(const MemoryResponse& response) {
    for (const auto& header : response.SetCookieHeaders()) {
        if (header.find("; Max-Age=0") != std::string::npos) {
            continue;
        }
        const auto end = header.find(';');
        headers_.emplace_back(std::string(kCookieHeader), header.substr(0, end));
    }
    return *this;
}

}
