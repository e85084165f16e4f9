#include "securecookie/http/cookie.hpp"
#include "securecookie/core/constants.hpp"

#include <fmt/core.h>

#include <cctype>
#include <ctime>

namespace securecookie::http {

namespace {
    bool IsSeparator(const char c) noexcept {
        switch (c) {
            case '(': case ')': case '<': case '>': case '@':
            case ',': case ';': case ':': case '\\': case '"':
            case '/': case '[': case ']': case '?': case '=':
            case '{': case '}': case ' ': case '\t':
                return true;
            default:
                return false;
        }
    }

    bool IsCookieOctet(const char c) noexcept {
        const auto b = static_cast<unsigned char>(c);
        return b >= 0x20 && b < 0x7f && c != '"' && c != ';' && c != '\\';
    }

    std::string_view TrimSpaces(std::string_view text) noexcept {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
            text.remove_prefix(1);
        }
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
            text.remove_suffix(1);
        }
        return text;
    }

    std::string_view SameSiteName(const SameSite same_site) noexcept {
        switch (same_site) {
            case SameSite::Lax: return "Lax";
            case SameSite::Strict: return "Strict";
            case SameSite::None: return "None";
            default: return {};
        }
    }
}

bool IsValidCookieName(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    for (const char c : name) {
        const auto b = static_cast<unsigned char>(c);
        if (b <= 0x20 || b >= 0x7f || IsSeparator(c)) {
            return false;
        }
    }
    return true;
}

bool IsValidCookiePath(std::string_view path) noexcept {
    for (const char c : path) {
        const auto b = static_cast<unsigned char>(c);
        if (b < 0x20 || b >= 0x7f || c == ';') {
            return false;
        }
    }
    return true;
}

bool IsValidCookieDomain(std::string_view domain) noexcept {
    if (!domain.empty() && domain.front() == '.') {
        domain.remove_prefix(1);
    }
    if (domain.empty() || domain.size() > kMaxCookieDomainChars) {
        return false;
    }
    size_t label_length = 0;
    char previous = '.';
    for (const char c : domain) {
        if (c == '.') {
            if (label_length == 0 || previous == '-') {
                return false;
            }
            label_length = 0;
        } else if (std::isalnum(static_cast<unsigned char>(c)) || c == '-') {
            if (c == '-' && label_length == 0) {
                return false;
            }
            if (++label_length > kMaxDomainLabelChars) {
                return false;
            }
        } else {
            return false;
        }
        previous = c;
    }
    return previous != '.' && previous != '-';
}

Result<Unit, CookieFailure> CheckCookieAttributes(const Cookie& cookie) {
    if (!IsValidCookieName(cookie.name)) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config(fmt::format("Invalid cookie name '{}'", cookie.name)));
    }
    if (!IsValidCookiePath(cookie.path)) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config(fmt::format("Invalid Path attribute for cookie '{}'", cookie.name)));
    }
    if (!cookie.domain.empty() && !IsValidCookieDomain(cookie.domain)) {
        return Result<Unit, CookieFailure>::Err(
            CookieFailure::Config(fmt::format("Invalid Domain attribute for cookie '{}'", cookie.name)));
    }
    return Result<Unit, CookieFailure>::Ok(unit);
}

bool IsValidCookieValue(std::string_view value) noexcept {
    for (const char c : value) {
        if (!IsCookieOctet(c)) {
            return false;
        }
    }
    return true;
}

std::string FormatHttpDate(const std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[64];
    const size_t written = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &utc);
    return {buffer, written};
}

Cookie Cookie::FromOptions(std::string name, std::string value, const CookieOptions& options) {
    Cookie cookie;
    cookie.name = std::move(name);
    cookie.value = std::move(value);
    cookie.path = options.path;
    cookie.domain = options.domain;
    cookie.expires = options.expires;
    cookie.max_age = options.max_age.count();
    cookie.secure = options.secure;
    cookie.http_only = options.http_only;
    cookie.same_site = options.same_site;
    cookie.partitioned = options.partitioned;
    return cookie;
}

std::string Cookie::ToSetCookieHeader() const {
    if (CheckCookieAttributes(*this).IsErr()) {
        return {};
    }
    std::string header = name;
    header += '=';
    if (value.find_first_of(" ,") != std::string::npos) {
        header += '"';
        header += value;
        header += '"';
    } else {
        header += value;
    }
    if (!path.empty()) {
        header += "; Path=";
        header += path;
    }
    if (!domain.empty()) {
        std::string_view bare = domain;
        if (bare.front() == '.') {
            bare.remove_prefix(1);
        }
        if (!bare.empty()) {
            header += "; Domain=";
            header += bare;
        }
    }
    if (expires.has_value()) {
        header += "; Expires=";
        header += FormatHttpDate(*expires);
    }
    if (max_age > 0) {
        header += fmt::format("; Max-Age={}", max_age);
    } else if (max_age < 0) {
        header += "; Max-Age=0";
    }
    if (http_only) {
        header += "; HttpOnly";
    }
    if (secure) {
        header += "; Secure";
    }
    if (const auto site = SameSiteName(same_site); !site.empty()) {
        header += "; SameSite=";
        header += site;
    }
    if (partitioned) {
        header += "; Partitioned";
    }
    return header;
}

void SetCookie(interfaces::IResponseWriter& writer, const Cookie& cookie) {
    const std::string header = cookie.ToSetCookieHeader();
    if (!header.empty()) {
        writer.AddHeader(kSetCookieHeader, header);
    }
}

std::vector<std::pair<std::string, std::string>> ParseCookieHeader(std::string_view header) {
    std::vector<std::pair<std::string, std::string>> cookies;
    while (!header.empty()) {
        std::string_view part;
        if (const auto semi = header.find(';'); semi == std::string_view::npos) {
            part = header;
            header = {};
        } else {
            part = header.substr(0, semi);
            header.remove_prefix(semi + 1);
        }
        part = TrimSpaces(part);
        const auto eq = part.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const std::string_view name = part.substr(0, eq);
        std::string_view value = part.substr(eq + 1);
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (!IsValidCookieName(name) || !IsValidCookieValue(value)) {
            continue;
        }
        cookies.emplace_back(std::string(name), std::string(value));
    }
    return cookies;
}

}
