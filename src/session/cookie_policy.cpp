#include "securecookie/session/cookie_policy.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace securecookie::session {

namespace {
    constexpr std::string_view kRootPath = "/";

    std::string_view StripPort(std::string_view host) {
        if (!host.empty() && host.front() == '[') {
            const auto close = host.find(']');
            return close == std::string_view::npos ? host : host.substr(1, close - 1);
        }
        if (std::count(host.begin(), host.end(), ':') == 1) {
            return host.substr(0, host.find(':'));
        }
        return host;
    }

    bool IsLocalhostName(std::string_view name) {
        if (!name.empty() && name.back() == '.') {
            name.remove_suffix(1);
        }
        constexpr std::string_view kLocalhost = "localhost";
        return name.size() == kLocalhost.size() &&
            std::equal(name.begin(), name.end(), kLocalhost.begin(), [](const char a, const char b) {
                return std::tolower(static_cast<unsigned char>(a)) == b;
            });
    }
}

bool HostCookiePolicy::IsLoopbackHost(std::string_view host) {
    const std::string bare(StripPort(host));
    if (IsLocalhostName(bare)) {
        return true;
    }
    in_addr v4{};
    if (inet_pton(AF_INET, bare.c_str(), &v4) == 1) {
        return (ntohl(v4.s_addr) >> 24) == 127;
    }
    in6_addr v6{};
    if (inet_pton(AF_INET6, bare.c_str(), &v6) == 1) {
        return IN6_IS_ADDR_LOOPBACK(&v6);
    }
    return false;
}

configuration::CookieOptions HostCookiePolicy::OptionsFor(const interfaces::IRequest& request) const {
    configuration::CookieOptions options;
    options.path = std::string(kRootPath);
    options.http_only = config_.http_only;
    options.same_site = config_.same_site;
    options.max_age = config_.max_age;
    if (IsLoopbackHost(request.Host())) {
        options.secure = false;
    } else {
        options.secure = true;
        options.domain = config_.trusted_domain;
    }
    return options;
}

}
