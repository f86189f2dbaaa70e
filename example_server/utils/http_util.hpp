/**
 * @file http_util.hpp
 * @brief Cookie, CSRF and command line helpers for the example server.
 */
#pragma once
#include <openssl/crypto.h>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace siweauth::example {

    /**
     * @brief Value of cookie `name` in a Cookie header, if present.
     */
    inline std::optional<std::string> cookieValue(std::string_view header, std::string_view name) {
        while (!header.empty()) {
            auto semi = header.find(';');
            auto part = header.substr(0, semi);
            while (!part.empty() && part.front() == ' ') part.remove_prefix(1);
            if (part.size() > name.size() && part.starts_with(name) && part[name.size()] == '=')
                return std::string(part.substr(name.size() + 1));
            if (semi == std::string_view::npos) break;
            header.remove_prefix(semi + 1);
        }
        return std::nullopt;
    }

    /// Constant-time comparison of the CSRF cookie and header.
    inline bool tokensEqual(std::string_view a, std::string_view b) {
        return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    /**
     * @brief Double-submit check: the cookie must be present, non-empty and equal to the header.
     */
    inline bool csrfMatches(const std::optional<std::string>& cookie, std::string_view header) {
        return cookie && !cookie->empty() && tokensEqual(*cookie, header);
    }

    /**
     * @brief Parse a TCP port argument.
     * @return The port, or nullopt unless the whole string is a number in 1..65535
     */
    inline std::optional<int> parsePort(std::string_view s) {
        int port = 0;
        auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
        if (ec != std::errc{} || end != s.data() + s.size() || port <= 0 || port > 65535)
            return std::nullopt;
        return port;
    }

}
