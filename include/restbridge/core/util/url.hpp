/**
 * @file url.hpp
 * @brief URL component helpers for RestBridge.
 *
 * Provides percent-decoding of path and query values, query parameter lookup and the
 * small string helpers shared by the routing and CORS code.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace restbridge {

    /**
     * @brief Value of a single hexadecimal digit.
     * @return 0-15, or -1 if the character is not a hex digit
     */
    inline int hexValue(char c) noexcept
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    /**
     * @brief Decode %XX escapes. Malformed escapes are kept verbatim.
     *
     * @param in Encoded text
     * @param plusAsSpace Treat '+' as a space (query strings)
     * @return Decoded text
     */
    inline std::string percentDecode(std::string_view in, bool plusAsSpace = false)
    {
        std::string out;
        out.reserve(in.size());
        for (size_t i = 0; i < in.size(); ++i) {
            char c = in[i];
            if (c == '%' && i + 2 < in.size()) {
                int hi = hexValue(in[i + 1]);
                int lo = hexValue(in[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    out.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            if (c == '+' && plusAsSpace) {
                out.push_back(' ');
                continue;
            }
            out.push_back(c);
        }
        return out;
    }

    /**
     * @brief First value of a query parameter, percent-decoded.
     *
     * @param query Query string without the leading '?'
     * @param key Parameter name
     * @return The value (possibly empty), or std::nullopt if the key does not occur
     */
    inline std::optional<std::string> queryParam(std::string_view query, std::string_view key)
    {
        size_t pos = 0;
        while (pos <= query.size()) {
            size_t amp = query.find('&', pos);
            if (amp == std::string_view::npos) amp = query.size();
            std::string_view pair = query.substr(pos, amp - pos);
            size_t eq = pair.find('=');
            std::string name = percentDecode(pair.substr(0, eq), true);
            if (!pair.empty() && name == key) {
                if (eq == std::string_view::npos) return std::string{};
                return percentDecode(pair.substr(eq + 1), true);
            }
            pos = amp + 1;
        }
        return std::nullopt;
    }

    inline std::string toLower(std::string_view s)
    {
        std::string out{ s };
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    inline std::string toUpper(std::string_view s)
    {
        std::string out{ s };
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    inline std::string trim(std::string_view s)
    {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return std::string{ s.substr(b, e - b) };
    }

    /**
     * @brief Escape ECMAScript regex metacharacters so the text matches literally.
     */
    inline std::string regexEscape(std::string_view literal)
    {
        static constexpr std::string_view special = R"(\^$.|?*+()[]{})";
        std::string out;
        out.reserve(literal.size() * 2);
        for (char c : literal) {
            if (special.find(c) != std::string_view::npos) out.push_back('\\');
            out.push_back(c);
        }
        return out;
    }

    inline bool iequals(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    }

}
