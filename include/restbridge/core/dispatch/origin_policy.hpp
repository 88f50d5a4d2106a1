/**
 * @file origin_policy.hpp
 * @brief Cross-origin allow-list for RestBridge.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <ankerl/unordered_dense.h>

namespace restbridge {

    /**
     * @class OriginPolicy
     * @brief Decides whether an Origin header value may access the service.
     *
     * Configured entries are trimmed and lower-cased. An entry without '*' is a literal
     * host name; in an entry with '*', each '*' stands for exactly one non-dot label
     * ("*.example.com" matches "api.example.com" but neither "a.b.example.com" nor
     * "example.com"). All matchers are compiled once here.
     */
    class OriginPolicy {
    public:
        OriginPolicy() = default;
        explicit OriginPolicy(const std::set<std::string>& allowedOrigins);

        /**
         * @brief Check an Origin header value.
         * @param origin Value such as "https://api.example.com:8443"
         * @return True if the scheme is http/https and the host is allow-listed
         */
        bool allows(std::string_view origin) const;

        /**
         * @brief Extract the lower-cased host name of an http(s) origin.
         * @return Host name, or an empty string if the origin is not http(s), has no host,
         *         or the host is longer than 253 characters
         */
        static std::string hostOf(std::string_view origin);

        bool empty() const { return literals_.empty() && patterns_.empty(); }

    private:
        ankerl::unordered_dense::set<std::string> literals_;
        std::vector<std::regex>                   patterns_;
    };

}
