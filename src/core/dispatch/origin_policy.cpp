#include "restbridge/core/dispatch/origin_policy.hpp"
#include "restbridge/core/util/url.hpp"

namespace restbridge {

    OriginPolicy::OriginPolicy(const std::set<std::string>& allowedOrigins) {
        for (const auto& entry : allowedOrigins) {
            auto d = toLower(trim(entry));
            if (d.empty()) continue;
            if (d.find('*') == std::string::npos) {
                literals_.insert(d);
                continue;
            }
            std::string pattern;
            std::size_t pos = 0;
            for (;;) {
                auto star = d.find('*', pos);
                pattern += regexEscape(std::string_view(d).substr(pos, star - pos));
                if (star == std::string::npos) break;
                pattern += "[^.]+";
                pos = star + 1;
            }
            patterns_.emplace_back(pattern);
        }
    }

    std::string OriginPolicy::hostOf(std::string_view origin) {
        auto sep = origin.find("://");
        if (sep == std::string_view::npos) return {};
        auto scheme = toLower(origin.substr(0, sep));
        if (scheme != "http" && scheme != "https") return {};

        auto authority = origin.substr(sep + 3);
        authority = authority.substr(0, authority.find_first_of("/?#"));
        if (auto at = authority.rfind('@'); at != std::string_view::npos)
            authority = authority.substr(at + 1);

        std::string_view host;
        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string_view::npos) return {};
            host = authority.substr(1, close - 1);
        }
        else {
            host = authority.substr(0, authority.find(':'));
        }
        // longer than any DNS name; also bounds the wildcard regex input
        if (host.size() > 253) return {};
        return toLower(host);
    }

    bool OriginPolicy::allows(std::string_view origin) const {
        auto host = hostOf(origin);
        if (host.empty()) return false;
        if (literals_.count(host)) return true;
        for (const auto& re : patterns_) {
            if (std::regex_match(host, re)) return true;
        }
        return false;
    }

}
