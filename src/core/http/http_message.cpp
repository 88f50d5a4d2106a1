#include "restbridge/core/http/http_message.hpp"
#include "restbridge/core/util/url.hpp"

namespace restbridge {

    namespace {
        std::optional<std::string> findHeader(const HeaderList& headers, std::string_view name) {
            for (const auto& [k, v] : headers) {
                if (iequals(k, name)) return v;
            }
            return std::nullopt;
        }
    }

    std::optional<std::string> HttpRequest::header(std::string_view name) const {
        return findHeader(headers, name);
    }

    std::optional<std::string> HttpResponse::header(std::string_view name) const {
        return findHeader(headers, name);
    }

    void appendHeader(HeaderList& headers, const std::string& name, const std::string& value) {
        for (auto& [k, v] : headers) {
            if (iequals(k, name)) {
                v += ", " + value;
                return;
            }
        }
        headers.emplace_back(name, value);
    }

}
