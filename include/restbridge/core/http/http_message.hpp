/**
 * @file http_message.hpp
 * @brief Transport-neutral HTTP request and response structures.
 *
 * Transports translate their native request objects into HttpRequest and write the
 * HttpResponse triple (status, headers, body) back to the client.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "restbridge/core/types.hpp"

namespace restbridge {

    /**
     * @struct HttpRequest
     * @brief Incoming request as seen by the dispatch core.
     */
    struct HttpRequest {
        std::string method;  ///< Upper-case verb ("GET", "POST", ...)
        std::string path;    ///< Path without query string, not percent-decoded
        std::string query;   ///< Query string without the leading '?'
        HeaderList  headers; ///< Request headers in arrival order
        std::string body;    ///< Raw body bytes

        /**
         * @brief Case-insensitive header lookup.
         * @param name Header name
         * @return The first value, or std::nullopt if the header is absent
         */
        std::optional<std::string> header(std::string_view name) const;
    };

    /**
     * @struct HttpResponse
     * @brief Outgoing (status, headers, body) triple.
     */
    struct HttpResponse {
        int         status = 200;
        HeaderList  headers;
        std::string body;

        std::optional<std::string> header(std::string_view name) const;
    };

    /**
     * @brief Add a header, joining with ", " if a header of the same name is present.
     *
     * Name comparison is case-insensitive; the first spelling is kept.
     */
    void appendHeader(HeaderList& headers, const std::string& name, const std::string& value);

}
