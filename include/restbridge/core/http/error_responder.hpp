/**
 * @file error_responder.hpp
 * @brief Canonical JSON error envelope and HTTP response helpers.
 *
 * Envelope shape: `{"_type": "error", "_tag": "<lower_snake reason>", "message": <string|null>}`.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "restbridge/core/http/http_message.hpp"
#include "restbridge/core/util/error_types.hpp"

namespace restbridge {

    /**
     * @class ErrorResponder
     * @brief Maps failures to an HTTP status and the canonical error envelope.
     */
    class ErrorResponder {
    public:
        /**
         * @brief Build an error response.
         *
         * 404 and 405 use fixed messages; 400 uses the caller's message; any other status
         * uses the caller's message or, without one, the reason phrase.
         *
         * @param status HTTP status code
         * @param message Caller-supplied message
         */
        static HttpResponse error(int status, const std::optional<std::string>& message = std::nullopt);

        /// Error response for a dispatch failure, including its extra headers.
        static HttpResponse error(const ErrorObj& err);

        /// JSON response with Content-Type set.
        static HttpResponse jsonResponse(int status, const nlohmann::json& body);

        static nlohmann::json makeEnvelope(const std::string& tag, const std::optional<std::string>& message);

        /// Message that goes into the envelope for a status.
        static std::optional<std::string> messageFor(int status, const std::optional<std::string>& message);
    };

}
