/**
 * @file http_status.hpp
 * @brief HTTP status reason phrases and error-envelope tags.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <string>
#include <string_view>

namespace restbridge {

    /**
     * @brief Standard reason phrase for an HTTP status code.
     * @param status HTTP status code
     * @return Reason phrase, or "HTTP Error" for codes without a registered phrase
     */
    std::string_view reasonPhrase(int status) noexcept;

    /**
     * @brief Lower-snake-case form of the reason phrase (404 → "not_found").
     * @param status HTTP status code
     * @return Tag used in the `_tag` field of error envelopes
     */
    std::string statusTag(int status);

    /**
     * @brief Status line suffix written by transports ("404 Not Found").
     */
    std::string statusLine(int status);

}
