/**
 * @file dispatcher.hpp
 * @brief Dispatch coordinator: route or fall back, and build the CORS headers.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "restbridge/core/types.hpp"
#include "restbridge/core/http/http_message.hpp"
#include "restbridge/core/routing/route_table.hpp"
#include "restbridge/core/dispatch/origin_policy.hpp"

namespace restbridge {

    /**
     * @struct DispatchContext
     * @brief Per-request dispatch state. Never shared between requests.
     */
    struct DispatchContext {
        std::optional<std::string> procedure;   ///< Resolved procedure wire name
        bool                       routed = false; ///< A path rule matched
        std::string                verb;        ///< Verb of the matched rule, or the request method
        MatchResult                captures;    ///< Path + query captures of the matched rule
        nlohmann::json             payload;     ///< Merged raw arguments, filled by ArgumentBinder
        HeaderList                 corsHeaders; ///< Ordered CORS headers
    };

    /**
     * @class Dispatcher
     * @brief Resolves the target procedure of a request and its CORS headers.
     *
     * Path-routed requests use the RouteTable. Otherwise POST and OPTIONS fall back to the
     * single-endpoint protocol that names the procedure in the `method` query parameter.
     */
    class Dispatcher {
    public:
        /**
         * @param routes Route table (must outlive the dispatcher)
         * @param origins Origin policy (must outlive the dispatcher)
         * @param allowedHeaders Header names for Access-Control-Allow-Headers; trimmed and lower-cased
         */
        Dispatcher(const RouteTable& routes, const OriginPolicy& origins,
                   const std::set<std::string>& allowedHeaders);

        /**
         * @brief Resolve a request.
         * @param req Incoming request
         * @return Context with procedure (possibly none for a fallback without `method`) and CORS headers
         * @throws DispatchError (MethodNotAllowed, 405) if nothing routes and the method cannot
         *         fall back; the error carries Allow and the CORS headers
         */
        DispatchContext dispatch(const HttpRequest& req) const;

        /// Pre-joined Access-Control-Allow-Headers value; empty if none configured.
        const std::string& allowHeadersValue() const { return allowHeaders_; }

    private:
        void appendOriginHeaders(const HttpRequest& req, HeaderList& headers) const;

        const RouteTable&   routes_;
        const OriginPolicy& origins_;
        std::string         allowHeaders_;
    };

}
