/**
 * @file route_table.hpp
 * @brief Ordered set of routing rules compiled from a ServiceDescriptor.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "restbridge/core/routing/uri_template.hpp"

namespace restbridge {

    class ServiceDescriptor;

    /**
     * @struct Rule
     * @brief One compiled (template, verb) → procedure binding.
     */
    struct Rule {
        std::string                               uriTemplate;
        std::shared_ptr<const UriTemplateMatcher> matcher;
        std::string                               verb;      ///< Upper-case
        std::string                               procedure; ///< Target procedure wire name
    };

    /**
     * @struct RouteMatch
     * @brief The selected rule of a lookup and its path + query captures.
     */
    struct RouteMatch {
        MatchResult captures;
        std::string verb;
        std::string procedure;
        std::string uriTemplate;
    };

    /**
     * @struct RouteLookup
     * @brief Result of RouteTable::match.
     */
    struct RouteLookup {
        std::optional<RouteMatch> match;        ///< Selected rule, if any
        std::vector<std::string>  allowedVerbs; ///< Verbs of every candidate rule, first-seen order
    };

    /**
     * @class RouteTable
     * @brief Deterministically ordered rules; read-only after construction.
     *
     * Order: more variables first, then reverse lexicographic template text, then verb.
     */
    class RouteTable {
    public:
        /**
         * @brief Compile the HTTP annotations of every procedure.
         * @param service Service descriptor
         * @throws TemplateError for a root path, a missing path or verb, a malformed
         *         template, or a template not covering all non-optional parameters
         */
        explicit RouteTable(const ServiceDescriptor& service);

        /**
         * @brief Find the rule for a request.
         *
         * The root path never matches. Every candidate (path and query both matching)
         * contributes its verb to allowedVerbs; the first candidate whose verb equals the
         * request method, or the first candidate at all for OPTIONS, is selected.
         *
         * @param method Upper-case request method
         * @param path Raw request path
         * @param query Query string without '?'
         */
        RouteLookup match(std::string_view method, const std::string& path, const std::string& query) const;

        const std::vector<Rule>& rules() const { return rules_; }
        bool empty() const { return rules_.empty(); }

        /// Strict ordering predicate used to sort the rules.
        static bool precedes(const Rule& a, const Rule& b);

    private:
        std::vector<Rule> rules_;
    };

}
