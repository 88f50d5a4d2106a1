/**
 * @file uri_template.hpp
 * @brief URI template compilation and matching for RestBridge routing.
 *
 * A template has the form `path[?k1={v1}&k2={v2}...]`. Each `{name}` placeholder
 * becomes a named capture; hyphens in names are normalized to underscores.
 * Matching scans the literal text between placeholders, so its stack use does not
 * grow with the length of the request path or query.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace restbridge {

    /**
     * @class MatchResult
     * @brief Variables captured by a template match, in capture order.
     *
     * A name captured more than once (a repeated query key) yields a list of values.
     */
    class MatchResult {
    public:
        void add(std::string name, std::string value);
        /// Append all captures of another result.
        void merge(const MatchResult& other);

        /**
         * @brief Captured value(s) of a variable.
         * @return A JSON string for one capture, a JSON array of strings for several,
         *         or std::nullopt if the name was not captured
         */
        std::optional<nlohmann::json> get(std::string_view name) const;

        /// Number of captures of a name.
        std::size_t count(std::string_view name) const;

        bool empty() const { return entries_.empty(); }
        std::size_t size() const { return entries_.size(); }
        const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }

    private:
        std::vector<std::pair<std::string, std::string>> entries_;
    };

    /**
     * @class UriTemplateMatcher
     * @brief Compiled form of one URI template.
     *
     * Immutable after construction; safe to use from concurrent requests.
     */
    class UriTemplateMatcher {
    public:
        /**
         * @brief Compile a template.
         * @param uriTemplate Template text
         * @throws TemplateError on duplicate variables or malformed placeholders
         */
        explicit UriTemplateMatcher(std::string uriTemplate);

        /**
         * @brief Match a request path against the path part of the template.
         * @param path Raw request path
         * @return Percent-decoded captures, or std::nullopt if the path does not match
         */
        std::optional<MatchResult> matchPath(const std::string& path) const;

        /**
         * @brief Match a query string against the query clause of the template.
         *
         * Every declared key must occur at least once. A template without a query
         * clause matches any query string with an empty result.
         *
         * @param query Query string without the leading '?'
         * @return Percent-decoded captures, or std::nullopt if a declared key is missing
         */
        std::optional<MatchResult> matchQuery(const std::string& query) const;

        const std::string& uriTemplate() const { return template_; }
        /// All variable names, path variables first, in declaration order.
        const std::vector<std::string>& names() const { return names_; }
        bool hasName(std::string_view name) const;
        std::size_t variableCount() const { return names_.size(); }
        bool hasQueryClause() const { return !queryPatterns_.empty(); }

        /// Normalize a variable name ("user-id" → "user_id").
        static std::string makeName(std::string_view name);

    private:
        struct QueryPattern {
            std::string key;
            std::string name;
        };

        void addVariable(const std::string& name);
        void compilePath(const std::string& pathTemplate);
        void compileQuery(const std::string& queryTemplate);
        bool matchFrom(std::string_view path, std::size_t var, std::size_t pos,
                       std::vector<std::string_view>& captures) const;

        std::string               template_;
        std::vector<std::string>  pathLiterals_; ///< Literal text around the path variables
        std::vector<std::string>  pathNames_;    ///< Variable i sits between literals i and i+1
        std::vector<QueryPattern> queryPatterns_;
        std::vector<std::string>  names_;
    };

}
