#include "restbridge/core/routing/route_table.hpp"
#include "restbridge/core/service/service_descriptor.hpp"
#include "restbridge/core/util/error_types.hpp"
#include "restbridge/core/util/logger.hpp"
#include "restbridge/core/util/url.hpp"
#include <algorithm>

namespace restbridge {

    namespace {

        bool isRootPath(std::string_view path) {
            auto q = path.find('?');
            auto p = path.substr(0, q);
            return p.find_first_not_of('/') == std::string_view::npos;
        }

        void checkCoverage(const ProcedureDescriptor& proc, const UriTemplateMatcher& matcher) {
            std::vector<std::string> unsatisfied;
            for (const auto& param : proc.parameters) {
                if (param.type->isOptional()) continue;
                if (!matcher.hasName(UriTemplateMatcher::makeName(param.wireName)))
                    unsatisfied.push_back(param.wireName);
            }
            if (unsatisfied.empty()) return;
            std::sort(unsatisfied.begin(), unsatisfied.end());
            std::string list;
            for (const auto& n : unsatisfied) {
                if (!list.empty()) list += ", ";
                list += n;
            }
            throw TemplateError("\"" + matcher.uriTemplate() + "\" does not fully satisfy all parameters of " +
                                proc.wireName + "() method; unsatisfied parameters are: " + list);
        }

    }

    RouteTable::RouteTable(const ServiceDescriptor& service) {
        for (const auto& proc : service.procedures()) {
            if (!proc.http) continue;
            const auto& res = *proc.http;
            if (res.path.empty())
                throw TemplateError("missing annotation parameter: path (" + proc.wireName + ")");
            if (res.verb.empty())
                throw TemplateError("missing annotation parameter: method (" + proc.wireName + ")");
            if (isRootPath(res.path))
                throw TemplateError("the root resource is reserved; disallowed to route to the root");

            auto matcher = std::make_shared<const UriTemplateMatcher>(res.path);
            checkCoverage(proc, *matcher);
            rules_.push_back(Rule{ res.path, std::move(matcher), toUpper(res.verb), proc.wireName });
        }
        std::sort(rules_.begin(), rules_.end(), &RouteTable::precedes);

        for (const auto& r : rules_)
            LOG_DEBUG("[RouteTable] " + r.verb + " " + r.uriTemplate + " -> " + r.procedure);
    }

    bool RouteTable::precedes(const Rule& a, const Rule& b) {
        auto na = a.matcher->variableCount();
        auto nb = b.matcher->variableCount();
        if (na != nb) return na > nb;
        if (a.uriTemplate != b.uriTemplate) return a.uriTemplate > b.uriTemplate;
        return a.verb < b.verb;
    }

    RouteLookup RouteTable::match(std::string_view method, const std::string& path, const std::string& query) const {
        RouteLookup out;
        if (path == "/") return out;

        for (const auto& rule : rules_) {
            auto captures = rule.matcher->matchPath(path);
            if (!captures) continue;
            if (rule.matcher->hasQueryClause()) {
                auto q = rule.matcher->matchQuery(query);
                if (!q) continue;
                captures->merge(*q);
            }

            if (std::find(out.allowedVerbs.begin(), out.allowedVerbs.end(), rule.verb) == out.allowedVerbs.end())
                out.allowedVerbs.push_back(rule.verb);

            if (!out.match && (rule.verb == method || method == "OPTIONS"))
                out.match = RouteMatch{ std::move(*captures), rule.verb, rule.procedure, rule.uriTemplate };
        }
        return out;
    }

}
