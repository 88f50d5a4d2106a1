#include "restbridge/core/dispatch/dispatcher.hpp"
#include "restbridge/core/util/error_types.hpp"
#include "restbridge/core/util/logger.hpp"
#include "restbridge/core/util/url.hpp"

namespace restbridge {

    Dispatcher::Dispatcher(const RouteTable& routes, const OriginPolicy& origins,
                           const std::set<std::string>& allowedHeaders)
        : routes_(routes), origins_(origins)
    {
        std::set<std::string> normalized;
        for (const auto& h : allowedHeaders) {
            auto n = toLower(trim(h));
            if (!n.empty()) normalized.insert(std::move(n));
        }
        for (const auto& h : normalized) {
            if (!allowHeaders_.empty()) allowHeaders_ += ", ";
            allowHeaders_ += h;
        }
    }

    namespace {
        std::string joinVerbs(const std::vector<std::string>& verbs) {
            std::string out;
            for (const auto& v : verbs) {
                if (v == "OPTIONS") continue;
                out += v;
                out += ", ";
            }
            out += "OPTIONS";
            return out;
        }
    }

    void Dispatcher::appendOriginHeaders(const HttpRequest& req, HeaderList& headers) const {
        if (!allowHeaders_.empty())
            appendHeader(headers, "Access-Control-Allow-Headers", allowHeaders_);

        if (auto origin = req.header("Origin")) {
            if (origins_.allows(*origin))
                appendHeader(headers, "Access-Control-Allow-Origin", *origin);
        }
    }

    DispatchContext Dispatcher::dispatch(const HttpRequest& req) const {
        DispatchContext ctx;
        appendHeader(ctx.corsHeaders, "Vary", "Origin");

        auto lookup = routes_.match(req.method, req.path, req.query);
        if (lookup.match) {
            ctx.routed = true;
            ctx.procedure = lookup.match->procedure;
            ctx.verb = lookup.match->verb;
            ctx.captures = std::move(lookup.match->captures);
            appendHeader(ctx.corsHeaders, "Access-Control-Allow-Methods",
                         joinVerbs(lookup.allowedVerbs));
            LOG_DEBUG("[Dispatcher] " + req.method + " " + req.path + " routed via " +
                      lookup.match->uriTemplate + " -> " + *ctx.procedure);
        }
        else {
            if (req.method != "POST" && req.method != "OPTIONS") {
                auto methods = lookup.allowedVerbs.empty() ? std::string("POST, OPTIONS")
                                                           : joinVerbs(lookup.allowedVerbs);
                HeaderList headers = ctx.corsHeaders;
                appendHeader(headers, "Allow", methods);
                appendHeader(headers, "Access-Control-Allow-Methods", methods);
                appendOriginHeaders(req, headers);
                LOG_DEBUG("[Dispatcher] " + req.method + " " + req.path + " not allowed (" +
                          methods + ")");
                throw DispatchError(BridgeErr::MethodNotAllowed, 405, {}, std::move(headers));
            }
            ctx.verb = req.method;
            ctx.procedure = queryParam(req.query, "method");
            appendHeader(ctx.corsHeaders, "Access-Control-Allow-Methods", "POST, OPTIONS");
            LOG_DEBUG("[Dispatcher] " + req.method + " " + req.path + " via fallback, method=" +
                      ctx.procedure.value_or("<none>"));
        }

        appendOriginHeaders(req, ctx.corsHeaders);
        return ctx;
    }

}
