#include "restbridge/core/rpc/argument_binder.hpp"
#include "restbridge/core/dispatch/dispatcher.hpp"
#include "restbridge/core/routing/uri_template.hpp"
#include "restbridge/core/service/service_descriptor.hpp"
#include "restbridge/core/util/error_types.hpp"
#include "restbridge/core/util/logger.hpp"

namespace restbridge {

    void Arguments::set(const std::string& name, Value value) {
        values_.insert_or_assign(name, std::move(value));
    }

    bool Arguments::has(std::string_view name) const {
        return values_.find(std::string(name)) != values_.end();
    }

    const Value& Arguments::raw(std::string_view name) const {
        auto it = values_.find(std::string(name));
        if (it == values_.end())
            throw std::out_of_range("no argument named '" + std::string(name) + "'");
        return it->second;
    }

    nlohmann::json ArgumentBinder::parseBody(const std::string& body) {
        if (body.empty()) return nlohmann::json::object();

        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(body);
        }
        catch (const nlohmann::json::parse_error& e) {
            throw DispatchError(BridgeErr::InvalidJsonBody, 400,
                                "Invalid JSON payload: '" + std::string(e.what()) + "'.");
        }
        if (!parsed.is_object())
            throw DispatchError(BridgeErr::InvalidJsonBody, 400,
                                "Invalid JSON payload: 'expected an object, got " +
                                std::string(parsed.type_name()) + "'.");
        return parsed;
    }

    nlohmann::json ArgumentBinder::mergePayload(const ProcedureDescriptor& procedure,
                                                const DispatchContext& ctx,
                                                const HttpRequest& req) const {
        auto payload = nlohmann::json::object();

        // capture stage
        if (ctx.routed) {
            for (const auto& p : procedure.parameters) {
                auto captured = ctx.captures.get(UriTemplateMatcher::makeName(p.wireName));
                if (!captured) continue;
                if (p.type->isSequence() && !captured->is_array())
                    payload[p.wireName] = nlohmann::json::array({ *captured });
                else
                    payload[p.wireName] = std::move(*captured);
            }
        }

        // body stage
        if (!ctx.routed || (ctx.verb != "GET" && ctx.verb != "DELETE")) {
            auto body = parseBody(req.body);
            for (auto it = body.begin(); it != body.end(); ++it)
                payload[it.key()] = std::move(*it);
        }
        return payload;
    }

    Arguments ArgumentBinder::bind(const ProcedureDescriptor& procedure,
                                   const nlohmann::json& payload) const {
        Arguments args;
        static const nlohmann::json absent;

        for (const auto& p : procedure.parameters) {
            auto it = payload.find(p.wireName);
            if (it == payload.end() && !p.type->isNullable()) {
                throw DispatchError(BridgeErr::RequiredArgumentMissing, 400,
                                    "A argument named '" + p.wireName +
                                    "' is missing, it is required.");
            }
            const nlohmann::json& raw = it == payload.end() ? absent : *it;

            auto invalid = [&] {
                return DispatchError(BridgeErr::InvalidArgumentValue, 400,
                                     "Incorrect type '" + std::string(raw.type_name()) +
                                     "' for '" + p.wireName + "'. expected '" +
                                     p.type->name() + "'.");
            };

            // a repeated query key cannot bind to a scalar
            if (raw.is_array() && !p.type->isSequence())
                throw invalid();

            try {
                args.set(p.name, codec_.decode(*p.type, raw));
            }
            catch (const CodecError& e) {
                LOG_DEBUG("[ArgumentBinder] " + procedure.wireName + "(" + p.wireName + "): " + e.what());
                throw invalid();
            }
        }
        return args;
    }

}
