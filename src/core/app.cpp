#include "restbridge/core/app.hpp"
#include "restbridge/core/codec/json_codec.hpp"
#include "restbridge/core/dispatch/dispatcher.hpp"
#include "restbridge/core/dispatch/origin_policy.hpp"
#include "restbridge/core/http/error_responder.hpp"
#include "restbridge/core/interfaces/itransport.hpp"
#include "restbridge/core/routing/route_table.hpp"
#include "restbridge/core/rpc/argument_binder.hpp"
#include "restbridge/core/rpc/handler_registry.hpp"
#include "restbridge/core/rpc/return_validator.hpp"
#include "restbridge/core/service/service_descriptor.hpp"
#include "restbridge/core/util/error_types.hpp"
#include "restbridge/core/util/logger.hpp"

namespace restbridge {

    namespace {
        const ServiceDescriptor& validated(const HandlerRegistry& handlers, const ServiceDescriptor& service) {
            handlers.validate(service);
            return service;
        }
    }

    // Define the implementation struct
    struct App::Impl {
        ServiceDescriptor service_;
        HandlerRegistry handlers_;
        std::shared_ptr<const ICodec> codec_;
        RouteTable routes_;
        OriginPolicy origins_;
        Dispatcher dispatcher_;
        ArgumentBinder binder_;
        ReturnValidator validator_;
        std::unique_ptr<ITransport> transport_;

        Impl(ServiceDescriptor service, HandlerRegistry handlers,
             const BridgeOptions& options, std::shared_ptr<const ICodec> codec)
            : service_(std::move(service)),
              handlers_(std::move(handlers)),
              codec_(codec ? std::move(codec) : std::make_shared<JsonCodec>()),
              routes_(validated(handlers_, service_)),
              origins_(options.allowedOrigins),
              dispatcher_(routes_, origins_, options.allowedHeaders),
              binder_(*codec_),
              validator_(*codec_) {}

        HttpResponse invoke(const HttpRequest& req, DispatchContext& ctx) const;
    };

    HttpResponse App::Impl::invoke(const HttpRequest& req, DispatchContext& ctx) const
    {
        if (req.method == "OPTIONS")
            return HttpResponse{ 200, {}, {} };

        if (!ctx.procedure)
            throw DispatchError(BridgeErr::MethodMissing, 400, "`method` is missing.");

        const auto& wire = *ctx.procedure;
        auto internal = service_.internalName(wire);
        const ProcedureDescriptor* proc = internal ? service_.find(*internal) : nullptr;
        const ProcedureHandler* handler = internal ? handlers_.find(*internal) : nullptr;
        if (!proc || !handler) {
            LOG_DEBUG("[App] no procedure named " + wire);
            throw DispatchError(BridgeErr::MethodNotFound, ctx.routed ? 404 : 400,
                                "No service method `" + wire + "` found.");
        }

        ctx.payload = binder_.mergePayload(*proc, ctx, req);
        auto args = binder_.bind(*proc, ctx.payload);

        Value result;
        try {
            result = (*handler)(args);
        }
        catch (const ProcedureError& e) {
            if (!proc->declaresError(e.typeName())) {
                LOG_ERROR("[App] " + wire + "() raised undeclared error " + e.what());
                throw DispatchError(BridgeErr::ServerFault, 500);
            }
            LOG_INFO("[App] " + wire + "() raised " + e.what());
            try {
                return ErrorResponder::jsonResponse(400, codec_->encode(Value(e.value())));
            }
            catch (const CodecError& ce) {
                LOG_ERROR("[App] cannot encode error of " + wire + "(): " + ce.what());
                throw DispatchError(BridgeErr::ServerFault, 500);
            }
        }
        catch (const DispatchError&) {
            throw;
        }
        catch (const std::exception& e) {
            LOG_ERROR("[App] " + wire + "() failed: " + e.what());
            throw DispatchError(BridgeErr::ServerFault, 500);
        }
        catch (...) {
            LOG_ERROR("[App] " + wire + "() failed with a non-standard exception");
            throw DispatchError(BridgeErr::ServerFault, 500);
        }

        return ErrorResponder::jsonResponse(200, validator_.validate(*proc, result));
    }

    App::App(ServiceDescriptor service, HandlerRegistry handlers,
             BridgeOptions options, std::shared_ptr<const ICodec> codec)
        : pImpl_(std::make_unique<Impl>(std::move(service), std::move(handlers), options, std::move(codec)))
    {
        LOG_INFO("[App] service " + pImpl_->service_.name() + ": " +
                 std::to_string(pImpl_->service_.procedures().size()) + " procedures, " +
                 std::to_string(pImpl_->routes_.rules().size()) + " routes; fallback POST ?method=<name>");
    }

    App::~App() = default;

    void App::run(uint16_t port) {
        if (!pImpl_->transport_) {
            LOG_ERROR("[App] Transport not set!");
            return;
        }
        pImpl_->transport_->start(port);
    }

    void App::stop() {
        if (pImpl_->transport_) pImpl_->transport_->stop();
    }

    void App::setTransport(std::unique_ptr<ITransport> t) {
        pImpl_->transport_ = std::move(t);
        pImpl_->transport_->setCallback(
            [this](const HttpRequest& req) { return handle(req); });
    }

    ITransport* App::getTransport() const { return pImpl_->transport_.get(); }
    const ServiceDescriptor& App::service() const { return pImpl_->service_; }
    const RouteTable& App::routes() const { return pImpl_->routes_; }

    HttpResponse App::handle(const HttpRequest& req) const {
        DispatchContext ctx;
        try {
            ctx = pImpl_->dispatcher_.dispatch(req);
        }
        catch (const DispatchError& e) {
            return ErrorResponder::error(e.error());
        }

        HttpResponse res;
        try {
            res = pImpl_->invoke(req, ctx);
        }
        catch (const DispatchError& e) {
            res = ErrorResponder::error(e.error());
        }

        HeaderList headers = ctx.corsHeaders;
        for (const auto& [name, value] : res.headers)
            appendHeader(headers, name, value);
        res.headers = std::move(headers);
        return res;
    }
}
