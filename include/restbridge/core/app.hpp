/**
 * @file app.hpp
 * @brief Main application (App) class and entry point for the RestBridge framework.
 *
 * Owns the service descriptor, handler registry, route table, CORS policy and codec,
 * and turns HTTP requests into procedure calls. Everything is built and validated in the
 * constructor and read-only afterwards, so handle() may run on many threads at once.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include "restbridge/core/types.hpp"
#include "restbridge/core/http/http_message.hpp"

namespace restbridge {

    class ITransport;
    class ICodec;
    class ServiceDescriptor;
    class HandlerRegistry;
    class RouteTable;

    /**
     * @struct BridgeOptions
     * @brief Cross-origin configuration of an App.
     */
    struct BridgeOptions {
        /// Allowed origin domains; "*" matches exactly one label ("*.example.com").
        std::set<std::string> allowedOrigins;
        /// Header names listed in Access-Control-Allow-Headers.
        std::set<std::string> allowedHeaders;
    };

    /**
     * @class App
     * @brief Main application class for the RestBridge framework.
     *
     * Request pipeline: route lookup or fallback, CORS, argument binding, handler call,
     * return validation, error envelope.
     */
    class App {
    public:
        /**
         * @brief Build and validate the application.
         * @param service Procedure table
         * @param handlers Handlers keyed by internal procedure name
         * @param options CORS configuration
         * @param codec Value codec; JsonCodec when null
         * @throws DescriptorError if handlers and procedures do not correspond
         * @throws TemplateError if a routing annotation is invalid
         */
        App(ServiceDescriptor service, HandlerRegistry handlers,
            BridgeOptions options = {}, std::shared_ptr<const ICodec> codec = nullptr);

        App(const App&) = delete;
        App& operator=(const App&) = delete;

        ~App();

        /**
         * @brief Start the transport on the specified port.
         * @param port Port number to listen on
         */
        void run(uint16_t port);
        /**
         * @brief Stop the transport.
         */
        void stop();
        /**
         * @brief Set the transport layer and route its requests to handle().
         * @param transport Transport instance to use
         */
        void setTransport(std::unique_ptr<ITransport> transport);
        /**
         * @brief Get the active transport instance.
         * @return Pointer to the ITransport instance, or nullptr
         */
        ITransport* getTransport() const;

        /**
         * @brief Handle one request.
         *
         * Never throws for request-time failures; they become error envelopes.
         *
         * @param req Incoming request
         * @return Response with CORS headers merged in
         */
        HttpResponse handle(const HttpRequest& req) const;

        const ServiceDescriptor& service() const;
        const RouteTable& routes() const;

    private:
        // PIMPL idiom
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };
}
