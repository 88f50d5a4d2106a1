/**
 * @file itransport.hpp
 * @brief Interface for transport layers in RestBridge.
 *
 * Defines the ITransport interface for implementing custom HTTP front ends that feed
 * requests into the RestBridge dispatch core.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <functional>
#include "restbridge/core/http/http_message.hpp"

namespace restbridge {

    /**
     * @typedef RequestCallback
     * @brief Callback that turns a complete request into a response.
     *
     * May be invoked concurrently from several transport threads.
     */
    using RequestCallback = std::function<HttpResponse(const HttpRequest&)>;

    /**
     * @class ITransport
     * @brief Interface for custom transport layers in RestBridge.
     */
    class ITransport {
    public:
        virtual ~ITransport() = default;
        /**
         * @brief Start the transport on the specified port.
         * @param port Port number to listen on
         */
        virtual void start(uint16_t port) = 0;
        /**
         * @brief Stop the transport.
         */
        virtual void stop() = 0;
        /**
         * @brief Set the callback that handles each request.
         * @param callback RequestCallback function
         */
        virtual void setCallback(RequestCallback callback) = 0;
    };
}
