/**
 * @file http_transport.hpp
 * @brief HTTP transport layer for RestBridge.
 */
#pragma once

#include "restbridge/core/interfaces/itransport.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>

namespace restbridge {

    /**
     * @class HttpTransport
     * @brief ITransport implementation using the uWebSockets HTTP server.
     *
     * The event loop runs on its own thread. Complete requests are handed to a worker
     * ThreadPool and the responses are written back on the loop thread.
     */
    class HttpTransport : public ITransport {
    public:
    /**
     * @brief Constructs an HttpTransport instance.
     * @param maxBodyBytes Largest accepted request body; bigger bodies get 413 (default: 1 MB).
     * @param workerThreads Worker count; 0 uses hardware concurrency.
     */
        explicit HttpTransport(uint32_t maxBodyBytes = 1024 * 1024, size_t workerThreads = 0);

    /**
     * @brief Destructor. Stops the server if it is still running.
     */
        ~HttpTransport() override;

    /**
     * @brief Starts the HTTP server on a background thread.
     * @param port The port number to listen on.
     */
        void start(uint16_t port) override;

    /**
     * @brief Stops accepting connections, drains in-flight requests and joins the server thread.
     */
        void stop() override;

    /**
     * @brief Sets the callback that produces the response of every request.
     * @param callback The request callback.
     */
        void setCallback(RequestCallback callback) override;

    /**
     * @brief Whether the listen socket was bound.
     */
        bool isListening() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
