/**
 * @file http_transport.cpp
 * @brief Implementation of the HttpTransport class for RestBridge.
 *
 * Request data is copied out of uWebSockets objects on the loop thread, the callback
 * runs on the worker pool, and the response is written back through Loop::defer. A
 * shared abort flag keeps workers from touching responses whose connection has gone.
 */
#include "restbridge/transports/http/http_transport.hpp"
#include "restbridge/core/http/error_responder.hpp"
#include "restbridge/core/util/http_status.hpp"
#include "restbridge/core/util/logger.hpp"
#include "restbridge/core/util/thread_pool.hpp"
#include "restbridge/core/util/url.hpp"
#include <uwebsockets/App.h>
#include <atomic>
#include <mutex>
#include <thread>

namespace restbridge {

    using Res = uWS::HttpResponse<false>;

    namespace {
        /// Per-request state shared between the loop thread and a worker.
        struct Pending {
            HttpRequest       req;
            std::atomic<bool> aborted{ false };
            bool              rejected = false;
        };

        void writeResponse(Res* res, const HttpResponse& out, bool closeConnection) {
            res->cork([res, &out, closeConnection] {
                auto status = statusLine(out.status);
                res->writeStatus(status);
                for (const auto& [name, value] : out.headers)
                    res->writeHeader(name, value);
                res->end(out.body, closeConnection);
            });
        }
    }

    struct HttpTransport::Impl {
        uint32_t                    maxBody;
        size_t                      workers;
        RequestCallback             callback;
        std::unique_ptr<ThreadPool> pool;
        std::jthread                serverTh;
        std::mutex                  mx;
        uWS::Loop*                  loop = nullptr;
        us_listen_socket_t*         listenSocket = nullptr;
        std::atomic<bool>           listening{ false };
        std::atomic<bool>           stopping{ false };

        Impl(uint32_t maxBodyBytes, size_t workerThreads)
            : maxBody(maxBodyBytes), workers(workerThreads) {}

        void onRequest(Res* res, uWS::HttpRequest* req);
        void dispatch(Res* res, std::shared_ptr<Pending> pending);
    };

    void HttpTransport::Impl::onRequest(Res* res, uWS::HttpRequest* req) {
        auto pending = std::make_shared<Pending>();
        pending->req.method = toUpper(req->getMethod());
        pending->req.path = std::string(req->getUrl());
        pending->req.query = std::string(req->getQuery());
        for (auto [key, value] : *req)
            pending->req.headers.emplace_back(std::string(key), std::string(value));

        res->onAborted([pending] {
            pending->aborted = true;
            LOG_DEBUG("[HTTP] request aborted: " + pending->req.method + " " + pending->req.path);
        });

        res->onData([this, res, pending](std::string_view chunk, bool isLast) {
            if (pending->rejected) return;
            if (pending->req.body.size() + chunk.size() > maxBody) {
                pending->rejected = true;
                LOG_WARN("[HTTP] body of " + pending->req.method + " " + pending->req.path +
                         " exceeds " + std::to_string(maxBody) + " bytes");
                writeResponse(res, ErrorResponder::error(413), true);
                return;
            }
            pending->req.body.append(chunk.data(), chunk.size());
            if (isLast) dispatch(res, pending);
        });
    }

    void HttpTransport::Impl::dispatch(Res* res, std::shared_ptr<Pending> pending) {
        auto* lp = loop;
        try {
            pool->add([this, res, pending, lp] {
                HttpResponse out;
                try {
                    out = callback(pending->req);
                }
                catch (const std::exception& e) {
                    LOG_ERROR("[HTTP] request callback failed: " + std::string(e.what()));
                    out = ErrorResponder::error(500);
                }
                catch (...) {
                    LOG_ERROR("[HTTP] request callback failed with a non-standard exception");
                    out = ErrorResponder::error(500);
                }
                lp->defer([this, res, pending, out = std::move(out)] {
                    if (pending->aborted) return;
                    writeResponse(res, out, stopping.load());
                });
            });
        }
        catch (const std::runtime_error& e) {
            LOG_WARN("[HTTP] rejecting request while stopping: " + std::string(e.what()));
            writeResponse(res, ErrorResponder::error(503), true);
        }
    }

    HttpTransport::HttpTransport(uint32_t maxBodyBytes, size_t workerThreads)
        : pImpl_(std::make_unique<Impl>(maxBodyBytes, workerThreads)) {}

    HttpTransport::~HttpTransport() { stop(); }

    void HttpTransport::setCallback(RequestCallback callback) {
        pImpl_->callback = std::move(callback);
    }

    bool HttpTransport::isListening() const { return pImpl_->listening; }

    void HttpTransport::start(uint16_t port) {
        if (pImpl_->serverTh.joinable()) return;
        if (!pImpl_->callback) {
            LOG_ERROR("[HTTP] callback not set!");
            return;
        }
        pImpl_->stopping = false;
        pImpl_->pool = std::make_unique<ThreadPool>(pImpl_->workers);

        pImpl_->serverTh = std::jthread([this, port] {
            uWS::App app{};
            {
                std::lock_guard<std::mutex> lk(pImpl_->mx);
                pImpl_->loop = uWS::Loop::get();
            }

            app.any("/*", [this](Res* res, uWS::HttpRequest* req) {
                pImpl_->onRequest(res, req);
            });

            app.listen(port, [this, port](us_listen_socket_t* tok) {
                if (tok) {
                    std::lock_guard<std::mutex> lk(pImpl_->mx);
                    pImpl_->listenSocket = tok;
                    pImpl_->listening = true;
                    LOG_INFO("[HTTP] listening " + std::to_string(port));
                }
                else {
                    LOG_ERROR("[HTTP] bind fail on port " + std::to_string(port));
                }
            });

            app.run();

            std::lock_guard<std::mutex> lk(pImpl_->mx);
            pImpl_->loop = nullptr;
            pImpl_->listenSocket = nullptr;
            pImpl_->listening = false;
        });
    }

    void HttpTransport::stop() {
        if (!pImpl_ || !pImpl_->serverTh.joinable()) return;
        pImpl_->stopping = true;

        // Workers first, so no task defers onto a loop that has already exited.
        if (pImpl_->pool) pImpl_->pool->join();

        {
            std::lock_guard<std::mutex> lk(pImpl_->mx);
            if (pImpl_->loop) {
                auto* impl = pImpl_.get();
                pImpl_->loop->defer([impl] {
                    std::lock_guard<std::mutex> inner(impl->mx);
                    if (impl->listenSocket) {
                        us_listen_socket_close(0, impl->listenSocket);
                        impl->listenSocket = nullptr;
                    }
                    impl->listening = false;
                });
            }
        }
        pImpl_->serverTh.join();
        pImpl_->pool.reset();
        LOG_INFO("[HTTP] stopped");
    }

}
