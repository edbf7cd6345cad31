/**
 * @file HttpFront.hpp
 * @brief HTTP surface of the engine (cpp-httplib).
 */

#pragma once
#include "application/OperationDispatcher.hpp"
#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/ExternalToolAdapter.hpp"
#include <memory>
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace submitkit::infrastructure {

/**
 * @class HttpFront
 * @brief Binds multipart uploads to OperationRequests and serves artifacts back.
 *
 * Each request is handled synchronously on one of the server's worker threads.
 */
class HttpFront {
public:
    struct Options {
        std::string host = "0.0.0.0";
        int port = 5000;
        long long maxUploadBytes = 50LL * 1024 * 1024;
    };

    HttpFront(application::OperationDispatcher& dispatcher,
              ArtifactStore& store,
              ExternalToolAdapter& tools,
              Options options);
    ~HttpFront();

    HttpFront(const HttpFront&) = delete;
    HttpFront& operator=(const HttpFront&) = delete;

    /** @brief Blocks serving requests. @return False if the socket could not be bound. */
    bool listen();

    /** @brief Makes listen() return. Safe to call from another thread. */
    void stop();

    /**
     * @brief Builds a request from a multipart body.
     *
     * Parts named "file" or "files" that carry a filename become inputs in
     * submission order; every other part and every query parameter becomes a
     * parameter.
     */
    static application::OperationRequest BindRequest(application::Operation operation, const httplib::Request& req);

    /** @brief Content type to serve an artifact with, by extension. */
    static std::string ContentTypeFor(const std::string& name);

private:
    void registerRoutes();
    void handleOperation(application::Operation operation, const httplib::Request& req, httplib::Response& res);
    void handleDownload(const httplib::Request& req, httplib::Response& res);

    application::OperationDispatcher& m_dispatcher;
    ArtifactStore& m_store;
    ExternalToolAdapter& m_tools;
    Options m_options;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace submitkit::infrastructure
