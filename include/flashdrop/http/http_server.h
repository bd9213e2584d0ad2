#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "flashdrop/core/config.h"
#include "flashdrop/core/time.h"
#include "flashdrop/http/router.h"
#include "flashdrop/retrieval/retrieval_gateway.h"

namespace flashdrop::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context).
///
/// Routed requests go through the Router; GET /files/{file} is answered here so the
/// object can be streamed with a file body.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<retrieval::RetrievalGateway> gateway,
               core::Clock clock = core::SystemClock());

    /// @brief Binds the listener and starts accepting. Throws boost::system::system_error
    /// when the endpoint cannot be bound.
    void Run();

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<retrieval::RetrievalGateway> gateway_;
    core::Clock clock_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

}  // namespace flashdrop::http
