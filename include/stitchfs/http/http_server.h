#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "stitchfs/core/config.h"
#include "stitchfs/http/router.h"
#include "stitchfs/storage/local_storage.h"
#include "stitchfs/upload/staging_janitor.h"

namespace stitchfs::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context + janitor timer).
///
/// Besides the router, the server streams assembled files for
/// `GET {public_prefix}/{name}` straight from the destination store.
class HttpServer {
public:
    /// @param janitor may be null when reaping is disabled.
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<storage::LocalDestinationStore> destination,
               std::shared_ptr<upload::StagingJanitor> janitor);
    /// @throws std::runtime_error when the listen address cannot be bound.
    void Run();

private:
    void StartJanitor();
    void ScheduleJanitorSweep();

    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<storage::LocalDestinationStore> destination_;
    std::shared_ptr<upload::StagingJanitor> janitor_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    std::unique_ptr<boost::asio::steady_timer> janitor_timer_;
};

}  // namespace stitchfs::http
