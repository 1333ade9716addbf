#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "chunkfs/core/config.h"
#include "chunkfs/http/router.h"
#include "chunkfs/upload/upload_coordinator.h"

namespace chunkfs::http {

struct ServerState;

/// @brief Listener bootstrapper plus the periodic staging cleanup job.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<upload::UploadCoordinator> coordinator);
    ~HttpServer();

    /// @brief Start the cleanup job and begin accepting. False if the socket cannot listen.
    bool Run();

    /// @brief One reconciliation pass: expire idle sessions (when a TTL is configured),
    /// then remove staging areas that belong to no session.
    void RunCleanupSweep();

private:
    void StartCleanupJob();
    void ScheduleCleanupSweep();

    boost::asio::io_context& ioc_;
    std::shared_ptr<const ServerState> state_;
    std::unique_ptr<boost::asio::steady_timer> cleanup_timer_;
};

}  // namespace chunkfs::http
