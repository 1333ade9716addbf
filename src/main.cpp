#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "chunkfs/core/config.h"
#include "chunkfs/core/logger.h"
#include "chunkfs/http/http_server.h"
#include "chunkfs/http/route_registration.h"
#include "chunkfs/http/router.h"
#include "chunkfs/storage/chunk_store.h"
#include "chunkfs/storage/content_archive.h"
#include "chunkfs/upload/session_registry.h"
#include "chunkfs/upload/upload_coordinator.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");

    chunkfs::core::Config config;
    try {
        config = chunkfs::core::LoadConfig(config_path);
    } catch (const std::exception& ex) {
        std::cerr << "invalid configuration " << config_path << ": " << ex.what() << std::endl;
        return 1;
    }
    chunkfs::core::InitLogging(config.observability.log_level);

    std::shared_ptr<chunkfs::storage::ChunkStore> chunks;
    std::shared_ptr<chunkfs::storage::ContentArchive> archive;
    try {
        chunks = std::make_shared<chunkfs::storage::ChunkStore>(config.storage.staging_path);
        archive = std::make_shared<chunkfs::storage::ContentArchive>(config.storage.archive_path);
    } catch (const std::exception& ex) {
        chunkfs::core::LogError(std::string("Failed to prepare storage roots: ") + ex.what());
        return 1;
    }
    auto registry = std::make_shared<chunkfs::upload::InMemorySessionRegistry>();
    auto coordinator = std::make_shared<chunkfs::upload::UploadCoordinator>(
        registry, chunks, archive, config.upload);

    chunkfs::http::Router router;
    chunkfs::http::RegisterDefaultRoutes(router, coordinator);

    boost::asio::io_context ioc(config.server.threads);
    chunkfs::http::HttpServer server(ioc, config, std::move(router), coordinator);
    if (!server.Run()) {
        return 1;
    }
    chunkfs::core::LogInfo("Listening on " + config.server.host + ":" +
                           std::to_string(config.server.port));

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
