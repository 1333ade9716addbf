/**
 * Chunked upload client
 *
 * Uploads one file to a ChunkFS server:
 * 1. Hash the file and open (or dedup against) an upload session
 * 2. Send the chunks the server does not have yet, a few at a time
 * 3. Ask the server to merge them into the archive
 *
 * With --interactive, type "pause", "resume" or "quit" while the upload runs.
 */

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "chunkfs/client/chunk_scheduler.h"
#include "chunkfs/client/http_upload_transport.h"
#include "chunkfs/core/config.h"
#include "chunkfs/core/logger.h"

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

bool HasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

}  // namespace

int main(int argc, char** argv) {
    const auto file_path = GetArgValue(argc, argv, "--file", "");
    if (file_path.empty()) {
        std::cerr << "usage: chunkfs_upload --file <path> [--config config/client.json] "
                     "[--interactive]"
                  << std::endl;
        return 2;
    }

    chunkfs::core::ClientConfig config;
    const auto config_path = GetArgValue(argc, argv, "--config", "config/client.json");
    try {
        config = chunkfs::core::LoadClientConfig(config_path);
    } catch (const std::exception& ex) {
        std::cerr << "invalid configuration " << config_path << ": " << ex.what() << std::endl;
        return 1;
    }
    chunkfs::core::InitLogging(GetArgValue(argc, argv, "--log-level", "warning"));

    boost::asio::io_context ioc;
    // Hashing runs off the loop, so keep run() alive until a terminal callback fires.
    auto work = boost::asio::make_work_guard(ioc);
    auto transport = std::make_shared<chunkfs::client::HttpUploadTransport>(ioc, config);

    int exit_code = 1;
    chunkfs::client::SchedulerCallbacks callbacks;
    callbacks.on_progress = [](int percent) {
        std::cout << "\rprogress: " << percent << "%" << std::flush;
    };
    callbacks.on_success = [&](const std::string& stored_as) {
        std::cout << "\nstored as " << stored_as << std::endl;
        exit_code = 0;
        work.reset();
    };
    callbacks.on_error = [&](const chunkfs::core::Error& error) {
        std::cout << "\nupload failed [" << chunkfs::core::ErrorCodeName(error.code)
                  << "]: " << error.message << std::endl;
        work.reset();
    };

    auto scheduler = chunkfs::client::ChunkScheduler::Create(
        ioc, transport, file_path, chunkfs::client::OptionsFromConfig(config),
        std::move(callbacks));
    scheduler->Start();

    if (HasFlag(argc, argv, "--interactive")) {
        // Reader thread only talks to the scheduler through its thread-safe entry points.
        std::thread([scheduler, &ioc, &work]() {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (line == "pause") {
                    scheduler->Pause();
                } else if (line == "resume") {
                    scheduler->Resume();
                } else if (line == "quit") {
                    scheduler->Pause();
                    boost::asio::post(ioc, [&work]() { work.reset(); });
                    return;
                }
            }
        }).detach();
    }

    ioc.run();
    return exit_code;
}
