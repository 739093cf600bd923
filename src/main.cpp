#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "stitchfs/core/config.h"
#include "stitchfs/core/logger.h"
#include "stitchfs/http/http_server.h"
#include "stitchfs/http/route_registration.h"
#include "stitchfs/http/router.h"
#include "stitchfs/storage/local_storage.h"
#include "stitchfs/upload/assembler.h"
#include "stitchfs/upload/chunk_receiver.h"
#include "stitchfs/upload/session_lock.h"
#include "stitchfs/upload/session_naming.h"
#include "stitchfs/upload/staging_janitor.h"

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

    stitchfs::core::Config config;
    try {
        config = stitchfs::core::LoadConfig(config_path);
    } catch (const std::exception& ex) {
        std::cerr << "failed to load config " << config_path << ": " << ex.what() << std::endl;
        return 1;
    }
    stitchfs::core::InitLogging(config.observability.log_level);

    try {
        auto staging =
            std::make_shared<stitchfs::storage::LocalStagingStore>(config.storage.staging_path);
        auto destination = std::make_shared<stitchfs::storage::LocalDestinationStore>(
            config.storage.destination_path, config.assembly.atomic_publish);
        auto locks = config.assembly.session_locking
                         ? std::make_shared<stitchfs::upload::SessionLockTable>()
                         : nullptr;

        const stitchfs::upload::PathNamer namer(config.storage.public_prefix);
        auto receiver = std::make_shared<stitchfs::upload::ChunkReceiver>(staging, namer);
        auto assembler = std::make_shared<stitchfs::upload::Assembler>(
            staging, destination, namer, config.assembly.max_chunks, locks);
        auto janitor = std::make_shared<stitchfs::upload::StagingJanitor>(
            staging, locks, config.janitor.max_session_age_seconds,
            config.janitor.max_sessions_per_sweep);

        stitchfs::http::Router router;
        stitchfs::http::RegisterDefaultRoutes(router, receiver, assembler);

        boost::asio::io_context ioc(config.server.threads);
        stitchfs::http::HttpServer server(ioc, config, std::move(router), destination, janitor);
        server.Run();

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(config.server.threads));
        for (int i = 0; i < config.server.threads; ++i) {
            threads.emplace_back([&ioc]() { ioc.run(); });
        }
        for (auto& t : threads) {
            t.join();
        }
    } catch (const std::exception& ex) {
        stitchfs::core::LogError(std::string("Fatal: ") + ex.what());
        return 1;
    }

    return 0;
}
