#include <csignal>
#include <exception>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "flashdrop/core/config.h"
#include "flashdrop/core/logger.h"
#include "flashdrop/http/http_server.h"
#include "flashdrop/http/route_registration.h"
#include "flashdrop/http/router.h"
#include "flashdrop/metadata/json_metadata_store.h"
#include "flashdrop/reaper/expiry_reaper.h"
#include "flashdrop/retrieval/retrieval_gateway.h"
#include "flashdrop/storage/local_storage.h"
#include "flashdrop/upload/assembler.h"
#include "flashdrop/upload/chunk_session_tracker.h"
#include "flashdrop/upload/identifier_allocator.h"

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

int RunServer(const flashdrop::core::Config& config) {
    const auto metadata_path = std::filesystem::path(config.storage.metadata_path);
    if (metadata_path.has_parent_path()) {
        std::filesystem::create_directories(metadata_path.parent_path());
    }
    auto metadata = std::make_shared<flashdrop::metadata::JsonMetadataStore>(metadata_path);
    metadata->Restore();

    auto storage = std::make_shared<flashdrop::storage::LocalStorage>(
        config.storage.object_path, config.storage.chunk_path, config.storage.temp_path);
    auto tracker = std::make_shared<flashdrop::upload::ChunkSessionTracker>(
        storage, config.storage.max_file_bytes);
    auto allocator =
        std::make_shared<flashdrop::upload::IdentifierAllocator>(storage, config.identifiers);
    auto assembler = std::make_shared<flashdrop::upload::Assembler>(
        storage, tracker, allocator, metadata, config.retention.file_ttl_seconds);
    auto gateway = std::make_shared<flashdrop::retrieval::RetrievalGateway>(metadata, storage);

    flashdrop::http::Router router;
    flashdrop::http::RegisterDefaultRoutes(router, tracker, assembler, config);

    boost::asio::io_context ioc(config.server.threads);
    flashdrop::http::HttpServer server(ioc, config, std::move(router), gateway);
    server.Run();

    flashdrop::reaper::ExpiryReaper reaper(ioc, metadata, storage, tracker, config.retention);
    reaper.Start();

    std::promise<int> shutdown;
    auto shutdown_signal = shutdown.get_future();
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&shutdown](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        shutdown.set_value(signal_number);
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }

    const int signal_number = shutdown_signal.get();
    flashdrop::core::LogInfo("Received signal " + std::to_string(signal_number) +
                             ", shutting down");
    // The reaper writes a final metadata snapshot before its future becomes ready.
    reaper.Stop().wait();
    ioc.stop();
    for (auto& t : threads) {
        t.join();
    }
    flashdrop::core::LogInfo("Shutdown complete with " + std::to_string(metadata->Size()) +
                             " live files");
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");

    flashdrop::core::Config config;
    try {
        config = flashdrop::core::LoadConfig(config_path);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load config " << config_path << ": " << ex.what() << std::endl;
        return 1;
    }
    flashdrop::core::InitLogging(config.observability.log_level);

    try {
        return RunServer(config);
    } catch (const std::exception& ex) {
        flashdrop::core::LogError(std::string("Fatal: ") + ex.what());
        return 1;
    }
}
