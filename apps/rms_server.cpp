/**
 * @file rms_server.cpp
 * @brief Resumable media store server
 *
 * Wires the storage, upload and streaming engines to the Asio HTTP server.
 *
 * Usage:
 *   rms-server [--config server.json] [--port 8080] [--data ./rms_data] [--log-level debug]
 */

#include "rms/api/upload_api.hpp"
#include "rms/core/config.hpp"
#include "rms/events/components.hpp"
#include "rms/events/event_bus.hpp"
#include "rms/events/events.hpp"
#include "rms/network/http_router.hpp"
#include "rms/network/http_server_asio.hpp"
#include "rms/storage/chunk_store.hpp"
#include "rms/storage/filesystem_blob_store.hpp"
#include "rms/stream/stream_service.hpp"
#include "rms/upload/background_assembler.hpp"
#include "rms/upload/direct_upload.hpp"
#include "rms/upload/file_catalog.hpp"
#include "rms/upload/finalizer.hpp"
#include "rms/upload/session_authority.hpp"
#include "rms/upload/session_reaper.hpp"
#include "rms/upload/session_repository.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace rms;
using namespace rms::network;

namespace fs = std::filesystem;

namespace {

void print_usage() {
    std::cout << "Usage: rms-server [options]\n"
              << "  -c, --config <file>     JSON configuration file\n"
              << "  -p, --port <port>       Listening port (default 8080)\n"
              << "  -d, --data <dir>        Data directory (default ./rms_data)\n"
              << "  -l, --log-level <level> trace|debug|info|warn|error\n"
              << "  -h, --help              Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path config_path;
    std::optional<std::uint16_t> port_override;
    std::optional<fs::path> data_override;
    std::optional<std::string> level_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                port_override = static_cast<std::uint16_t>(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 2;
            }
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            data_override = fs::path(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            level_override = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return 2;
        }
    }

    ServerConfig config;
    if (!config_path.empty()) {
        auto loaded = load_server_config(config_path);
        if (loaded.is_error()) {
            spdlog::error("Cannot load {}: {}", config_path.string(), loaded.error().message);
            return 1;
        }
        config = loaded.value();
    }
    if (port_override) config.port = *port_override;
    if (data_override) config.data_root = *data_override;
    if (level_override) config.log_level = *level_override;

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern(config.log_pattern);

    try {
        fs::create_directories(config.data_root);

        // ─── Engine ───────────────────────────────────────

        events::EventBus event_bus;
        events::LoggerComponent logger(event_bus);
        events::MetricsComponent metrics(event_bus);

        storage::FilesystemBlobStore blobs(config.data_root);
        storage::ChunkStore chunks(blobs);

        upload::FileCatalog catalog(blobs);
        auto catalog_loaded = catalog.load();
        if (catalog_loaded.is_error()) {
            spdlog::error("Cannot load file catalog: {}", catalog_loaded.error().message);
            return 1;
        }

        upload::Finalizer finalizer(chunks, upload::FinalizerOptions{config.small_file_threshold,
                                                                     config.public_base_url});
        upload::SessionRepository repository(blobs);

        upload::AuthorityOptions authority_options;
        authority_options.default_chunk_size = config.chunk_size;
        authority_options.min_chunk_size = config.min_chunk_size;
        authority_options.max_chunk_size = config.max_chunk_size;
        upload::SessionAuthority authority(chunks, finalizer, catalog, event_bus, authority_options, &repository);

        auto restored = authority.load();
        if (restored.is_error()) {
            spdlog::error("Cannot restore sessions: {}", restored.error().message);
            return 1;
        }
        spdlog::info("Restored {} upload sessions, {} finalized files", restored.value(), catalog.size());

        upload::DirectUploadService direct_uploads(
            blobs, catalog, event_bus,
            upload::DirectUploadOptions{config.direct_upload_max_encoded, config.public_base_url});

        stream::StreamOptions stream_options;
        stream_options.block_size = config.stream_block_size;
        stream_options.open_range_cap = config.open_range_cap;
        stream_options.stream_incomplete_sessions = config.stream_incomplete_sessions;
        stream::StreamService streams(chunks, blobs, catalog, &authority, event_bus, stream_options);

        upload::SessionReaper reaper(authority, upload::ReaperOptions{config.reaper_interval,
                                                                      config.session_ttl,
                                                                      config.terminal_retention});

        std::optional<upload::BackgroundAssembler> assembler;
        if (config.background_assembly) {
            assembler.emplace(chunks, catalog, event_bus,
                              upload::AssemblerOptions{config.assembly_max_size, config.public_base_url});
        }

        // ─── HTTP ─────────────────────────────────────────

        HttpRouter router;
        api::register_upload_routes(router, api::ApiServices{authority, direct_uploads, streams, &metrics});

        boost::asio::io_context io_context;
        HttpServerAsio server(io_context, config.bind_address, config.port, config.max_request_body);
        server.set_handler([&router](const HttpRequest& request) {
            return router.handle_request(request);
        });

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {}, shutting down...", signal_number);
            event_bus.emit(events::ServerShuttingDownEvent("signal"));
            server.stop();
            io_context.stop();
        });

        reaper.start();
        if (assembler) {
            assembler->start();
            assembler->scan_pending();
        }
        event_bus.emit(events::ServerStartedEvent(server.get_port()));

        std::vector<std::thread> pool;
        for (std::size_t i = 1; i < config.worker_threads; ++i) {
            pool.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& thread : pool) {
            thread.join();
        }

        reaper.stop();
        if (assembler) {
            assembler->stop();
        }
        metrics.print_stats();
        spdlog::info("Server shut down cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }
}
