/**
 * @file rms_upload.cpp
 * @brief Command-line upload client
 *
 * Usage:
 *   rms-upload [--config client.json] [--host h] [--port p] [--user id] <command>
 *
 * Commands:
 *   upload <path> [--mime type]   Upload a file, resumable above the direct bound
 *   resume                        Resume every journaled upload
 *   cancel <token>                Cancel one upload
 *   cancel-all                    Cancel every journaled upload
 *   list                          Show the local journal
 */

#include "rms/client/http_upload_transport.hpp"
#include "rms/client/session_journal.hpp"
#include "rms/client/transfer_orchestrator.hpp"
#include "rms/client/transfer_registry.hpp"
#include "rms/core/config.hpp"
#include "rms/network/http_client.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace rms;
using namespace rms::client;

namespace fs = std::filesystem;

namespace {

void print_usage() {
    std::cout << "Usage: rms-upload [options] <command>\n"
              << "Options:\n"
              << "  -c, --config <file>   JSON configuration file\n"
              << "  -H, --host <host>     Server host (default 127.0.0.1)\n"
              << "  -p, --port <port>     Server port (default 8080)\n"
              << "  -u, --user <id>       Owner identity sent as X-User-Id\n"
              << "  -j, --journal <file>  Local session journal\n"
              << "  -v, --verbose         Debug logging\n"
              << "Commands:\n"
              << "  upload <path> [--mime <type>]\n"
              << "  resume\n"
              << "  cancel <token>\n"
              << "  cancel-all\n"
              << "  list\n";
}

std::string guess_mime_type(const fs::path& path) {
    std::string ext = path.extension().string();
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (ext == ".mp4" || ext == ".m4v") return "video/mp4";
    if (ext == ".webm") return "video/webm";
    if (ext == ".mov") return "video/quicktime";
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".wav") return "audio/wav";
    if (ext == ".ogg") return "audio/ogg";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".txt") return "text/plain";
    return "application/octet-stream";
}

void print_outcome(const UploadOutcome& outcome) {
    std::cout << "fileId: " << outcome.file_id << "\n"
              << "url:    " << outcome.url << "\n";
    if (!outcome.session_token.empty()) {
        std::cout << "token:  " << outcome.session_token << "\n";
    }
}

int run_command(const std::vector<std::string>& positional,
                const std::optional<std::string>& mime_type,
                TransferOrchestrator& orchestrator,
                const SessionJournal& journal) {
    const std::string& command = positional.front();

    if (command == "upload") {
        if (positional.size() < 2) {
            std::cerr << "upload needs a file path\n";
            return 2;
        }
        const fs::path source = positional[1];
        auto outcome = orchestrator.upload_file(source, mime_type.value_or(guess_mime_type(source)));
        if (outcome.is_error()) {
            spdlog::error("Upload failed [{}]: {}", to_string(outcome.error().code), outcome.error().message);
            return 1;
        }
        print_outcome(outcome.value());
        return 0;
    }

    if (command == "resume") {
        int failures = 0;
        const auto results = orchestrator.resume_all();
        if (results.empty()) {
            std::cout << "Nothing to resume\n";
        }
        for (const auto& [token, outcome] : results) {
            if (outcome.is_error()) {
                ++failures;
                spdlog::error("{}: [{}] {}", token, to_string(outcome.error().code), outcome.error().message);
            } else {
                print_outcome(outcome.value());
            }
        }
        return failures == 0 ? 0 : 1;
    }

    if (command == "cancel") {
        if (positional.size() < 2) {
            std::cerr << "cancel needs a session token\n";
            return 2;
        }
        auto cancelled = orchestrator.cancel(positional[1]);
        if (cancelled.is_error()) {
            spdlog::error("Cancel failed: {}", cancelled.error().message);
            return 1;
        }
        std::cout << "Cancelled " << positional[1] << "\n";
        return 0;
    }

    if (command == "cancel-all") {
        std::cout << "Cancelled " << orchestrator.cancel_all() << " uploads\n";
        return 0;
    }

    if (command == "list") {
        const auto entries = journal.entries();
        if (entries.empty()) {
            std::cout << "No journaled uploads\n";
        }
        for (const auto& entry : entries) {
            std::cout << entry.session_token << "  " << to_string(entry.state) << "  "
                      << entry.uploaded_chunks << "/" << entry.total_chunks << "  "
                      << entry.source_path.string();
            if (!entry.last_error.empty()) {
                std::cout << "  (" << entry.last_error << ")";
            }
            std::cout << "\n";
        }
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path config_path;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<std::string> user;
    std::optional<fs::path> journal_path;
    std::optional<std::string> mime_type;
    bool verbose = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                port = static_cast<std::uint16_t>(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 2;
            }
        } else if ((arg == "-u" || arg == "--user") && i + 1 < argc) {
            user = argv[++i];
        } else if ((arg == "-j" || arg == "--journal") && i + 1 < argc) {
            journal_path = fs::path(argv[++i]);
        } else if (arg == "--mime" && i + 1 < argc) {
            mime_type = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    ClientConfig config;
    if (!config_path.empty()) {
        auto loaded = load_client_config(config_path);
        if (loaded.is_error()) {
            spdlog::error("Cannot load {}: {}", config_path.string(), loaded.error().message);
            return 1;
        }
        config = loaded.value();
    }
    if (host) config.host = *host;
    if (port) config.port = *port;
    if (user) config.user_id = *user;
    if (journal_path) config.journal_path = *journal_path;
    if (verbose) config.log_level = "debug";

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    if (config.user_id.empty()) {
        spdlog::error("No user id: pass --user or set user_id in the config file");
        return 2;
    }

    SessionJournal journal(config.journal_path);
    auto journal_loaded = journal.load();
    if (journal_loaded.is_error()) {
        spdlog::error("Cannot read journal: {}", journal_loaded.error().message);
        return 1;
    }

    network::HttpClient http(config.host, config.port, config.request_timeout);
    HttpUploadTransport transport(http, config.user_id);

    OrchestratorOptions options;
    options.concurrency = config.concurrency;
    options.retry = RetryPolicy(config.base_delay, config.max_delay, config.max_attempts);
    options.chunk_size = config.chunk_size;
    options.direct_upload_max_encoded = config.direct_upload_max_encoded;

    TransferRegistry registry;
    TransferOrchestrator orchestrator(transport, registry, options, &journal);
    orchestrator.set_progress_callback([](const TransferProgress& progress) {
        spdlog::info("{}: {}/{} chunks", progress.session_token, progress.uploaded_chunks, progress.total_chunks);
    });

    // Ctrl+C aborts running transfers; their journal entries stay for resume
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&registry](const boost::system::error_code& ec, int) {
        if (!ec) {
            spdlog::warn("Interrupted, aborting {} transfers", registry.size());
            registry.cancel_all();
        }
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    const int status = run_command(positional, mime_type, orchestrator, journal);

    signal_context.stop();
    signal_thread.join();
    return status;
}
