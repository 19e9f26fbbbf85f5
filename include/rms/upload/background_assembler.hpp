#pragma once

#include "rms/core/work_queue.hpp"
#include "rms/events/event_bus.hpp"
#include "rms/storage/chunk_store.hpp"
#include "rms/upload/file_catalog.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace rms::upload {

struct AssemblerOptions {
    std::uint64_t max_size = 2048ULL * 1024 * 1024;   ///< Larger files are only ever streamed
    std::string public_base_url;
};

/**
 * @brief Builds a single-blob copy of streamed files off the request path
 *
 * A streamed file is served from its chunks right after finalize. The
 * assembler then copies those chunks in order into one blob, one chunk in
 * memory at a time, and records the copy in the catalog. From then on the
 * stream endpoint redirects to the direct url. The chunks are left alone:
 * they remain the storage of record while the file exists.
 *
 * THREAD SAFETY:
 * - schedule() may be called from any thread
 * - A file id is assembled by at most one job at a time; scheduling a file
 *   that is queued or running is a no-op
 * - One worker thread runs the jobs in order
 *
 * A failed job leaves the file streamed; the next scan_pending() retries it.
 */
class BackgroundAssembler {
public:
    BackgroundAssembler(storage::ChunkStore& chunks,
                        FileCatalog& catalog,
                        events::EventBus& bus,
                        AssemblerOptions options);
    ~BackgroundAssembler();

    BackgroundAssembler(const BackgroundAssembler&) = delete;
    BackgroundAssembler& operator=(const BackgroundAssembler&) = delete;

    /// Starts the worker and follows streamed finalizes. Not restartable after stop().
    void start();
    void stop();

    /// Queue one file. False when it is not eligible or already in flight.
    bool schedule(const std::string& file_id);

    /// Queue every streamed file that has no assembled copy yet.
    std::size_t scan_pending();

    /// Assemble on the calling thread, bypassing the queue.
    Result<FinalizedFile> assemble_now(const std::string& file_id);

    [[nodiscard]] bool in_flight(const std::string& file_id) const;
    [[nodiscard]] bool running() const noexcept { return worker_.joinable(); }

private:
    void run();
    Result<FinalizedFile> assemble(const FinalizedFile& file);
    bool eligible(const FinalizedFile& file) const;

    storage::ChunkStore& chunks_;
    FileCatalog& catalog_;
    events::EventBus& event_bus_;
    AssemblerOptions options_;
    std::size_t subscription_ = 0;

    std::atomic<bool> stopping_{false};
    WorkQueue<std::string> queue_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> active_;
    std::thread worker_;
};

} // namespace rms::upload
