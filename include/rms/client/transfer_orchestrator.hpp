#pragma once

#include "rms/client/retry_policy.hpp"
#include "rms/client/session_journal.hpp"
#include "rms/client/transfer_registry.hpp"
#include "rms/client/upload_transport.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rms::client {

struct OrchestratorOptions {
    std::size_t concurrency = 3;
    RetryPolicy retry;
    std::uint64_t chunk_size = 0;                             ///< 0 = server default
    std::uint64_t direct_upload_max_encoded = 10ULL * 1024 * 1024;
};

struct TransferProgress {
    std::string session_token;
    std::uint32_t uploaded_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t uploaded_bytes = 0;
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

struct UploadOutcome {
    std::string session_token;   ///< Empty for the small-file path
    std::string file_id;
    std::string url;
    bool direct = false;
};

/**
 * @brief Drives uploads from a local file to the server
 *
 * Small files (base64 payload within the direct bound) go up in one request.
 * Everything else is a resumable session: the file is cut into the
 * session's chunks, which are uploaded by a bounded window of workers. Each
 * chunk is retried on its own with exponential backoff; once a chunk runs
 * out of attempts, or the server rejects it for good, the transfer stops,
 * the journal marks it failed and the error is returned.
 *
 * Cancellation is keyed by session token through the TransferRegistry and
 * works from any thread: in-flight requests are aborted, pending backoff
 * waits wake up, and the server is told on a separate request.
 */
class TransferOrchestrator {
public:
    TransferOrchestrator(UploadTransport& transport,
                         TransferRegistry& registry,
                         OrchestratorOptions options,
                         SessionJournal* journal = nullptr);

    void set_progress_callback(ProgressCallback callback);

    Result<UploadOutcome> upload_file(const std::filesystem::path& path, const std::string& mime_type);

    /**
     * @brief Continue a journaled session
     *
     * Asks the server which chunks it holds and uploads only the others.
     */
    Result<UploadOutcome> resume(const std::string& session_token);

    /// Resume every journaled session that is not completed and whose source still exists.
    std::vector<std::pair<std::string, Result<UploadOutcome>>> resume_all();

    /**
     * @brief Cancel a transfer
     *
     * Local state goes first (registry handle tripped, journal entry
     * dropped), then the server cancel is sent. A failed server cancel is
     * logged and otherwise ignored; the reaper reclaims the session later.
     */
    Result<void> cancel(const std::string& session_token);

    /// Cancel every running and journaled transfer.
    std::size_t cancel_all();

    [[nodiscard]] TransferRegistry& registry() noexcept { return registry_; }

private:
    Result<UploadOutcome> upload_small(const std::filesystem::path& path,
                                       const std::string& mime_type,
                                       std::uint64_t size);

    Result<UploadOutcome> run_transfer(JournalEntry entry,
                                       const std::set<std::uint32_t>& uploaded,
                                       const CancellationHandle& cancel);

    Result<void> upload_missing(const JournalEntry& entry,
                                std::vector<std::uint32_t> missing,
                                std::uint32_t already_uploaded,
                                CancellationToken& cancel);

    /// Journal write unless the transfer was cancelled meanwhile.
    void record(const JournalEntry& entry, const CancellationToken& cancel);

    void report(const TransferProgress& progress);

    UploadTransport& transport_;
    TransferRegistry& registry_;
    OrchestratorOptions options_;
    SessionJournal* journal_;

    std::mutex state_mutex_;      ///< Orders cancel() against journal writes of finishing transfers
    std::mutex progress_mutex_;
    ProgressCallback progress_callback_;
};

} // namespace rms::client
