#pragma once

#include "rms/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rms::client {

enum class TransferState {
    Uploading,
    Paused,
    Failed,
    Completed
};

const char* to_string(TransferState state);
std::optional<TransferState> transfer_state_from_string(const std::string& name);

/**
 * @brief What the client remembers about one upload between runs
 */
struct JournalEntry {
    std::string session_token;
    std::filesystem::path source_path;
    std::string filename;
    std::string mime_type;
    std::uint64_t file_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t uploaded_chunks = 0;
    TransferState state = TransferState::Uploading;
    std::string last_error;
};

/**
 * @brief Local projection of the client's uploads, stored as one JSON file
 *
 * Enough to find the sessions to resume after a restart. Which chunks the
 * server holds is always asked from the server, never taken from here.
 * Every change rewrites the file through a temp file and rename.
 */
class SessionJournal {
public:
    explicit SessionJournal(std::filesystem::path path);

    /// Missing file = empty journal.
    Result<void> load();

    Result<void> upsert(const JournalEntry& entry);
    Result<void> remove(const std::string& session_token);

    std::optional<JournalEntry> find(const std::string& session_token) const;
    std::vector<JournalEntry> entries() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    Result<void> save_locked() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::vector<JournalEntry> entries_;
};

} // namespace rms::client
