#include "rms/client/transfer_orchestrator.hpp"

#include "rms/core/base64.hpp"
#include "rms/core/work_queue.hpp"
#include "rms/upload/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <optional>
#include <thread>

namespace rms::client {

namespace fs = std::filesystem;

namespace {

/**
 * Run op until it succeeds, fails for good or runs out of attempts,
 * sleeping the policy's backoff between tries. The sleep wakes up early on
 * cancellation, in which case the retry never fires.
 */
template<typename Op>
auto with_retry(const RetryPolicy& policy, CancellationToken& cancel, const std::string& what, Op op)
    -> decltype(op()) {
    using ResultType = decltype(op());
    std::size_t failures = 0;
    while (true) {
        if (cancel.is_cancelled()) {
            return ResultType(ErrValue<Error>(Error{ErrorCode::Cancelled, what + " cancelled"}));
        }

        auto result = op();
        if (result.is_ok() || result.error().code == ErrorCode::Cancelled) {
            return result;
        }

        ++failures;
        if (!policy.should_retry(result.error().code, failures)) {
            if (is_retryable(result.error().code)) {
                spdlog::error("[Orchestrator] {} gave up after {} attempts: {}",
                              what, failures, result.error().message);
                return ResultType(ErrValue<Error>(Error{
                    result.error().code,
                    what + " failed after " + std::to_string(failures) + " attempts: " + result.error().message}));
            }
            return result;
        }

        const auto delay = policy.delay(failures);
        spdlog::warn("[Orchestrator] {} failed ({}), retry {} in {} ms",
                     what, result.error().message, failures, delay.count());
        if (cancel.wait_for(delay)) {
            return ResultType(ErrValue<Error>(Error{ErrorCode::Cancelled, what + " cancelled during backoff"}));
        }
    }
}

Result<std::vector<std::uint8_t>> read_chunk(std::ifstream& input, const JournalEntry& entry, std::uint32_t index) {
    const std::uint64_t length = upload::chunk_length(entry.file_size, entry.chunk_size, index);
    std::vector<std::uint8_t> bytes(length);

    input.clear();
    input.seekg(static_cast<std::streamoff>(static_cast<std::uint64_t>(index) * entry.chunk_size));
    input.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(input.gcount()) != length) {
        return Err<std::vector<std::uint8_t>>(
            ErrorCode::InvalidArgument,
            entry.source_path.string() + " is shorter than recorded (chunk " + std::to_string(index) + ")");
    }
    return Ok(std::move(bytes));
}

Result<std::vector<std::uint8_t>> read_file(const fs::path& path, std::uint64_t size) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::InvalidArgument, "cannot open " + path.string());
    }
    std::vector<std::uint8_t> bytes(size);
    input.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::uint64_t>(input.gcount()) != size) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::InvalidArgument, "short read from " + path.string());
    }
    return Ok(std::move(bytes));
}

} // namespace

TransferOrchestrator::TransferOrchestrator(UploadTransport& transport,
                                           TransferRegistry& registry,
                                           OrchestratorOptions options,
                                           SessionJournal* journal)
    : transport_(transport)
    , registry_(registry)
    , options_(std::move(options))
    , journal_(journal) {
    options_.concurrency = std::max<std::size_t>(options_.concurrency, 1);
}

void TransferOrchestrator::set_progress_callback(ProgressCallback callback) {
    std::lock_guard lock(progress_mutex_);
    progress_callback_ = std::move(callback);
}

void TransferOrchestrator::report(const TransferProgress& progress) {
    std::lock_guard lock(progress_mutex_);
    if (progress_callback_) {
        progress_callback_(progress);
    }
}

void TransferOrchestrator::record(const JournalEntry& entry, const CancellationToken& cancel) {
    if (journal_ == nullptr) {
        return;
    }
    std::lock_guard lock(state_mutex_);
    if (cancel.is_cancelled()) {
        return;
    }
    auto saved = journal_->upsert(entry);
    if (saved.is_error()) {
        spdlog::warn("[Orchestrator] Journal update for {} failed: {}", entry.session_token, saved.error().message);
    }
}

Result<UploadOutcome> TransferOrchestrator::upload_file(const fs::path& path, const std::string& mime_type) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<UploadOutcome>(ErrorCode::InvalidArgument, "cannot stat " + path.string() + ": " + ec.message());
    }
    if (size == 0) {
        return Err<UploadOutcome>(ErrorCode::InvalidSize, path.string() + " is empty");
    }

    const std::uint64_t encoded_size = 4 * ((size + 2) / 3);
    if (encoded_size <= options_.direct_upload_max_encoded) {
        return upload_small(path, mime_type, size);
    }

    const std::string filename = path.filename().string();
    CancellationToken create_cancel;
    auto created = with_retry(options_.retry, create_cancel, "create session for " + filename, [&]() {
        return transport_.create_session(filename, size, mime_type, options_.chunk_size, &create_cancel);
    });
    if (created.is_error()) {
        return forward_error<UploadOutcome>(created);
    }

    JournalEntry entry;
    entry.session_token = created.value().session_token;
    entry.source_path = fs::absolute(path, ec);
    if (ec) {
        entry.source_path = path;
    }
    entry.filename = filename;
    entry.mime_type = mime_type;
    entry.file_size = size;
    entry.chunk_size = created.value().chunk_size;
    entry.total_chunks = created.value().total_chunks;

    spdlog::info("[Orchestrator] Session {} opened for {} ({} bytes, {} chunks of {})",
                 entry.session_token, filename, size, entry.total_chunks, entry.chunk_size);

    auto handle = registry_.acquire(entry.session_token);
    record(entry, *handle);
    return run_transfer(std::move(entry), {}, handle);
}

Result<UploadOutcome> TransferOrchestrator::upload_small(const fs::path& path,
                                                         const std::string& mime_type,
                                                         std::uint64_t size) {
    auto bytes = read_file(path, size);
    if (bytes.is_error()) {
        return forward_error<UploadOutcome>(bytes);
    }
    const std::string encoded = base64_encode(bytes.value());
    const std::string filename = path.filename().string();

    CancellationToken never_cancelled;
    auto stored = with_retry(options_.retry, never_cancelled, "direct upload of " + filename, [&]() {
        return transport_.upload_small(filename, mime_type, encoded);
    });
    if (stored.is_error()) {
        return forward_error<UploadOutcome>(stored);
    }

    spdlog::info("[Orchestrator] Stored {} directly as {}", filename, stored.value().file_id);
    UploadOutcome outcome;
    outcome.file_id = stored.value().file_id;
    outcome.url = stored.value().url;
    outcome.direct = true;
    return Ok(std::move(outcome));
}

Result<UploadOutcome> TransferOrchestrator::resume(const std::string& session_token) {
    if (journal_ == nullptr) {
        return Err<UploadOutcome>(ErrorCode::InvalidArgument, "resume needs a session journal");
    }
    auto found = journal_->find(session_token);
    if (!found) {
        return Err<UploadOutcome>(ErrorCode::SessionNotFound, session_token + " is not in the local journal");
    }
    JournalEntry entry = *found;

    std::error_code ec;
    const auto size = fs::file_size(entry.source_path, ec);
    if (ec || size != entry.file_size) {
        return Err<UploadOutcome>(ErrorCode::InvalidArgument,
                                  entry.source_path.string() + " is missing or changed since the upload started");
    }

    auto handle = registry_.acquire(session_token);
    auto remote = with_retry(options_.retry, *handle, "status of " + session_token, [&]() {
        return transport_.session_status(session_token, handle.get());
    });
    if (remote.is_error()) {
        if (remote.error().code != ErrorCode::Cancelled) {
            entry.state = TransferState::Failed;
            entry.last_error = remote.error().message;
            record(entry, *handle);
            registry_.release(session_token);
        }
        return forward_error<UploadOutcome>(remote);
    }

    const RemoteSession& session = remote.value();
    if (session.status == "failed" || session.status == "expired") {
        entry.state = TransferState::Failed;
        entry.last_error = "server reports the session " + session.status;
        record(entry, *handle);
        registry_.release(session_token);
        return Err<UploadOutcome>(session.status == "expired" ? ErrorCode::SessionExpired : ErrorCode::SessionTerminal,
                                  entry.last_error);
    }

    // The server's chunk size is authoritative for the index math
    entry.chunk_size = session.chunk_size;
    entry.total_chunks = session.total_chunks;
    entry.uploaded_chunks = static_cast<std::uint32_t>(session.uploaded_chunks.size());
    entry.state = TransferState::Uploading;
    entry.last_error.clear();

    spdlog::info("[Orchestrator] Resuming {}: server holds {}/{} chunks",
                 session_token, session.uploaded_chunks.size(), session.total_chunks);
    return run_transfer(std::move(entry), session.uploaded_chunks, handle);
}

std::vector<std::pair<std::string, Result<UploadOutcome>>> TransferOrchestrator::resume_all() {
    std::vector<std::pair<std::string, Result<UploadOutcome>>> results;
    if (journal_ == nullptr) {
        return results;
    }
    for (const auto& entry : journal_->entries()) {
        if (entry.state == TransferState::Completed) {
            continue;
        }
        std::error_code ec;
        if (!fs::exists(entry.source_path, ec)) {
            spdlog::warn("[Orchestrator] Skipping {}: {} no longer exists",
                         entry.session_token, entry.source_path.string());
            continue;
        }
        results.emplace_back(entry.session_token, resume(entry.session_token));
    }
    return results;
}

Result<UploadOutcome> TransferOrchestrator::run_transfer(JournalEntry entry,
                                                         const std::set<std::uint32_t>& uploaded,
                                                         const CancellationHandle& cancel) {
    const std::string token = entry.session_token;

    std::vector<std::uint32_t> missing;
    for (std::uint32_t index = 0; index < entry.total_chunks; ++index) {
        if (uploaded.count(index) == 0) {
            missing.push_back(index);
        }
    }

    auto sent = upload_missing(entry, std::move(missing), static_cast<std::uint32_t>(uploaded.size()), *cancel);
    if (sent.is_error()) {
        if (sent.error().code != ErrorCode::Cancelled) {
            entry.state = TransferState::Failed;
            entry.last_error = sent.error().message;
            record(entry, *cancel);
            registry_.release(token);
            spdlog::error("[Orchestrator] Upload {} failed: {}", token, sent.error().message);
        }
        return Err<UploadOutcome, Error>(sent.error());
    }

    auto file = with_retry(options_.retry, *cancel, "finalize " + token, [&]() {
        return transport_.finalize(token, cancel.get());
    });
    if (file.is_error()) {
        if (file.error().code != ErrorCode::Cancelled) {
            entry.state = TransferState::Failed;
            entry.last_error = file.error().message;
            record(entry, *cancel);
            registry_.release(token);
        }
        return forward_error<UploadOutcome>(file);
    }

    {
        std::lock_guard lock(state_mutex_);
        if (journal_ != nullptr) {
            auto removed = journal_->remove(token);
            if (removed.is_error()) {
                spdlog::warn("[Orchestrator] Journal cleanup for {} failed: {}", token, removed.error().message);
            }
        }
    }
    registry_.release(token);

    spdlog::info("[Orchestrator] Upload {} finalized as {}", token, file.value().file_id);
    UploadOutcome outcome;
    outcome.session_token = token;
    outcome.file_id = file.value().file_id;
    outcome.url = file.value().url;
    return Ok(std::move(outcome));
}

Result<void> TransferOrchestrator::upload_missing(const JournalEntry& entry,
                                                  std::vector<std::uint32_t> missing,
                                                  std::uint32_t already_uploaded,
                                                  CancellationToken& cancel) {
    if (missing.empty()) {
        return Ok();
    }

    WorkQueue<std::uint32_t> pending;
    for (auto index : missing) {
        pending.push(index);
    }
    pending.close();

    std::atomic<bool> stop{false};
    std::mutex error_mutex;
    std::optional<Error> failure;
    std::atomic<std::uint32_t> uploaded{already_uploaded};

    auto fail = [&](const Error& error) {
        std::lock_guard lock(error_mutex);
        if (!failure) {
            failure = error;
        }
        stop = true;
    };

    auto worker = [&]() {
        std::ifstream input(entry.source_path, std::ios::binary);
        if (!input) {
            fail(Error{ErrorCode::InvalidArgument, "cannot open " + entry.source_path.string()});
            return;
        }

        while (!stop && !cancel.is_cancelled()) {
            auto index = pending.try_pop();
            if (!index) {
                return;
            }

            auto bytes = read_chunk(input, entry, *index);
            if (bytes.is_error()) {
                fail(bytes.error());
                return;
            }

            const std::string what = "chunk " + std::to_string(*index) + " of " + entry.session_token;
            auto ack = with_retry(options_.retry, cancel, what, [&]() {
                return transport_.upload_chunk(entry.session_token, *index, bytes.value(), &cancel);
            });
            if (ack.is_error()) {
                if (ack.error().code != ErrorCode::Cancelled) {
                    fail(ack.error());
                }
                return;
            }

            const auto done = ++uploaded;
            report(TransferProgress{entry.session_token,
                                    std::max(done, ack.value().uploaded_chunks),
                                    entry.total_chunks,
                                    ack.value().uploaded_bytes});
        }
    };

    const std::size_t worker_count = std::min(options_.concurrency, missing.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    if (failure) {
        return Err<void, Error>(*failure);
    }
    if (cancel.is_cancelled()) {
        return Err<void>(ErrorCode::Cancelled, "upload " + entry.session_token + " cancelled");
    }
    return Ok();
}

Result<void> TransferOrchestrator::cancel(const std::string& session_token) {
    {
        std::lock_guard lock(state_mutex_);
        const bool was_running = registry_.cancel(session_token);
        if (journal_ != nullptr) {
            auto removed = journal_->remove(session_token);
            if (removed.is_error()) {
                spdlog::warn("[Orchestrator] Journal cleanup for {} failed: {}", session_token, removed.error().message);
            }
        }
        spdlog::info("[Orchestrator] Cancelled {}{}", session_token, was_running ? " (in flight)" : "");
    }

    auto remote = transport_.cancel_session(session_token);
    if (remote.is_error()) {
        spdlog::warn("[Orchestrator] Server cancel of {} failed: {}", session_token, remote.error().message);
    }
    return Ok();
}

std::size_t TransferOrchestrator::cancel_all() {
    std::set<std::string> tokens;
    for (const auto& token : registry_.tokens()) {
        tokens.insert(token);
    }
    if (journal_ != nullptr) {
        for (const auto& entry : journal_->entries()) {
            tokens.insert(entry.session_token);
        }
    }
    for (const auto& token : tokens) {
        auto cancelled = cancel(token);
        if (cancelled.is_error()) {
            spdlog::warn("[Orchestrator] Cancel of {} failed: {}", token, cancelled.error().message);
        }
    }
    return tokens.size();
}

} // namespace rms::client
