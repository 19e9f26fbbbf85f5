#include "rms/upload/background_assembler.hpp"

#include "rms/events/events.hpp"
#include "rms/upload/finalizer.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace rms::upload {

BackgroundAssembler::BackgroundAssembler(storage::ChunkStore& chunks,
                                         FileCatalog& catalog,
                                         events::EventBus& bus,
                                         AssemblerOptions options)
    : chunks_(chunks)
    , catalog_(catalog)
    , event_bus_(bus)
    , options_(std::move(options)) {
}

BackgroundAssembler::~BackgroundAssembler() {
    stop();
}

void BackgroundAssembler::start() {
    if (worker_.joinable() || queue_.closed()) {
        return;
    }
    subscription_ = event_bus_.subscribe<events::UploadFinalizedEvent>(
        [this](const events::UploadFinalizedEvent& e) {
            if (e.storage_mode == to_string(StorageMode::Streamed)) {
                schedule(e.file_id);
            }
        });
    worker_ = std::thread([this] { run(); });
    spdlog::info("[Assembler] Started, files up to {} bytes get a single-blob copy", options_.max_size);
}

void BackgroundAssembler::stop() {
    if (!worker_.joinable()) {
        return;
    }
    event_bus_.unsubscribe<events::UploadFinalizedEvent>(subscription_);
    stopping_ = true;
    queue_.close();
    worker_.join();
    spdlog::info("[Assembler] Stopped");
}

bool BackgroundAssembler::eligible(const FinalizedFile& file) const {
    return file.storage_mode == StorageMode::Streamed &&
           !file.is_assembled() &&
           file.chunk_size > 0 &&
           file.file_size <= options_.max_size;
}

bool BackgroundAssembler::schedule(const std::string& file_id) {
    auto file = catalog_.find(file_id);
    if (!file || !eligible(*file)) {
        return false;
    }
    {
        std::lock_guard lock(mutex_);
        if (!active_.insert(file_id).second) {
            spdlog::debug("[Assembler] {} is already queued", file_id);
            return false;
        }
    }
    if (!queue_.push(file_id)) {
        std::lock_guard lock(mutex_);
        active_.erase(file_id);
        return false;
    }
    return true;
}

std::size_t BackgroundAssembler::scan_pending() {
    std::size_t queued = 0;
    for (const auto& file : catalog_.pending_assembly()) {
        if (file.file_size > options_.max_size) {
            spdlog::info("[Assembler] {} stays streamed ({} bytes over the limit)", file.id, file.file_size);
            continue;
        }
        if (schedule(file.id)) {
            ++queued;
        }
    }
    spdlog::info("[Assembler] {} streamed files queued for assembly", queued);
    return queued;
}

Result<FinalizedFile> BackgroundAssembler::assemble_now(const std::string& file_id) {
    auto file = catalog_.find(file_id);
    if (!file) {
        return Err<FinalizedFile>(ErrorCode::SessionNotFound, "Unknown file: " + file_id);
    }
    if (!eligible(*file)) {
        return Err<FinalizedFile>(ErrorCode::InvalidArgument, "File " + file_id + " has nothing to assemble");
    }
    {
        std::lock_guard lock(mutex_);
        if (!active_.insert(file_id).second) {
            return Err<FinalizedFile>(ErrorCode::Conflict, "File " + file_id + " is already being assembled");
        }
    }
    auto result = assemble(*file);
    std::lock_guard lock(mutex_);
    active_.erase(file_id);
    return result;
}

bool BackgroundAssembler::in_flight(const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    return active_.count(file_id) > 0;
}

void BackgroundAssembler::run() {
    while (auto file_id = queue_.pop()) {
        if (!stopping_) {
            // Re-read: the file may have been deleted or assembled since it was queued.
            auto file = catalog_.find(*file_id);
            if (file && eligible(*file)) {
                auto result = assemble(*file);
                if (result.is_error()) {
                    spdlog::warn("[Assembler] {} stays streamed: {}", *file_id, result.error().message);
                }
            }
        }
        std::lock_guard lock(mutex_);
        active_.erase(*file_id);
    }
}

Result<FinalizedFile> BackgroundAssembler::assemble(const FinalizedFile& file) {
    const auto started = std::chrono::steady_clock::now();
    const auto key = direct_file_key(file.owner_id, file.id, file.filename);

    auto fail = [this, &file](Error error) {
        event_bus_.emit(events::AssemblyFailedEvent{file.id, error.message});
        return Err<FinalizedFile, Error>(std::move(error));
    };

    auto writer_result = chunks_.blobs().open_writer(key);
    if (writer_result.is_error()) {
        return fail(writer_result.error());
    }
    auto& writer = *writer_result.value();

    const auto count = total_chunks(file.file_size, file.chunk_size);
    for (std::uint32_t index = 0; index < count; ++index) {
        if (stopping_) {
            writer.abort();
            return fail(Error{ErrorCode::Cancelled, "Assembler stopped"});
        }
        auto bytes = chunks_.get(file.session_token, index);
        if (bytes.is_error()) {
            writer.abort();
            return fail(Error{ErrorCode::StorageFailure,
                              "Reading chunk " + std::to_string(index) + " failed: " + bytes.error().message});
        }
        if (bytes.value().size() != chunk_length(file.file_size, file.chunk_size, index)) {
            writer.abort();
            return fail(Error{ErrorCode::StorageFailure, "Chunk " + std::to_string(index) + " has unexpected length"});
        }
        if (auto res = writer.write(bytes.value().data(), bytes.value().size()); res.is_error()) {
            writer.abort();
            return fail(res.error());
        }
        if ((index + 1) % 20 == 0) {
            spdlog::debug("[Assembler] {}: {}/{} chunks", file.id, index + 1, count);
        }
    }

    if (auto res = writer.commit(); res.is_error()) {
        return fail(res.error());
    }

    const auto url = direct_file_url(options_.public_base_url, file.id);
    if (auto res = catalog_.mark_assembled(file.id, key, url); res.is_error()) {
        // Deleted while we were copying; the copy has no owner.
        if (auto removed = chunks_.blobs().remove(key); removed.is_error()) {
            spdlog::error("[Assembler] Orphaned copy {} left behind: {}", key, removed.error().message);
        }
        return fail(res.error());
    }

    FinalizedFile assembled = file;
    assembled.assembled_key = key;
    assembled.assembled_url = url;

    events::FileAssembledEvent event;
    event.file_id = file.id;
    event.session_token = file.session_token;
    event.bytes = writer.bytes_written();
    event.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    event_bus_.emit(event);

    return Ok(std::move(assembled));
}

} // namespace rms::upload
