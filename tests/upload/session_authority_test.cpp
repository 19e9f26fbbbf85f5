#include "rms/events/components.hpp"
#include "rms/events/event_bus.hpp"
#include "rms/events/events.hpp"
#include "rms/storage/chunk_store.hpp"
#include "rms/storage/memory_blob_store.hpp"
#include "rms/upload/file_catalog.hpp"
#include "rms/upload/finalizer.hpp"
#include "rms/upload/session_authority.hpp"
#include "rms/upload/session_repository.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using rms::ErrorCode;
using rms::events::EventBus;
using rms::events::FileDeletedEvent;
using rms::events::MetricsComponent;
using rms::storage::ChunkStore;
using rms::storage::MemoryBlobStore;
using rms::upload::AuthorityOptions;
using rms::upload::CreateSessionRequest;
using rms::upload::FileCatalog;
using rms::upload::Finalizer;
using rms::upload::FinalizerOptions;
using rms::upload::SessionAuthority;
using rms::upload::SessionRepository;
using rms::upload::SessionStatus;
using rms::upload::StorageMode;
using rms::upload::TimePoint;

namespace {

std::vector<std::uint8_t> filled(std::size_t size, std::uint8_t value) {
    return std::vector<std::uint8_t>(size, value);
}

class SessionAuthorityTest : public ::testing::Test {
protected:
    static constexpr std::uint64_t kChunk = 4;

    SessionAuthorityTest()
        : chunks_(blobs_),
          finalizer_(chunks_, FinalizerOptions{32, ""}),
          metrics_(bus_),
          authority_(chunks_, finalizer_, catalog_, bus_, options(), nullptr,
                     [this]() {
                         std::lock_guard lock(clock_mutex_);
                         return now_;
                     }) {}

    static AuthorityOptions options() {
        AuthorityOptions opts;
        opts.default_chunk_size = kChunk;
        opts.min_chunk_size = 1;
        opts.max_chunk_size = 1024;
        return opts;
    }

    void advance(std::chrono::seconds by) {
        std::lock_guard lock(clock_mutex_);
        now_ += by;
    }

    std::string create(std::int64_t size, const std::string& owner = "alice") {
        CreateSessionRequest request;
        request.owner_id = owner;
        request.filename = "clip.mp4";
        request.mime_type = "video/mp4";
        request.total_size = size;
        auto handle = authority_.create_session(request);
        EXPECT_TRUE(handle.is_ok());
        return handle.is_ok() ? handle.value().session_token : std::string{};
    }

    /// Upload every chunk of a session whose bytes are chunk-index valued.
    void upload_all(const std::string& token, std::uint64_t size) {
        const auto count = rms::upload::total_chunks(size, kChunk);
        for (std::uint32_t i = 0; i < count; ++i) {
            auto len = rms::upload::chunk_length(size, kChunk, i);
            auto receipt = authority_.accept_chunk("alice", token, i, filled(len, static_cast<std::uint8_t>('a' + i)));
            ASSERT_TRUE(receipt.is_ok()) << receipt.error().message;
        }
    }

    MemoryBlobStore blobs_;
    ChunkStore chunks_;
    Finalizer finalizer_;
    FileCatalog catalog_;
    EventBus bus_;
    MetricsComponent metrics_;
    std::mutex clock_mutex_;
    TimePoint now_{std::chrono::seconds(1700000000)};
    SessionAuthority authority_;
};

} // namespace

TEST_F(SessionAuthorityTest, CreateComputesChunkLayout) {
    CreateSessionRequest request;
    request.owner_id = "alice";
    request.filename = "movie.mp4";
    request.total_size = 10;

    auto handle = authority_.create_session(request);
    ASSERT_TRUE(handle.is_ok());
    EXPECT_EQ(handle.value().chunk_size, kChunk);
    EXPECT_EQ(handle.value().total_chunks, 3u);
    EXPECT_FALSE(handle.value().session_token.empty());

    auto status = authority_.status("alice", handle.value().session_token);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().status, SessionStatus::Active);
    EXPECT_EQ(status.value().mime_type, "application/octet-stream");
    EXPECT_EQ(metrics_.get_stats().sessions_created.load(), 1u);
}

TEST_F(SessionAuthorityTest, CreateRejectsBadInput) {
    CreateSessionRequest request;
    request.owner_id = "alice";
    request.filename = "x";

    request.total_size = 0;
    EXPECT_EQ(authority_.create_session(request).error().code, ErrorCode::InvalidSize);

    request.total_size = -5;
    EXPECT_EQ(authority_.create_session(request).error().code, ErrorCode::InvalidSize);

    request.total_size = 10;
    request.chunk_size = 4096;
    EXPECT_EQ(authority_.create_session(request).error().code, ErrorCode::InvalidArgument);

    request.chunk_size = 0;
    request.owner_id.clear();
    EXPECT_EQ(authority_.create_session(request).error().code, ErrorCode::InvalidArgument);

    EXPECT_EQ(authority_.session_count(), 0u);
}

TEST_F(SessionAuthorityTest, AcceptChunkValidatesIndexAndLength) {
    auto token = create(10);

    auto out_of_range = authority_.accept_chunk("alice", token, 3, filled(2, 1));
    ASSERT_TRUE(out_of_range.is_error());
    EXPECT_EQ(out_of_range.error().code, ErrorCode::IndexOutOfRange);

    auto short_chunk = authority_.accept_chunk("alice", token, 0, filled(3, 1));
    ASSERT_TRUE(short_chunk.is_error());
    EXPECT_EQ(short_chunk.error().code, ErrorCode::InvalidSize);

    // Last chunk carries the remainder
    auto last = authority_.accept_chunk("alice", token, 2, filled(2, 1));
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(last.value().uploaded_chunks, 1u);
    EXPECT_EQ(last.value().uploaded_bytes, 2u);

    auto unknown = authority_.accept_chunk("alice", "missing", 0, filled(4, 1));
    EXPECT_EQ(unknown.error().code, ErrorCode::SessionNotFound);
}

TEST_F(SessionAuthorityTest, OtherOwnersSeeNothing) {
    auto token = create(10);

    EXPECT_EQ(authority_.status("mallory", token).error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(authority_.accept_chunk("mallory", token, 0, filled(4, 1)).error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(authority_.cancel("mallory", token).error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(authority_.finalize("mallory", token).error().code, ErrorCode::SessionNotFound);
    EXPECT_TRUE(authority_.list_active("mallory").empty());
}

TEST_F(SessionAuthorityTest, DuplicateChunkIsIdempotent) {
    auto token = create(10);

    auto first = authority_.accept_chunk("alice", token, 0, filled(4, 'x'));
    ASSERT_TRUE(first.is_ok());
    EXPECT_FALSE(first.value().duplicate);

    auto retry = authority_.accept_chunk("alice", token, 0, filled(4, 'x'));
    ASSERT_TRUE(retry.is_ok());
    EXPECT_TRUE(retry.value().duplicate);
    EXPECT_EQ(retry.value().uploaded_chunks, 1u);

    auto conflicting = authority_.accept_chunk("alice", token, 0, filled(2, 'x'));
    ASSERT_TRUE(conflicting.is_error());
    EXPECT_EQ(conflicting.error().code, ErrorCode::Conflict);

    EXPECT_EQ(metrics_.get_stats().chunks_accepted.load(), 1u);
    EXPECT_EQ(metrics_.get_stats().duplicate_chunks.load(), 1u);
}

TEST_F(SessionAuthorityTest, ConcurrentUploadsOfSameIndexCountOnce) {
    auto token = create(40);

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (authority_.accept_chunk("alice", token, 5, filled(4, 'z')).is_ok()) {
                ok++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(ok, 8);
    auto status = authority_.status("alice", token);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().uploaded_chunks, (std::set<std::uint32_t>{5}));
    EXPECT_EQ(chunks_.get(token, 5).value(), filled(4, 'z'));
}

TEST_F(SessionAuthorityTest, ConcurrentUploadsOfDifferentIndices) {
    const std::uint64_t size = 4 * 64;
    auto token = create(static_cast<std::int64_t>(size));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (std::uint32_t i = static_cast<std::uint32_t>(t); i < 64; i += 4) {
                EXPECT_TRUE(authority_.accept_chunk("alice", token, i, filled(4, 1)).is_ok());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto status = authority_.status("alice", token);
    ASSERT_TRUE(status.is_ok());
    EXPECT_TRUE(status.value().is_complete());
    EXPECT_EQ(status.value().uploaded_bytes(), size);
}

TEST_F(SessionAuthorityTest, FinalizeRequiresEveryChunk) {
    auto token = create(10);
    ASSERT_TRUE(authority_.accept_chunk("alice", token, 0, filled(4, 1)).is_ok());
    ASSERT_TRUE(authority_.accept_chunk("alice", token, 2, filled(2, 1)).is_ok());

    auto result = authority_.finalize("alice", token);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::IncompleteUpload);
    EXPECT_EQ(authority_.status("alice", token).value().status, SessionStatus::Active);
}

TEST_F(SessionAuthorityTest, FinalizeSmallFileAssemblesDirectBlob) {
    auto token = create(10);
    upload_all(token, 10);

    auto result = authority_.finalize("alice", token);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const auto& file = result.value();
    EXPECT_EQ(file.storage_mode, StorageMode::Direct);
    EXPECT_EQ(file.file_size, 10u);
    EXPECT_EQ(file.url, "/files/direct/" + file.id);

    auto blob = blobs_.get(file.storage_key);
    ASSERT_TRUE(blob.is_ok());
    const std::vector<std::uint8_t> expected{'a', 'a', 'a', 'a', 'b', 'b', 'b', 'b', 'c', 'c'};
    EXPECT_EQ(blob.value(), expected);

    EXPECT_FALSE(chunks_.has(token, 0));
    EXPECT_TRUE(catalog_.find(file.id).has_value());

    auto status = authority_.status("alice", token).value();
    EXPECT_EQ(status.status, SessionStatus::Completed);
    EXPECT_EQ(status.result_file_id, file.id);
}

TEST_F(SessionAuthorityTest, FinalizeLargeFileKeepsChunks) {
    auto token = create(33);   // threshold is 32 bytes
    upload_all(token, 33);

    auto result = authority_.finalize("alice", token);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().storage_mode, StorageMode::Streamed);
    EXPECT_EQ(result.value().url, "/files/stream/" + token);
    EXPECT_EQ(result.value().session_token, token);
    EXPECT_TRUE(chunks_.has(token, 8));

    auto by_session = catalog_.find_by_session(token);
    ASSERT_TRUE(by_session.has_value());
    EXPECT_EQ(by_session->id, result.value().id);
    EXPECT_EQ(metrics_.get_stats().uploads_streamed.load(), 1u);
}

TEST_F(SessionAuthorityTest, FinalizeIsIdempotent) {
    auto token = create(10);
    upload_all(token, 10);

    auto first = authority_.finalize("alice", token);
    auto second = authority_.finalize("alice", token);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().id, second.value().id);
    EXPECT_EQ(first.value().url, second.value().url);
    EXPECT_EQ(catalog_.size(), 1u);
}

TEST_F(SessionAuthorityTest, ConcurrentFinalizeRunsOnce) {
    auto token = create(20);
    upload_all(token, 20);

    std::mutex ids_mutex;
    std::set<std::string> ids;
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&]() {
            auto result = authority_.finalize("alice", token);
            ASSERT_TRUE(result.is_ok());
            std::lock_guard lock(ids_mutex);
            ids.insert(result.value().id);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(ids.size(), 1u);
    EXPECT_EQ(metrics_.get_stats().uploads_direct.load(), 1u);
    EXPECT_EQ(catalog_.size(), 1u);
}

TEST_F(SessionAuthorityTest, RetryAfterCompletionIsAcknowledged) {
    auto token = create(33);
    upload_all(token, 33);
    ASSERT_TRUE(authority_.finalize("alice", token).is_ok());

    auto late = authority_.accept_chunk("alice", token, 1, filled(4, 'b'));
    ASSERT_TRUE(late.is_ok());
    EXPECT_TRUE(late.value().duplicate);
}

TEST_F(SessionAuthorityTest, FailedReassemblyRestoresSession) {
    auto token = create(10);
    upload_all(token, 10);

    blobs_.fail_keys_containing("chunk-000001");
    auto failed = authority_.finalize("alice", token);
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::StorageFailure);
    EXPECT_EQ(authority_.status("alice", token).value().status, SessionStatus::Active);
    EXPECT_EQ(metrics_.get_stats().finalize_failures.load(), 1u);
    EXPECT_EQ(catalog_.size(), 0u);

    blobs_.clear_failures();
    auto retried = authority_.finalize("alice", token);
    ASSERT_TRUE(retried.is_ok());
    EXPECT_EQ(authority_.status("alice", token).value().status, SessionStatus::Completed);
}

TEST_F(SessionAuthorityTest, PauseIsAdvisory) {
    auto token = create(10);

    ASSERT_TRUE(authority_.pause("alice", token).is_ok());
    EXPECT_EQ(authority_.status("alice", token).value().status, SessionStatus::Paused);
    ASSERT_TRUE(authority_.pause("alice", token).is_ok());

    ASSERT_TRUE(authority_.accept_chunk("alice", token, 0, filled(4, 1)).is_ok());
    EXPECT_EQ(authority_.status("alice", token).value().status, SessionStatus::Active);
}

TEST_F(SessionAuthorityTest, CancelDeletesChunksAndBlocksUploads) {
    auto token = create(10);
    ASSERT_TRUE(authority_.accept_chunk("alice", token, 0, filled(4, 1)).is_ok());
    ASSERT_TRUE(authority_.save_thumbnail("alice", token, filled(8, 7)).is_ok());

    ASSERT_TRUE(authority_.cancel("alice", token).is_ok());
    EXPECT_FALSE(chunks_.has(token, 0));
    EXPECT_FALSE(blobs_.exists(SessionAuthority::thumbnail_key(token)));

    auto status = authority_.status("alice", token).value();
    EXPECT_EQ(status.status, SessionStatus::Failed);
    EXPECT_EQ(status.last_error, "cancelled");

    auto upload = authority_.accept_chunk("alice", token, 1, filled(4, 1));
    ASSERT_TRUE(upload.is_error());
    EXPECT_EQ(upload.error().code, ErrorCode::SessionTerminal);

    EXPECT_TRUE(authority_.cancel("alice", token).is_ok());
    EXPECT_EQ(metrics_.get_stats().sessions_cancelled.load(), 1u);
    EXPECT_EQ(authority_.finalize("alice", token).error().code, ErrorCode::SessionTerminal);
}

TEST_F(SessionAuthorityTest, CancelAfterCompletionKeepsFile) {
    auto token = create(33);
    upload_all(token, 33);
    ASSERT_TRUE(authority_.finalize("alice", token).is_ok());

    ASSERT_TRUE(authority_.cancel("alice", token).is_ok());
    EXPECT_EQ(authority_.status("alice", token).value().status, SessionStatus::Completed);
    EXPECT_TRUE(chunks_.has(token, 0));
}

TEST_F(SessionAuthorityTest, ExpireStalledOnlyTouchesIdleOpenSessions) {
    auto stale = create(10);
    ASSERT_TRUE(authority_.accept_chunk("alice", stale, 0, filled(4, 1)).is_ok());
    auto done = create(10);
    upload_all(done, 10);
    ASSERT_TRUE(authority_.finalize("alice", done).is_ok());

    advance(std::chrono::hours(20));
    auto fresh = create(10);
    advance(std::chrono::hours(5));

    auto expired = authority_.expire_stalled(authority_.now() - std::chrono::hours(24));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired.front(), stale);

    EXPECT_EQ(authority_.status("alice", stale).value().status, SessionStatus::Expired);
    EXPECT_FALSE(chunks_.has(stale, 0));
    EXPECT_EQ(authority_.status("alice", fresh).value().status, SessionStatus::Active);
    EXPECT_EQ(authority_.status("alice", done).value().status, SessionStatus::Completed);

    auto upload = authority_.accept_chunk("alice", stale, 1, filled(4, 1));
    ASSERT_TRUE(upload.is_error());
    EXPECT_EQ(upload.error().code, ErrorCode::SessionExpired);
}

TEST_F(SessionAuthorityTest, ListActiveIsScopedAndOrdered) {
    auto first = create(10);
    advance(std::chrono::seconds(1));
    auto second = create(10);
    advance(std::chrono::seconds(1));
    create(10, "bob");
    auto cancelled = create(10);
    ASSERT_TRUE(authority_.cancel("alice", cancelled).is_ok());

    auto sessions = authority_.list_active("alice");
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].session_token, first);
    EXPECT_EQ(sessions[1].session_token, second);
}

TEST_F(SessionAuthorityTest, ThumbnailIsStoredBesideSession) {
    auto token = create(10);

    EXPECT_EQ(authority_.save_thumbnail("alice", token, {}).error().code, ErrorCode::InvalidArgument);
    ASSERT_TRUE(authority_.save_thumbnail("alice", token, filled(16, 9)).is_ok());

    EXPECT_EQ(blobs_.get(SessionAuthority::thumbnail_key(token)).value(), filled(16, 9));
    EXPECT_TRUE(authority_.status("alice", token).value().has_thumbnail);
}

TEST_F(SessionAuthorityTest, EvictTerminalForgetsOnlyOldFinishedSessions) {
    auto done = create(10);
    upload_all(done, 10);
    auto file_id = authority_.finalize("alice", done).value().id;
    auto cancelled = create(10);
    ASSERT_TRUE(authority_.cancel("alice", cancelled).is_ok());

    advance(std::chrono::hours(2));
    auto open = create(10);
    auto recent = create(10);
    ASSERT_TRUE(authority_.cancel("alice", recent).is_ok());
    EXPECT_EQ(authority_.session_count(), 4u);

    auto evicted = authority_.evict_terminal(now_ - std::chrono::hours(1));
    EXPECT_EQ(std::set<std::string>(evicted.begin(), evicted.end()), (std::set<std::string>{done, cancelled}));
    EXPECT_EQ(authority_.session_count(), 2u);

    EXPECT_EQ(authority_.status("alice", done).error().code, ErrorCode::SessionNotFound);
    EXPECT_TRUE(authority_.status("alice", open).is_ok());
    EXPECT_TRUE(authority_.status("alice", recent).is_ok());
    EXPECT_TRUE(catalog_.find(file_id).has_value());
    EXPECT_TRUE(authority_.evict_terminal(now_ - std::chrono::hours(1)).empty());
}

TEST_F(SessionAuthorityTest, DeleteDirectFileRemovesBlobAndEntry) {
    auto token = create(10);
    upload_all(token, 10);
    auto file = authority_.finalize("alice", token).value();

    std::vector<FileDeletedEvent> deleted;
    bus_.subscribe<FileDeletedEvent>([&deleted](const FileDeletedEvent& e) { deleted.push_back(e); });

    EXPECT_EQ(authority_.delete_file("bob", file.id).error().code, ErrorCode::SessionNotFound);
    EXPECT_TRUE(catalog_.find(file.id).has_value());
    EXPECT_TRUE(blobs_.exists(file.storage_key));

    ASSERT_TRUE(authority_.delete_file("alice", file.id).is_ok());
    EXPECT_FALSE(catalog_.find(file.id).has_value());
    EXPECT_FALSE(blobs_.exists(file.storage_key));
    ASSERT_EQ(deleted.size(), 1u);
    EXPECT_EQ(deleted[0].file_id, file.id);
    EXPECT_EQ(deleted[0].blobs_removed, 1u);
    EXPECT_EQ(metrics_.get_stats().files_deleted.load(), 1u);

    EXPECT_EQ(authority_.delete_file("alice", file.id).error().code, ErrorCode::SessionNotFound);
}

TEST_F(SessionAuthorityTest, DeleteStreamedFileRemovesChunksAndSession) {
    auto token = create(33);
    ASSERT_TRUE(authority_.save_thumbnail("alice", token, filled(8, 9)).is_ok());
    upload_all(token, 33);
    auto file = authority_.finalize("alice", token).value();
    ASSERT_EQ(file.storage_mode, StorageMode::Streamed);

    std::vector<FileDeletedEvent> deleted;
    bus_.subscribe<FileDeletedEvent>([&deleted](const FileDeletedEvent& e) { deleted.push_back(e); });

    ASSERT_TRUE(authority_.delete_file("alice", file.id).is_ok());
    for (std::uint32_t i = 0; i < 9; ++i) {
        EXPECT_FALSE(chunks_.has(token, i));
    }
    EXPECT_FALSE(blobs_.exists(SessionAuthority::thumbnail_key(token)));
    EXPECT_FALSE(catalog_.find_by_session(token).has_value());
    EXPECT_EQ(authority_.status("alice", token).error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(authority_.session_count(), 0u);
    ASSERT_EQ(deleted.size(), 1u);
    EXPECT_EQ(deleted[0].blobs_removed, 10u);   // nine chunks and the thumbnail
}

TEST(SessionAuthorityPersistenceTest, ReloadRestoresSessions) {
    MemoryBlobStore blobs;
    MemoryBlobStore metadata;
    ChunkStore chunks(blobs);
    Finalizer finalizer(chunks, FinalizerOptions{});
    FileCatalog catalog;
    EventBus bus;
    SessionRepository repository(metadata);

    AuthorityOptions options;
    options.default_chunk_size = 4;
    options.min_chunk_size = 1;

    std::string token;
    {
        SessionAuthority authority(chunks, finalizer, catalog, bus, options, &repository);
        CreateSessionRequest request;
        request.owner_id = "alice";
        request.filename = "a.bin";
        request.total_size = 10;
        token = authority.create_session(request).value().session_token;
        ASSERT_TRUE(authority.accept_chunk("alice", token, 1, filled(4, 1)).is_ok());
    }

    SessionAuthority restored(chunks, finalizer, catalog, bus, options, &repository);
    auto loaded = restored.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value(), 1u);

    auto status = restored.status("alice", token);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().uploaded_chunks, (std::set<std::uint32_t>{1}));
    EXPECT_EQ(status.value().total_chunks, 3u);
}

TEST(SessionAuthorityPersistenceTest, InterruptedFinalizeComesBackActive) {
    MemoryBlobStore blobs;
    ChunkStore chunks(blobs);
    Finalizer finalizer(chunks, FinalizerOptions{});
    FileCatalog catalog;
    EventBus bus;
    SessionRepository repository(blobs);

    rms::upload::UploadSession info;
    info.session_token = "stuck";
    info.owner_id = "alice";
    info.filename = "a.bin";
    info.total_size = 8;
    info.chunk_size = 4;
    info.uploaded_chunks = {0, 1, 7};   // 7 is out of range and dropped
    info.status = SessionStatus::Finalizing;
    ASSERT_TRUE(repository.save(info).is_ok());
    ASSERT_TRUE(chunks.put("stuck", 0, filled(4, 1)).is_ok());
    ASSERT_TRUE(chunks.put("stuck", 1, filled(4, 2)).is_ok());

    SessionAuthority authority(chunks, finalizer, catalog, bus, AuthorityOptions{}, &repository);
    ASSERT_TRUE(authority.load().is_ok());

    auto status = authority.status("alice", "stuck");
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().status, SessionStatus::Active);
    EXPECT_EQ(status.value().uploaded_chunks, (std::set<std::uint32_t>{0, 1}));
}

TEST(SessionAuthorityPersistenceTest, CrashAfterAssemblyLeavesChunksToFinalizeAgain) {
    MemoryBlobStore blobs;
    MemoryBlobStore metadata;
    ChunkStore chunks(blobs);
    Finalizer finalizer(chunks, FinalizerOptions{});
    FileCatalog catalog;
    EventBus bus;
    SessionRepository repository(metadata);

    rms::upload::UploadSession info;
    info.session_token = "crashed";
    info.owner_id = "alice";
    info.filename = "a.bin";
    info.total_size = 8;
    info.chunk_size = 4;
    info.total_chunks = 2;
    info.uploaded_chunks = {0, 1};
    info.status = SessionStatus::Finalizing;
    ASSERT_TRUE(chunks.put("crashed", 0, filled(4, 'x')).is_ok());
    ASSERT_TRUE(chunks.put("crashed", 1, filled(4, 'y')).is_ok());
    ASSERT_TRUE(repository.save(info).is_ok());

    // The process dies after the blob is assembled, before completed is recorded.
    ASSERT_TRUE(finalizer.finalize(info, TimePoint(std::chrono::seconds(1700000000))).is_ok());
    EXPECT_TRUE(chunks.has("crashed", 0));
    EXPECT_TRUE(chunks.has("crashed", 1));

    SessionAuthority authority(chunks, finalizer, catalog, bus, AuthorityOptions{}, &repository);
    ASSERT_TRUE(authority.load().is_ok());
    auto status = authority.status("alice", "crashed").value();
    EXPECT_EQ(status.status, SessionStatus::Active);
    EXPECT_EQ(status.uploaded_chunks, (std::set<std::uint32_t>{0, 1}));

    auto file = authority.finalize("alice", "crashed");
    ASSERT_TRUE(file.is_ok()) << file.error().message;
    const std::vector<std::uint8_t> expected{'x', 'x', 'x', 'x', 'y', 'y', 'y', 'y'};
    EXPECT_EQ(blobs.get(file.value().storage_key).value(), expected);
    EXPECT_FALSE(chunks.has("crashed", 0));
    EXPECT_EQ(authority.status("alice", "crashed").value().status, SessionStatus::Completed);
}

TEST(SessionAuthorityPersistenceTest, ChunksLostFromStorageAreRequestedAgain) {
    MemoryBlobStore blobs;
    MemoryBlobStore metadata;
    ChunkStore chunks(blobs);
    Finalizer finalizer(chunks, FinalizerOptions{});
    FileCatalog catalog;
    EventBus bus;
    SessionRepository repository(metadata);

    rms::upload::UploadSession info;
    info.session_token = "partial";
    info.owner_id = "alice";
    info.filename = "a.bin";
    info.total_size = 12;
    info.chunk_size = 4;
    info.uploaded_chunks = {0, 1, 2};
    ASSERT_TRUE(repository.save(info).is_ok());
    ASSERT_TRUE(chunks.put("partial", 1, filled(4, 1)).is_ok());

    {
        SessionAuthority authority(chunks, finalizer, catalog, bus, AuthorityOptions{}, &repository);
        ASSERT_TRUE(authority.load().is_ok());
        EXPECT_EQ(authority.status("alice", "partial").value().uploaded_chunks, (std::set<std::uint32_t>{1}));
        EXPECT_EQ(authority.finalize("alice", "partial").error().code, ErrorCode::IncompleteUpload);
    }

    // The corrected record was written back.
    auto saved = repository.load_all().value();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0].uploaded_chunks, (std::set<std::uint32_t>{1}));
}

TEST(SessionAuthorityPersistenceTest, CompletedSessionReleasesLeftoverChunksOnLoad) {
    MemoryBlobStore blobs;
    MemoryBlobStore metadata;
    ChunkStore chunks(blobs);
    Finalizer finalizer(chunks, FinalizerOptions{});
    FileCatalog catalog;
    EventBus bus;
    SessionRepository repository(metadata);

    rms::upload::UploadSession info;
    info.session_token = "done";
    info.owner_id = "alice";
    info.filename = "a.bin";
    info.total_size = 8;
    info.chunk_size = 4;
    info.uploaded_chunks = {0, 1};
    info.status = SessionStatus::Completed;
    info.result_file_id = "file-1";
    ASSERT_TRUE(repository.save(info).is_ok());
    ASSERT_TRUE(chunks.put("done", 0, filled(4, 1)).is_ok());
    ASSERT_TRUE(chunks.put("done", 1, filled(4, 1)).is_ok());

    SessionAuthority authority(chunks, finalizer, catalog, bus, AuthorityOptions{}, &repository);
    ASSERT_TRUE(authority.load().is_ok());
    EXPECT_FALSE(chunks.has("done", 0));
    EXPECT_FALSE(chunks.has("done", 1));
    EXPECT_EQ(authority.status("alice", "done").value().status, SessionStatus::Completed);
}
