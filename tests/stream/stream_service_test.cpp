#include "rms/events/components.hpp"
#include "rms/storage/chunk_store.hpp"
#include "rms/storage/memory_blob_store.hpp"
#include "rms/stream/stream_service.hpp"
#include "rms/upload/finalizer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using rms::events::EventBus;
using rms::events::MetricsComponent;
using rms::network::HttpResponse;
using rms::storage::ChunkStore;
using rms::storage::MemoryBlobStore;
using rms::stream::StreamOptions;
using rms::stream::StreamRequest;
using rms::stream::StreamService;
using rms::upload::AuthorityOptions;
using rms::upload::CreateSessionRequest;
using rms::upload::FileCatalog;
using rms::upload::FinalizedFile;
using rms::upload::Finalizer;
using rms::upload::FinalizerOptions;
using rms::upload::SessionAuthority;
using rms::upload::StorageMode;

namespace {

constexpr std::uint64_t kChunk = 10;
constexpr std::uint64_t kSize = 45;

/// Byte i of the file is 'A' + i % 26.
std::vector<std::uint8_t> file_bytes(std::uint64_t from, std::uint64_t count) {
    std::vector<std::uint8_t> bytes;
    for (std::uint64_t i = from; i < from + count; ++i) {
        bytes.push_back(static_cast<std::uint8_t>('A' + i % 26));
    }
    return bytes;
}

/// Pull every block of a streamed body, the way the connection does.
std::vector<std::uint8_t> drain(const HttpResponse& response, bool& failed) {
    std::vector<std::uint8_t> body;
    failed = false;
    if (!response.body_source) {
        return response.body;
    }
    while (response.body_source->remaining() > 0) {
        auto block = response.body_source->next_block();
        if (block.is_error() || block.value().empty()) {
            failed = true;
            break;
        }
        body.insert(body.end(), block.value().begin(), block.value().end());
    }
    return body;
}

class StreamServiceTest : public ::testing::Test {
protected:
    StreamServiceTest()
        : chunks_(blobs_),
          metrics_(bus_) {
        for (std::uint32_t i = 0; i * kChunk < kSize; ++i) {
            const auto len = rms::upload::chunk_length(kSize, kChunk, i);
            EXPECT_TRUE(chunks_.put("movie", i, file_bytes(i * kChunk, len)).is_ok());
        }

        FinalizedFile streamed;
        streamed.id = "file-streamed";
        streamed.url = "/files/stream/movie";
        streamed.storage_mode = StorageMode::Streamed;
        streamed.mime_type = "video/mp4";
        streamed.file_size = kSize;
        streamed.filename = "movie night.mp4";
        streamed.owner_id = "alice";
        streamed.session_token = "movie";
        streamed.chunk_size = kChunk;
        streamed.total_chunks = 5;
        EXPECT_TRUE(catalog_.add(streamed).is_ok());

        FinalizedFile direct;
        direct.id = "file-direct";
        direct.url = "/files/direct/file-direct";
        direct.storage_mode = StorageMode::Direct;
        direct.mime_type = "text/plain";
        direct.file_size = 26;
        direct.filename = "abc.txt";
        direct.owner_id = "alice";
        direct.storage_key = "files/alice/file-direct-abc.txt";
        direct.session_token = "small";
        EXPECT_TRUE(blobs_.put(direct.storage_key, file_bytes(0, 26)).is_ok());
        EXPECT_TRUE(catalog_.add(direct).is_ok());
    }

    StreamService make_service(StreamOptions options = {}, const SessionAuthority* authority = nullptr) {
        return StreamService(chunks_, blobs_, catalog_, authority, bus_, options);
    }

    static StreamRequest range(const std::string& header) {
        StreamRequest request;
        request.range_header = header;
        return request;
    }

    MemoryBlobStore blobs_;
    ChunkStore chunks_;
    FileCatalog catalog_;
    EventBus bus_;
    MetricsComponent metrics_;
};

} // namespace

TEST_F(StreamServiceTest, WholeFileWithoutRange) {
    auto service = make_service();
    auto response = service.stream_session("movie", StreamRequest{});

    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.get_header("Content-Length"), "45");
    EXPECT_EQ(response.get_header("Accept-Ranges"), "bytes");
    EXPECT_EQ(response.get_header("Content-Type"), "video/mp4");
    EXPECT_EQ(response.get_header("Content-Disposition"), "inline; filename=\"movie%20night.mp4\"");
    EXPECT_TRUE(response.get_header("Content-Range").empty());

    bool failed = false;
    EXPECT_EQ(drain(response, failed), file_bytes(0, kSize));
    EXPECT_FALSE(failed);
    EXPECT_EQ(metrics_.get_stats().stream_bytes.load(), kSize);
}

TEST_F(StreamServiceTest, RangeAcrossChunkBoundaries) {
    auto service = make_service();
    auto response = service.stream_session("movie", range("bytes=7-23"));

    EXPECT_EQ(response.status_code, 206);
    EXPECT_EQ(response.get_header("Content-Range"), "bytes 7-23/45");
    EXPECT_EQ(response.get_header("Content-Length"), "17");

    bool failed = false;
    EXPECT_EQ(drain(response, failed), file_bytes(7, 17));
    EXPECT_FALSE(failed);
}

TEST_F(StreamServiceTest, RangeIntoShortLastChunk) {
    auto service = make_service();
    auto response = service.stream_session("movie", range("bytes=38-1000"));

    EXPECT_EQ(response.status_code, 206);
    EXPECT_EQ(response.get_header("Content-Range"), "bytes 38-44/45");

    bool failed = false;
    EXPECT_EQ(drain(response, failed), file_bytes(38, 7));
    EXPECT_FALSE(failed);
}

TEST_F(StreamServiceTest, SmallBlocksStillProduceExactBody) {
    StreamOptions options;
    options.block_size = 3;
    auto service = make_service(options);
    auto response = service.stream_session("movie", range("bytes=-12"));

    EXPECT_EQ(response.get_header("Content-Range"), "bytes 33-44/45");
    bool failed = false;
    EXPECT_EQ(drain(response, failed), file_bytes(33, 12));
    EXPECT_FALSE(failed);
}

TEST_F(StreamServiceTest, UnsatisfiableRange) {
    auto service = make_service();
    auto response = service.stream_session("movie", range("bytes=45-50"));

    EXPECT_EQ(response.status_code, 416);
    EXPECT_EQ(response.get_header("Content-Range"), "bytes */45");
    EXPECT_FALSE(response.is_streamed());
}

TEST_F(StreamServiceTest, HeadTouchesNoChunkData) {
    blobs_.fail_keys_containing("chunks/movie");
    auto service = make_service();

    StreamRequest request = range("bytes=0-9");
    request.head_only = true;
    auto response = service.stream_session("movie", request);

    EXPECT_EQ(response.status_code, 206);
    EXPECT_EQ(response.get_header("Content-Length"), "10");
    EXPECT_FALSE(response.is_streamed());
    EXPECT_TRUE(response.body.empty());
}

TEST_F(StreamServiceTest, DownloadUsesAttachment) {
    auto service = make_service();
    StreamRequest request;
    request.download = true;
    request.head_only = true;
    auto response = service.stream_session("movie", request);

    EXPECT_EQ(response.get_header("Content-Disposition").rfind("attachment;", 0), 0u);
}

TEST_F(StreamServiceTest, DirectFileSessionRedirects) {
    auto service = make_service();
    auto response = service.stream_session("small", StreamRequest{});

    EXPECT_EQ(response.status_code, 302);
    EXPECT_EQ(response.get_header("Location"), "/files/direct/file-direct");
}

TEST_F(StreamServiceTest, DirectFileServesRanges) {
    auto service = make_service();
    auto response = service.serve_direct("file-direct", range("bytes=2-5"));

    EXPECT_EQ(response.status_code, 206);
    EXPECT_EQ(response.get_header("Content-Range"), "bytes 2-5/26");
    bool failed = false;
    EXPECT_EQ(drain(response, failed), file_bytes(2, 4));

    auto missing = service.serve_direct("file-unknown", StreamRequest{});
    EXPECT_EQ(missing.status_code, 404);
}

TEST_F(StreamServiceTest, AssembledStreamedFileRedirectsToItsCopy) {
    const std::string copy_key = "files/alice/file-streamed-movie night.mp4";
    ASSERT_TRUE(blobs_.put(copy_key, file_bytes(0, kSize)).is_ok());
    ASSERT_TRUE(catalog_.mark_assembled("file-streamed", copy_key, "/files/direct/file-streamed").is_ok());
    auto service = make_service();

    auto redirect = service.stream_session("movie", range("bytes=0-9"));
    EXPECT_EQ(redirect.status_code, 302);
    EXPECT_EQ(redirect.get_header("Location"), "/files/direct/file-streamed");

    auto response = service.serve_direct("file-streamed", range("bytes=40-"));
    EXPECT_EQ(response.status_code, 206);
    EXPECT_EQ(response.get_header("Content-Range"), "bytes 40-44/45");
    bool failed = false;
    EXPECT_EQ(drain(response, failed), file_bytes(40, 5));
    EXPECT_TRUE(chunks_.has("movie", 4));
}

TEST_F(StreamServiceTest, UnassembledStreamedFileHasNoDirectUrl) {
    auto service = make_service();
    EXPECT_EQ(service.serve_direct("file-streamed", StreamRequest{}).status_code, 404);
}

TEST_F(StreamServiceTest, UnknownSessionIsNotFound) {
    auto service = make_service();
    auto response = service.stream_session("nobody", StreamRequest{});
    EXPECT_EQ(response.status_code, 404);
}

TEST_F(StreamServiceTest, MissingFirstChunkFailsBeforeHeaders) {
    ASSERT_TRUE(blobs_.remove(rms::storage::chunk_key("movie", 0)).is_ok());
    auto service = make_service();

    auto response = service.stream_session("movie", StreamRequest{});
    EXPECT_EQ(response.status_code, 500);
    EXPECT_FALSE(response.is_streamed());
}

TEST_F(StreamServiceTest, LaterChunkFailureAbortsBody) {
    blobs_.fail_keys_containing("chunk-000003");
    auto service = make_service();

    auto response = service.stream_session("movie", StreamRequest{});
    EXPECT_EQ(response.status_code, 200);

    bool failed = false;
    auto body = drain(response, failed);
    EXPECT_TRUE(failed);
    EXPECT_EQ(body.size(), 30u);  // chunks 0..2 made it out
}

TEST(StreamIncompleteSessionTest, OnlyUploadedRangesArePlayable) {
    MemoryBlobStore blobs;
    ChunkStore chunks(blobs);
    Finalizer finalizer(chunks, FinalizerOptions{});
    FileCatalog catalog;
    EventBus bus;

    AuthorityOptions authority_options;
    authority_options.min_chunk_size = 1;
    SessionAuthority authority(chunks, finalizer, catalog, bus, authority_options);

    CreateSessionRequest create;
    create.owner_id = "alice";
    create.filename = "live.mp4";
    create.mime_type = "video/mp4";
    create.total_size = 45;
    create.chunk_size = kChunk;
    auto token = authority.create_session(create).value().session_token;
    ASSERT_TRUE(authority.accept_chunk("alice", token, 0, file_bytes(0, 10)).is_ok());
    ASSERT_TRUE(authority.accept_chunk("alice", token, 1, file_bytes(10, 10)).is_ok());

    StreamOptions disabled;
    StreamService strict(chunks, blobs, catalog, &authority, bus, disabled);
    EXPECT_EQ(strict.stream_session(token, StreamRequest{}).status_code, 404);

    StreamOptions enabled;
    enabled.stream_incomplete_sessions = true;
    StreamService live(chunks, blobs, catalog, &authority, bus, enabled);

    StreamRequest covered;
    covered.range_header = "bytes=5-19";
    auto ok = live.stream_session(token, covered);
    EXPECT_EQ(ok.status_code, 206);
    bool failed = false;
    EXPECT_EQ(drain(ok, failed), file_bytes(5, 15));

    StreamRequest ahead;
    ahead.range_header = "bytes=15-25";
    auto pending = live.stream_session(token, ahead);
    EXPECT_EQ(pending.status_code, 503);
    EXPECT_EQ(pending.get_header("Retry-After"), "5");
}
