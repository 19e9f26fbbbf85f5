#include "rms/core/base64.hpp"
#include "rms/events/components.hpp"
#include "rms/storage/memory_blob_store.hpp"
#include "rms/upload/direct_upload.hpp"

#include <gtest/gtest.h>

using rms::ErrorCode;
using rms::events::EventBus;
using rms::events::MetricsComponent;
using rms::storage::MemoryBlobStore;
using rms::upload::DirectUploadOptions;
using rms::upload::DirectUploadRequest;
using rms::upload::DirectUploadService;
using rms::upload::FileCatalog;

namespace {

DirectUploadRequest make_request(const std::string& encoded) {
    DirectUploadRequest request;
    request.owner_id = "alice";
    request.filename = "avatar.png";
    request.mime_type = "image/png";
    request.encoded_data = encoded;
    return request;
}

} // namespace

TEST(DirectUploadTest, StoresDecodedBytes) {
    MemoryBlobStore blobs;
    FileCatalog catalog;
    EventBus bus;
    MetricsComponent metrics(bus);
    DirectUploadService service(blobs, catalog, bus, DirectUploadOptions{1024, ""});

    std::vector<std::uint8_t> payload{0x89, 'P', 'N', 'G', 0, 1, 2};
    auto file = service.store(make_request("data:image/png;base64," + rms::base64_encode(payload)));
    ASSERT_TRUE(file.is_ok());

    EXPECT_EQ(file.value().file_size, payload.size());
    EXPECT_EQ(file.value().url, "/files/direct/" + file.value().id);
    EXPECT_EQ(blobs.get(file.value().storage_key).value(), payload);
    EXPECT_TRUE(catalog.find(file.value().id).has_value());
    EXPECT_EQ(metrics.get_stats().direct_uploads.load(), 1u);
    EXPECT_EQ(metrics.get_stats().direct_upload_bytes.load(), payload.size());
}

TEST(DirectUploadTest, RejectsOversizedPayloadBeforeDecoding) {
    MemoryBlobStore blobs;
    FileCatalog catalog;
    EventBus bus;
    DirectUploadService service(blobs, catalog, bus, DirectUploadOptions{8, ""});

    auto file = service.store(make_request("not even base64 but long"));
    ASSERT_TRUE(file.is_error());
    EXPECT_EQ(file.error().code, ErrorCode::PayloadTooLarge);

    auto at_limit = service.store(make_request("aGVsbG8="));  // exactly 8 characters
    EXPECT_TRUE(at_limit.is_ok());
}

TEST(DirectUploadTest, RejectsInvalidPayloads) {
    MemoryBlobStore blobs;
    FileCatalog catalog;
    EventBus bus;
    DirectUploadService service(blobs, catalog, bus, DirectUploadOptions{});

    EXPECT_EQ(service.store(make_request("@@@@")).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(service.store(make_request("")).error().code, ErrorCode::InvalidSize);

    auto anonymous = make_request("aGVsbG8=");
    anonymous.owner_id.clear();
    EXPECT_EQ(service.store(anonymous).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(blobs.blob_count(), 0u);
}
