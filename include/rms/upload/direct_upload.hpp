#pragma once

#include "rms/events/event_bus.hpp"
#include "rms/storage/blob_store.hpp"
#include "rms/upload/file_catalog.hpp"
#include "rms/upload/types.hpp"

#include <cstdint>
#include <string>

namespace rms::upload {

struct DirectUploadOptions {
    std::uint64_t max_encoded_size = 10ULL * 1024 * 1024;
    std::string public_base_url;
};

struct DirectUploadRequest {
    std::string owner_id;
    std::string filename;
    std::string mime_type;
    std::string encoded_data;   ///< base64, optionally a data: URL
};

/**
 * @brief Single-request upload for small files
 *
 * Bypasses the session protocol. The encoded payload is rejected outright
 * with PayloadTooLarge above max_encoded_size, before decoding.
 */
class DirectUploadService {
public:
    DirectUploadService(storage::BlobStore& blobs,
                        FileCatalog& catalog,
                        events::EventBus& bus,
                        DirectUploadOptions options,
                        Clock clock = {});

    Result<FinalizedFile> store(const DirectUploadRequest& request);

    [[nodiscard]] std::uint64_t max_encoded_size() const noexcept { return options_.max_encoded_size; }

private:
    storage::BlobStore& blobs_;
    FileCatalog& catalog_;
    events::EventBus& event_bus_;
    DirectUploadOptions options_;
    Clock clock_;
};

} // namespace rms::upload
