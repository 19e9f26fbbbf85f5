#include "rms/upload/direct_upload.hpp"

#include "rms/core/base64.hpp"
#include "rms/core/ids.hpp"
#include "rms/events/events.hpp"
#include "rms/upload/finalizer.hpp"

#include <spdlog/spdlog.h>

namespace rms::upload {

DirectUploadService::DirectUploadService(storage::BlobStore& blobs,
                                         FileCatalog& catalog,
                                         events::EventBus& bus,
                                         DirectUploadOptions options,
                                         Clock clock)
    : blobs_(blobs),
      catalog_(catalog),
      event_bus_(bus),
      options_(std::move(options)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

Result<FinalizedFile> DirectUploadService::store(const DirectUploadRequest& request) {
    if (request.encoded_data.size() > options_.max_encoded_size) {
        return Err<FinalizedFile>(ErrorCode::PayloadTooLarge,
                                  "Encoded payload of " + std::to_string(request.encoded_data.size()) +
                                  " bytes exceeds " + std::to_string(options_.max_encoded_size) +
                                  "; use a resumable session");
    }
    if (request.owner_id.empty() || request.filename.empty()) {
        return Err<FinalizedFile>(ErrorCode::InvalidArgument, "ownerId and filename are required");
    }

    auto decoded = base64_decode(request.encoded_data);
    if (decoded.is_error()) {
        return forward_error<FinalizedFile>(decoded);
    }
    if (decoded.value().empty()) {
        return Err<FinalizedFile>(ErrorCode::InvalidSize, "File is empty");
    }

    FinalizedFile file;
    file.id = generate_id("file");
    file.storage_mode = StorageMode::Direct;
    file.mime_type = request.mime_type.empty() ? "application/octet-stream" : request.mime_type;
    file.file_size = decoded.value().size();
    file.filename = request.filename;
    file.owner_id = request.owner_id;
    file.storage_key = direct_file_key(request.owner_id, file.id, request.filename);
    file.url = direct_file_url(options_.public_base_url, file.id);
    file.created_at = clock_();

    if (auto res = blobs_.put(file.storage_key, decoded.value()); res.is_error()) {
        return forward_error<FinalizedFile>(res);
    }
    if (auto res = catalog_.add(file); res.is_error()) {
        spdlog::error("[DirectUpload] Catalog write for {} failed: {}", file.id, res.error().message);
    }

    event_bus_.emit(events::DirectUploadStoredEvent{file.id, file.owner_id, file.file_size});
    return Ok(std::move(file));
}

} // namespace rms::upload
