#pragma once

#include "rms/events/components.hpp"
#include "rms/network/http_router.hpp"
#include "rms/stream/stream_service.hpp"
#include "rms/upload/direct_upload.hpp"
#include "rms/upload/session_authority.hpp"

namespace rms::api {

/// Header carrying the owner identity set by the authenticating proxy.
constexpr const char* kUserHeader = "X-User-Id";

struct ApiServices {
    upload::SessionAuthority& authority;
    upload::DirectUploadService& direct_uploads;
    stream::StreamService& streams;
    const events::MetricsComponent* metrics = nullptr;
};

/**
 * @brief Register the upload, streaming and operational routes
 *
 * /api/uploads/... and /api/files require X-User-Id (401 otherwise).
 * /files/stream/... and /files/direct/... are addressed by their opaque
 * token or id and need no identity. The services must outlive the router.
 */
void register_upload_routes(network::HttpRouter& router, ApiServices services);

} // namespace rms::api
