#include "rms/upload/session_repository.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rms::upload {
using json = nlohmann::json;

namespace {
constexpr const char* kPrefix = "sessions/";
constexpr const char* kSuffix = ".json";
} // namespace

SessionRepository::SessionRepository(storage::BlobStore& store) : store_(store) {}

std::string SessionRepository::key_for(const std::string& session_token) {
    return std::string(kPrefix) + session_token + kSuffix;
}

Result<void> SessionRepository::save(const UploadSession& session) {
    const auto text = json(session).dump(-1, ' ', false, json::error_handler_t::replace);
    return store_.put(key_for(session.session_token), std::vector<std::uint8_t>(text.begin(), text.end()));
}

Result<void> SessionRepository::remove(const std::string& session_token) {
    return store_.remove(key_for(session_token));
}

Result<std::vector<UploadSession>> SessionRepository::load_all() const {
    auto keys = store_.list(kPrefix);
    if (keys.is_error()) {
        return forward_error<std::vector<UploadSession>>(keys);
    }

    std::vector<UploadSession> sessions;
    for (const auto& key : keys.value()) {
        auto bytes = store_.get(key);
        if (bytes.is_error()) {
            spdlog::warn("[SessionRepository] Skipping {}: {}", key, bytes.error().message);
            continue;
        }
        auto doc = json::parse(bytes.value().begin(), bytes.value().end(), nullptr, false);
        if (doc.is_discarded()) {
            spdlog::warn("[SessionRepository] Skipping {}: not valid JSON", key);
            continue;
        }
        try {
            sessions.push_back(doc.get<UploadSession>());
        } catch (const std::exception& e) {
            spdlog::warn("[SessionRepository] Skipping {}: {}", key, e.what());
        }
    }
    return Ok(std::move(sessions));
}

} // namespace rms::upload
