#include "rms/upload/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace rms::upload {
namespace {

bool is_allowed(SessionStatus current, SessionStatus target) {
    static const std::unordered_map<SessionStatus, std::vector<SessionStatus>> transitions {
        {SessionStatus::Active, {SessionStatus::Paused, SessionStatus::Finalizing,
                                 SessionStatus::Failed, SessionStatus::Expired}},
        {SessionStatus::Paused, {SessionStatus::Active, SessionStatus::Finalizing,
                                 SessionStatus::Failed, SessionStatus::Expired}},
        // A failed reassembly hands the session back to its previous state.
        {SessionStatus::Finalizing, {SessionStatus::Completed, SessionStatus::Active,
                                     SessionStatus::Paused, SessionStatus::Failed}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

Session::Session(UploadSession info) : info_(std::move(info)) {}

Result<void> Session::transition_to(SessionStatus next, TimePoint now) {
    if (info_.status == next) {
        return Ok();
    }
    if (!can_transition(next)) {
        return Err<void>(ErrorCode::SessionTerminal,
                         std::string("Illegal session transition ") + to_string(info_.status) +
                         " -> " + to_string(next));
    }

    info_.status = next;
    info_.updated_at = now;
    if (next != SessionStatus::Failed) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> Session::mark_failed(std::string reason, TimePoint now) {
    auto res = transition_to(SessionStatus::Failed, now);
    if (res.is_ok()) {
        info_.last_error = std::move(reason);
    }
    return res;
}

bool Session::record_chunk(std::uint32_t index, TimePoint now) {
    const bool inserted = info_.uploaded_chunks.insert(index).second;
    if (info_.status == SessionStatus::Paused) {
        info_.status = SessionStatus::Active;
    }
    info_.updated_at = now;
    return inserted;
}

void Session::set_result(std::string file_id, std::string url) {
    info_.result_file_id = std::move(file_id);
    info_.result_url = std::move(url);
}

void Session::set_thumbnail(TimePoint now) {
    info_.has_thumbnail = true;
    info_.updated_at = now;
}

void Session::restore_status(SessionStatus status) {
    info_.status = status;
}

bool Session::can_transition(SessionStatus target) const noexcept {
    if (info_.status == target) {
        return true;
    }
    if (is_terminal(info_.status)) {
        return false;
    }
    return is_allowed(info_.status, target);
}

Error terminal_error(const UploadSession& session) {
    if (session.status == SessionStatus::Expired) {
        return Error{ErrorCode::SessionExpired, "Session expired: " + session.session_token};
    }
    return Error{ErrorCode::SessionTerminal,
                 std::string("Session is ") + to_string(session.status) + ": " + session.session_token};
}

} // namespace rms::upload
