#include "core/room/session_ledger.hpp"
#include "core/room/errors.hpp"

#include <algorithm>

namespace huddle {
namespace core {

namespace {

bool IsClosed(const SessionRecord& session) {
    return session.joined_at.has_value() && session.left_at.has_value() && session.duration_sec.has_value();
}

} // namespace

SessionLedger::Status SessionLedger::OpenSession(const std::string& participant_id, std::int64_t at) {
    if (participant_id.empty()) {
        return FromRoomError(RoomErrorCode::kInvalidArgument, "Participant ID cannot be empty.");
    }
    auto it = entries_.find(participant_id);
    if (it == entries_.end()) {
        it = entries_.emplace(participant_id, Entry{}).first;
        order_.push_back(participant_id);
    }
    if (FindActive(it->second) != nullptr) {
        return FromRoomError(RoomErrorCode::kAlreadyActive,
                             "Participant " + participant_id + " already has an open session.");
    }
    SessionRecord session;
    session.joined_at = at;
    it->second.sessions.push_back(session);
    return Status::OK();
}

huddle::common::StatusOr<ClosedSession> SessionLedger::CloseSession(const std::string& participant_id, std::int64_t at) {
    auto it = entries_.find(participant_id);
    if (it == entries_.end()) {
        return FromRoomError(RoomErrorCode::kNoActiveSession,
                             "Participant " + participant_id + " has no session.");
    }
    SessionRecord* active = FindActive(it->second);
    if (active == nullptr) {
        return FromRoomError(RoomErrorCode::kNoActiveSession,
                             "Participant " + participant_id + " has no open session.");
    }

    // 客户端时钟不保证单调, 负区间截断为 0
    active->left_at = at;
    active->duration_sec = std::max<std::int64_t>(0, at - *active->joined_at);

    ClosedSession closed;
    closed.participant_id = participant_id;
    closed.session = *active;
    Recompute(it->second);
    closed.total_duration_sec = it->second.total_duration_sec;
    return huddle::common::StatusOr<ClosedSession>(std::move(closed));
}

huddle::common::StatusOr<std::size_t> SessionLedger::Repair(const std::string& participant_id) {
    auto it = entries_.find(participant_id);
    if (it == entries_.end()) {
        return Status::NotFound("Participant " + participant_id + " is not in the ledger.");
    }
    auto& sessions = it->second.sessions;
    const auto before = sessions.size();
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                  [](const SessionRecord& s) { return !s.joined_at.has_value(); }),
                   sessions.end());
    Recompute(it->second);
    return huddle::common::StatusOr<std::size_t>(before - sessions.size());
}

void SessionLedger::Restore(const std::string& participant_id, std::vector<SessionRecord> sessions) {
    auto it = entries_.find(participant_id);
    if (it == entries_.end()) {
        it = entries_.emplace(participant_id, Entry{}).first;
        order_.push_back(participant_id);
    }
    // 历史中的未关闭会话来自崩溃前, 不能作为当前活跃会话
    for (auto& session : sessions) {
        if (session.joined_at && !session.left_at) {
            session.left_at = session.joined_at;
            session.duration_sec = 0;
        } else if (session.joined_at && session.left_at && !session.duration_sec) {
            session.duration_sec = std::max<std::int64_t>(0, *session.left_at - *session.joined_at);
        }
    }
    it->second.sessions = std::move(sessions);
    Recompute(it->second);
}

bool SessionLedger::Contains(const std::string& participant_id) const {
    return entries_.count(participant_id) > 0;
}

bool SessionLedger::HasActiveSession(const std::string& participant_id) const {
    auto it = entries_.find(participant_id);
    return it != entries_.end() && FindActive(it->second) != nullptr;
}

std::int64_t SessionLedger::TotalDurationSec(const std::string& participant_id) const {
    auto it = entries_.find(participant_id);
    return it == entries_.end() ? 0 : it->second.total_duration_sec;
}

std::vector<SessionRecord> SessionLedger::Sessions(const std::string& participant_id) const {
    auto it = entries_.find(participant_id);
    if (it == entries_.end()) {
        return {};
    }
    return it->second.sessions;
}

std::int64_t SessionLedger::LiveDurationSec(const std::string& participant_id, std::int64_t now) const {
    auto it = entries_.find(participant_id);
    if (it == entries_.end()) {
        return 0;
    }
    std::int64_t total = it->second.total_duration_sec;
    if (const SessionRecord* active = FindActive(it->second)) {
        total += std::max<std::int64_t>(0, now - *active->joined_at);
    }
    return total;
}

std::vector<std::string> SessionLedger::Participants() const {
    return order_;
}

// 总时长始终由已关闭会话重新求和
void SessionLedger::Recompute(Entry& entry) {
    std::int64_t total = 0;
    for (const auto& session : entry.sessions) {
        if (IsClosed(session)) {
            total += *session.duration_sec;
        }
    }
    entry.total_duration_sec = total;
}

SessionRecord* SessionLedger::FindActive(Entry& entry) {
    for (auto it = entry.sessions.rbegin(); it != entry.sessions.rend(); ++it) {
        if (it->joined_at && !it->left_at) {
            return &*it;
        }
    }
    return nullptr;
}

const SessionRecord* SessionLedger::FindActive(const Entry& entry) {
    for (auto it = entry.sessions.rbegin(); it != entry.sessions.rend(); ++it) {
        if (it->joined_at && !it->left_at) {
            return &*it;
        }
    }
    return nullptr;
}

} // namespace core
} // namespace huddle
