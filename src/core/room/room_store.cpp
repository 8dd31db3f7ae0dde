#include "core/room/room_store.hpp"

#include <mutex>

namespace huddle {
namespace core {

huddle::common::Status InMemoryRoomStore::SaveSession(const std::string& room_id
                                                      , const std::string& participant_id
                                                      , const SessionRecord& session) {
    if (room_id.empty() || participant_id.empty()) {
        return huddle::common::Status::InvalidArgument("room id and participant id are required");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_[ParticipantKey(room_id, participant_id)].push_back(session);
    return huddle::common::Status::OK();
}

huddle::common::Status InMemoryRoomStore::UpdateParticipantTotals(const std::string& room_id
                                                                  , const std::string& participant_id
                                                                  , std::int64_t total_duration_sec) {
    if (room_id.empty() || participant_id.empty()) {
        return huddle::common::Status::InvalidArgument("room id and participant id are required");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    totals_[ParticipantKey(room_id, participant_id)] = total_duration_sec;
    return huddle::common::Status::OK();
}

huddle::common::Status InMemoryRoomStore::AppendAuditEntry(const AuditEntry& entry) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    audit_.push_back(entry);
    return huddle::common::Status::OK();
}

huddle::common::StatusOr<RoomMeta> InMemoryRoomStore::LoadRoomMeta(const std::string& room_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return huddle::common::Status::NotFound("room not found");
    }
    return huddle::common::StatusOr<RoomMeta>(it->second);
}

huddle::common::StatusOr<std::vector<SessionRecord>> InMemoryRoomStore::LoadSessions(const std::string& room_id
                                                                                    , const std::string& participant_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(ParticipantKey(room_id, participant_id));
    if (it == sessions_.end()) {
        return huddle::common::StatusOr<std::vector<SessionRecord>>(std::vector<SessionRecord>{});
    }
    return huddle::common::StatusOr<std::vector<SessionRecord>>(it->second);
}

huddle::common::Status InMemoryRoomStore::PutRoomMeta(const RoomMeta& meta) {
    if (meta.room_id.empty()) {
        return huddle::common::Status::InvalidArgument("room id is empty");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rooms_[meta.room_id] = meta;
    return huddle::common::Status::OK();
}

std::int64_t InMemoryRoomStore::TotalDurationSec(const std::string& room_id, const std::string& participant_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = totals_.find(ParticipantKey(room_id, participant_id));
    return it == totals_.end() ? 0 : it->second;
}

std::vector<AuditEntry> InMemoryRoomStore::AuditEntries() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return audit_;
}

} // namespace core
} // namespace huddle
