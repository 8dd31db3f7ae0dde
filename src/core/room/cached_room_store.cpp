#include "core/room/cached_room_store.hpp"
#include "common/logger.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace huddle {
namespace core {

namespace {
constexpr std::string_view kRoomMetaPrefix = "huddle:room:meta:";
}

CachedRoomStore::CachedRoomStore(std::shared_ptr<RoomStore> primary,
                                 std::shared_ptr<huddle::cache::RedisClient> redis,
                                 int ttl_seconds)
    : primary_(std::move(primary)), redis_(std::move(redis)), ttl_seconds_(ttl_seconds) {}

huddle::common::Status CachedRoomStore::SaveSession(const std::string& room_id
                                                    , const std::string& participant_id
                                                    , const SessionRecord& session) {
    return primary_->SaveSession(room_id, participant_id, session);
}

huddle::common::Status CachedRoomStore::UpdateParticipantTotals(const std::string& room_id
                                                                , const std::string& participant_id
                                                                , std::int64_t total_duration_sec) {
    return primary_->UpdateParticipantTotals(room_id, participant_id, total_duration_sec);
}

huddle::common::Status CachedRoomStore::AppendAuditEntry(const AuditEntry& entry) {
    return primary_->AppendAuditEntry(entry);
}

huddle::common::StatusOr<RoomMeta> CachedRoomStore::LoadRoomMeta(const std::string& room_id) const {
    if (HasCache()) {
        auto cached = redis_->Get(KeyForRoom(room_id));
        if (cached.IsOk()) {
            auto meta = DecodeMeta(cached.Value());
            if (meta.IsOk()) {
                return meta;
            }
            HUDDLE_LOG_WARN("[RoomCache] Dropping bad payload for room {}: {}", room_id, meta.GetStatus().Message());
        } else if (cached.GetStatus().Code() != huddle::common::StatusCode::kNotFound) {
            HUDDLE_LOG_WARN("[RoomCache] get failed: {}", cached.GetStatus().Message());
        }
    }

    auto loaded = primary_->LoadRoomMeta(room_id);
    if (!loaded.IsOk() || !HasCache()) {
        return loaded;
    }
    auto put = redis_->SetEx(KeyForRoom(room_id), EncodeMeta(loaded.Value()), ttl_seconds_);
    if (!put.IsOk()) {
        HUDDLE_LOG_WARN("[RoomCache] put after load failed: {}", put.Message());
    }
    return loaded;
}

huddle::common::StatusOr<std::vector<SessionRecord>> CachedRoomStore::LoadSessions(const std::string& room_id
                                                                                  , const std::string& participant_id) const {
    return primary_->LoadSessions(room_id, participant_id);
}

huddle::common::Status CachedRoomStore::InvalidateRoomMeta(const std::string& room_id) {
    if (!HasCache()) {
        return huddle::common::Status::OK();
    }
    auto status = redis_->Del(KeyForRoom(room_id));
    if (!status.IsOk() && status.Code() != huddle::common::StatusCode::kNotFound) {
        return status;
    }
    return huddle::common::Status::OK();
}

std::string CachedRoomStore::KeyForRoom(const std::string& room_id) {
    return std::string(kRoomMetaPrefix).append(room_id);
}

std::string CachedRoomStore::EncodeMeta(const RoomMeta& meta) {
    nlohmann::json j{
        {"room_id", meta.room_id},
        {"passcode", meta.passcode},
        {"capacity", meta.capacity},
        {"host_user_id", meta.host_user_id},
    };
    return j.dump();
}

huddle::common::StatusOr<RoomMeta> CachedRoomStore::DecodeMeta(const std::string& payload) {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return huddle::common::Status::Unavailable("invalid cache payload");
    }
    RoomMeta meta;
    try {
        meta.room_id = json.value("room_id", "");
        meta.passcode = json.value("passcode", "");
        meta.capacity = json.value("capacity", 0);
        meta.host_user_id = json.value("host_user_id", "");
    } catch (const nlohmann::json::exception& ex) {
        // 字段类型不符
        return huddle::common::Status::Unavailable(std::string("malformed cache payload: ") + ex.what());
    }
    if (meta.room_id.empty()) {
        return huddle::common::Status::Unavailable("cache payload without room id");
    }
    return huddle::common::StatusOr<RoomMeta>(std::move(meta));
}

} // namespace core
} // namespace huddle
