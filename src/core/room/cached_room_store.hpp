#pragma once

#include "cache/redis_client.hpp"
#include "core/room/room_store.hpp"

#include <memory>
#include <string>

namespace huddle {
namespace core {

// 带 Redis 缓存的房间存储包装器
// 只缓存房间元数据, 会话与审计直接写主存储
class CachedRoomStore : public RoomStore {
public:
    CachedRoomStore(std::shared_ptr<RoomStore> primary,
                    std::shared_ptr<huddle::cache::RedisClient> redis,
                    int ttl_seconds = 300);

    huddle::common::Status SaveSession(const std::string& room_id, const std::string& participant_id, const SessionRecord& session) override;
    huddle::common::Status UpdateParticipantTotals(const std::string& room_id, const std::string& participant_id, std::int64_t total_duration_sec) override;
    huddle::common::Status AppendAuditEntry(const AuditEntry& entry) override;
    // 先读缓存, 未命中再读主存储并回填
    huddle::common::StatusOr<RoomMeta> LoadRoomMeta(const std::string& room_id) const override;
    huddle::common::StatusOr<std::vector<SessionRecord>> LoadSessions(const std::string& room_id, const std::string& participant_id) const override;

    // 房间设置变更后由运维调用
    huddle::common::Status InvalidateRoomMeta(const std::string& room_id);

    static std::string KeyForRoom(const std::string& room_id);
    static std::string EncodeMeta(const RoomMeta& meta);
    static huddle::common::StatusOr<RoomMeta> DecodeMeta(const std::string& payload);

private:
    bool HasCache() const { return static_cast<bool>(redis_); }

    std::shared_ptr<RoomStore> primary_;
    std::shared_ptr<huddle::cache::RedisClient> redis_;
    int ttl_seconds_;
};

} // namespace core
} // namespace huddle
