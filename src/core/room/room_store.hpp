#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/room/room_types.hpp"

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace huddle {
namespace core {

// 房间持久化接口
// 所有写操作都在持久化线程上执行, 不会在房间锁内调用
class RoomStore {
public:
    virtual ~RoomStore() = default;

    // 保存一条已关闭的会话, 按 (房间, 参与者) 归档
    virtual huddle::common::Status SaveSession(const std::string& room_id
                                               , const std::string& participant_id
                                               , const SessionRecord& session) = 0;

    // 更新参与者在该房间的累计时长
    virtual huddle::common::Status UpdateParticipantTotals(const std::string& room_id
                                                           , const std::string& participant_id
                                                           , std::int64_t total_duration_sec) = 0;

    // 追加管理操作审计记录
    virtual huddle::common::Status AppendAuditEntry(const AuditEntry& entry) = 0;

    // 读取房间元数据, 不存在时返回 NotFound
    virtual huddle::common::StatusOr<RoomMeta> LoadRoomMeta(const std::string& room_id) const = 0;

    // 读取参与者在该房间的历史会话
    virtual huddle::common::StatusOr<std::vector<SessionRecord>> LoadSessions(const std::string& room_id
                                                                              , const std::string& participant_id) const = 0;
};

class InMemoryRoomStore : public RoomStore {
public:
    huddle::common::Status SaveSession(const std::string& room_id, const std::string& participant_id, const SessionRecord& session) override;
    huddle::common::Status UpdateParticipantTotals(const std::string& room_id, const std::string& participant_id, std::int64_t total_duration_sec) override;
    huddle::common::Status AppendAuditEntry(const AuditEntry& entry) override;
    huddle::common::StatusOr<RoomMeta> LoadRoomMeta(const std::string& room_id) const override;
    huddle::common::StatusOr<std::vector<SessionRecord>> LoadSessions(const std::string& room_id, const std::string& participant_id) const override;

    // 写入房间元数据 (运维与测试使用)
    huddle::common::Status PutRoomMeta(const RoomMeta& meta);

    std::int64_t TotalDurationSec(const std::string& room_id, const std::string& participant_id) const;
    std::vector<AuditEntry> AuditEntries() const;

private:
    using ParticipantKey = std::pair<std::string, std::string>;  // (房间ID, 参与者ID)

    mutable std::shared_mutex mutex_; // 保护以下所有表
    std::unordered_map<std::string, RoomMeta> rooms_;
    std::map<ParticipantKey, std::vector<SessionRecord>> sessions_;
    std::map<ParticipantKey, std::int64_t> totals_;
    std::vector<AuditEntry> audit_;
};

} // namespace core
} // namespace huddle
