#pragma once

#include "core/room/room_store.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/transaction.hpp"

#include <memory>
#include <string>

namespace huddle {
namespace storage {

// 基于 MySQL 的房间存储, 表结构见 sql/schema.sql
class MySqlRoomStore : public huddle::core::RoomStore {
public:
    explicit MySqlRoomStore(std::shared_ptr<ConnectionPool> pool);

    // 写入会话明细并刷新参与者最近一次的进出时间
    huddle::common::Status SaveSession(const std::string& room_id, const std::string& participant_id, const huddle::core::SessionRecord& session) override;
    huddle::common::Status UpdateParticipantTotals(const std::string& room_id, const std::string& participant_id, std::int64_t total_duration_sec) override;
    huddle::common::Status AppendAuditEntry(const huddle::core::AuditEntry& entry) override;
    huddle::common::StatusOr<huddle::core::RoomMeta> LoadRoomMeta(const std::string& room_id) const override;
    huddle::common::StatusOr<std::vector<huddle::core::SessionRecord>> LoadSessions(const std::string& room_id, const std::string& participant_id) const override;

    // 创建或更新房间设置
    huddle::common::Status UpsertRoomMeta(const huddle::core::RoomMeta& meta);

private:
    static std::string EscapeAndQuote(MYSQL* conn, const std::string& value);

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace huddle
