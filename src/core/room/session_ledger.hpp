#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/room/room_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace huddle {
namespace core {

// 会话关闭结果, 交给持久化层
struct ClosedSession {
    std::string   participant_id;
    SessionRecord session;
    std::int64_t  total_duration_sec = 0;
};

// 参与者出勤账本
// 不加锁, 由所属房间的互斥锁保护
class SessionLedger {
public:
    using Status = huddle::common::Status;

    // 打开新会话, 已有活跃会话时返回 AlreadyActive
    Status OpenSession(const std::string& participant_id, std::int64_t at);

    // 关闭活跃会话, 无活跃会话时返回 NoActiveSession
    huddle::common::StatusOr<ClosedSession> CloseSession(const std::string& participant_id, std::int64_t at);

    // 丢弃缺少 joined_at 的记录并重算总时长, 返回丢弃条数
    huddle::common::StatusOr<std::size_t> Repair(const std::string& participant_id);

    // 以存储中的历史会话初始化账本
    void Restore(const std::string& participant_id, std::vector<SessionRecord> sessions);

    bool Contains(const std::string& participant_id) const;
    bool HasActiveSession(const std::string& participant_id) const;
    std::int64_t TotalDurationSec(const std::string& participant_id) const;
    std::vector<SessionRecord> Sessions(const std::string& participant_id) const;

    // 已关闭会话总时长加上进行中会话截至 now 的时长
    std::int64_t LiveDurationSec(const std::string& participant_id, std::int64_t now) const;

    std::vector<std::string> Participants() const;

private:
    struct Entry {
        std::vector<SessionRecord> sessions;
        std::int64_t total_duration_sec = 0;
    };

    static void Recompute(Entry& entry);
    static SessionRecord* FindActive(Entry& entry);
    static const SessionRecord* FindActive(const Entry& entry);

    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> order_; // 首次出现顺序
};

} // namespace core
} // namespace huddle
