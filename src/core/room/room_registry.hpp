#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/room/media_state_authority.hpp"
#include "core/room/room_types.hpp"
#include "core/room/session_ledger.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace huddle {
namespace core {

// 单个房间的全部可变状态, 只能在持有房间锁时访问
struct RoomState : public ParticipantDirectory {
    RoomMeta meta;
    int      capacity = 0;

    std::vector<std::string> members;                         // 按加入顺序的连接ID
    std::unordered_map<std::string, Participant> roster;      // 连接ID -> 参与者
    std::unordered_map<std::string, Participant> known;       // 参与者ID -> 最近一次的参与者信息
    std::unordered_map<std::string, std::int64_t> last_seen;  // 连接ID -> 最近活动时间

    SessionLedger       ledger;
    MediaStateAuthority media;
    bool destroyable = true;  // 无成员时为 true

    std::optional<Role> RoleOf(const std::string& peer_id) const override;

    bool IsMember(const std::string& peer_id) const { return roster.count(peer_id) > 0; }
    const Participant* Find(const std::string& peer_id) const;
    MemberView ViewOf(const Participant& participant) const;
};

struct JoinRequest {
    Participant participant;
    std::string passcode;
    MediaInit   media;
    std::int64_t at = 0;
    // 参与者在本房间生命周期内首次出现时用于恢复账本
    std::optional<std::vector<SessionRecord>> history;
};

struct LeaveResult {
    Participant participant;
    std::optional<ClosedSession> closed;  // 同一参与者仍有其他连接在房间内时为空
    bool room_empty = false;
};

// 房间注册表
// 锁顺序: 房间锁 -> 注册表锁; 持有注册表锁时从不等待房间锁
class RoomRegistry {
public:
    explicit RoomRegistry(int default_capacity = 100);

    class Room;

    // 房间租赁类, RAII 持有房间锁
    class Lease {
    public:
        Lease() = default;
        Lease(std::shared_ptr<Room> room, std::unique_lock<std::mutex> lock);
        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease() = default;

        RoomState* operator->() noexcept;
        RoomState& operator*() noexcept;
        const RoomState* operator->() const noexcept;
        const RoomState& operator*() const noexcept;
        const std::string& RoomId() const noexcept;
        explicit operator bool() const noexcept { return room_ != nullptr && lock_.owns_lock(); }

        // 提前释放房间锁
        void Release();
    private:
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        friend class RoomRegistry;
        std::shared_ptr<Room> room_;
        std::unique_lock<std::mutex> lock_;
    };

    // 锁定已存在的房间, 不存在时返回 NotFound
    huddle::common::StatusOr<Lease> Acquire(const std::string& room_id);

    // 锁定房间, 不存在则以 meta 创建
    Lease AcquireOrCreate(const RoomMeta& meta);

    // 加入房间, 返回不含自己的成员快照
    huddle::common::StatusOr<MembershipSnapshot> Join(Lease& lease, const JoinRequest& request);

    // 离开房间, 关闭参与者的活跃会话
    huddle::common::StatusOr<LeaveResult> Leave(Lease& lease, const std::string& peer_id, std::int64_t at);

    // 销毁空房间, 之后的 Acquire 返回 NotFound
    huddle::common::Status Destroy(Lease& lease);

    std::vector<std::string> MembersOf(const Lease& lease) const;
    huddle::common::StatusOr<std::vector<std::string>> MembersOf(const std::string& room_id);

    std::optional<std::string> RoomOf(const std::string& peer_id) const;
    std::vector<std::string> RoomIds() const;
    std::size_t RoomCount() const;
    int DefaultCapacity() const { return default_capacity_; }

private:
    const int default_capacity_;

    mutable std::shared_mutex mutex_; // 保护 rooms_ 与 peer_rooms_
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
    std::unordered_map<std::string, std::string> peer_rooms_;  // 连接ID -> 房间ID
};

class RoomRegistry::Room {
public:
    explicit Room(std::string room_id) : room_id_(std::move(room_id)) {}

    const std::string& Id() const { return room_id_; }

private:
    friend class RoomRegistry;
    friend class RoomRegistry::Lease;
    const std::string room_id_;
    std::mutex mutex_;
    bool destroyed_ = false;  // 房间锁保护
    RoomState state_;
};

} // namespace core
} // namespace huddle
