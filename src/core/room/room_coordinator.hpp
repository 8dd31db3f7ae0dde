#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/room/event_sink.hpp"
#include "core/room/persistence_dispatcher.hpp"
#include "core/room/room_registry.hpp"
#include "core/room/room_store.hpp"
#include "core/room/room_types.hpp"
#include "core/room/signaling_relay.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace huddle {
namespace core {

struct CoordinatorOptions {
    std::int64_t heartbeat_timeout_sec = 60;  // 超过该时长无任何消息视为失联
    std::unordered_set<std::string> admin_user_ids;  // 以 ADMIN 身份加入的用户
};

struct ConnectCommand {
    std::string room_id;       // 房间ID
    std::string peer_id;       // 连接ID
    std::string user_id;       // 登录用户ID, 访客为空
    std::string display_name;  // 显示名称
    std::string passcode;      // 房间口令
    MediaInit   media;         // 初始麦克风/摄像头状态
};

struct DisconnectCommand {
    std::string room_id;  // 为空时按连接ID查找所在房间
    std::string peer_id;
    std::string reason;
};

struct SignalCommand {
    std::string    room_id;  // 为空时按发送方查找所在房间
    SignalEnvelope envelope;
};

struct MediaUpdateCommand {
    std::string room_id;
    std::string actor_peer_id;
    std::string target_peer_id;  // 为空或等于 actor 表示修改自己
    std::optional<MediaState> mic;
    std::optional<MediaState> camera;
};

struct EndMeetingCommand {
    std::string room_id;
    std::string actor_peer_id;
    std::string reason;
};

struct KickCommand {
    std::string room_id;
    std::string actor_peer_id;
    std::string target_peer_id;
    std::string reason;
};

struct ChangeRoleCommand {
    std::string room_id;
    std::string actor_peer_id;
    std::string target_peer_id;
    Role        role = Role::kMember;
};

// 房间协调器
// 把入站事件转换为注册表/账本/媒体状态的变更, 并向成员扇出出站事件.
// 前置条件失败只向请求方单播 rejected, 不影响房间内其他人.
class RoomCoordinator {
public:
    using Status = huddle::common::Status;

    RoomCoordinator(std::shared_ptr<RoomRegistry> registry
                    , std::shared_ptr<RoomStore> store
                    , std::shared_ptr<EventSink> sink
                    , std::shared_ptr<PersistenceDispatcher> dispatcher
                    , std::shared_ptr<huddle::common::Clock> clock = nullptr
                    , CoordinatorOptions options = CoordinatorOptions{});

    huddle::common::StatusOr<MembershipSnapshot> Connect(const ConnectCommand& command);
    Status Disconnect(const DisconnectCommand& command);
    Status Signal(const SignalCommand& command);
    Status UpdateMedia(const MediaUpdateCommand& command);
    Status EndMeeting(const EndMeetingCommand& command);
    Status Kick(const KickCommand& command);
    Status ChangeRole(const ChangeRoleCommand& command);

    // 心跳: 刷新最近活动时间并回复 pong
    Status Heartbeat(const std::string& room_id, const std::string& peer_id);

    // 连接断开时调用, 连接不在任何房间时为空操作
    void OnPeerGone(const std::string& peer_id, const std::string& reason);

    // 断开超时未活动的连接, 返回断开数量
    std::size_t SweepStalePeers();

    huddle::common::StatusOr<std::vector<AttendanceRecord>> Attendance(const std::string& room_id);

    // 修复参与者的会话记录并持久化重算后的总时长
    huddle::common::StatusOr<std::int64_t> RepairParticipant(const std::string& room_id, const std::string& participant_id);

    // 只向请求方单播 rejected, 返回原状态
    Status Reject(const std::string& peer_id, const std::string& room_id, const Status& status);

    const std::shared_ptr<RoomRegistry>& Registry() const { return registry_; }

private:
    using PeerList = std::vector<std::string>;

    huddle::common::StatusOr<RoomMeta> LoadMeta(const std::string& room_id) const;
    std::string ResolveRoom(const std::string& room_id, const std::string& peer_id) const;

    Status LeaveRoom(const std::string& room_id, const std::string& peer_id, const std::string& reason, PeerList& overflowed);
    void FinishLeave(RoomRegistry::Lease& lease, const LeaveResult& result, const std::string& reason, PeerList& overflowed);

    void Broadcast(const RoomRegistry::Lease& lease, const OutboundEvent& event, const std::string& exclude, PeerList& overflowed);
    void Unicast(const std::string& peer_id, const OutboundEvent& event, PeerList& overflowed);

    // 断开出站队列溢出的连接, 断开过程中的新溢出一并处理
    void Evict(PeerList overflowed);

    void Touch(RoomRegistry::Lease& lease, const std::string& peer_id, std::int64_t now);
    void PersistClosedSession(const std::string& room_id, const ClosedSession& closed);
    void RecordAudit(AuditEntry entry);
    void Persist(std::string description, PersistenceDispatcher::Task task);

    OutboundEvent MakeEvent(OutboundEventType type, const std::string& room_id, const std::string& peer_id) const;

private:
    std::shared_ptr<RoomRegistry> registry_;
    std::shared_ptr<RoomStore> store_;
    std::shared_ptr<EventSink> sink_;
    std::shared_ptr<PersistenceDispatcher> dispatcher_;
    std::shared_ptr<huddle::common::Clock> clock_;
    SignalingRelay relay_;
    CoordinatorOptions options_;
};

} // namespace core
} // namespace huddle
