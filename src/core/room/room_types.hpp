#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace huddle {
namespace core {

enum class Role {
    kMember = 0,
    kCoHost,
    kHost,
    kAdmin,
};

enum class MediaField {
    kMic = 0,
    kCamera,
};

// 麦克风: ON / OFF / MUTED / MUTED_BY_HOST
// 摄像头: ON / OFF / OFF_BY_ADMIN
enum class MediaState {
    kOn = 0,
    kOff,
    kMuted,
    kMutedByHost,
    kOffByAdmin,
};

enum class SignalType {
    kOffer = 0,
    kAnswer,
    kCandidate,
};

struct Participant {
    std::string participant_id;  // 跨重连稳定的参与者ID (用户ID 或 guest:<peer>)
    std::string peer_id;         // 当前连接ID
    std::string user_id;         // 访客为空
    std::string display_name;
    Role        role = Role::kMember;
    std::string room_id;
};

struct SessionRecord {
    std::optional<std::int64_t> joined_at;     // 历史数据中可能缺失
    std::optional<std::int64_t> left_at;       // 会话进行中为空
    std::optional<std::int64_t> duration_sec;  // 关闭时计算
};

struct RoomMeta {
    std::string room_id;
    std::string passcode;       // 为空表示无需口令
    int         capacity = 0;   // 0 表示使用配置的默认容量
    std::string host_user_id;
};

struct AuditEntry {
    std::string  admin_id;
    std::string  action;
    std::string  target_id;
    std::string  metadata;
    std::int64_t created_at = 0;
};

struct SignalEnvelope {
    std::string from;
    std::string to;
    SignalType  type = SignalType::kOffer;
    std::string sdp;
    std::string candidate;
};

// 房间成员视图, 用于成员快照
struct MemberView {
    std::string peer_id;
    std::string participant_id;
    std::string display_name;
    Role        role = Role::kMember;
    MediaState  mic = MediaState::kOff;
    MediaState  camera = MediaState::kOff;
};

struct MembershipSnapshot {
    std::string             room_id;
    std::string             self_peer_id;
    std::vector<MemberView> members;  // 按加入顺序, 不含自己
};

struct MediaInit {
    bool mic_on = true;
    bool camera_on = true;
};

enum class OutboundEventType {
    kPeerJoined = 0,
    kPeerLeft,
    kMediaChanged,
    kMeetingEnded,
    kSignal,
    kRejected,
    kMembership,
    kRoleChanged,
    kKicked,
    kPong,
};

// 出站事件, 由传输层转换为具体协议消息
struct OutboundEvent {
    OutboundEventType         type = OutboundEventType::kPeerJoined;
    std::string               room_id;
    std::string               peer_id;
    std::string               display_name;
    std::optional<MediaState> mic;
    std::optional<MediaState> camera;
    std::optional<Role>       role;
    std::string               reason;
    int                       code = 0;
    SignalEnvelope            signal;
    MembershipSnapshot        membership;
    std::int64_t              timestamp = 0;
};

// 单个参与者的出勤统计
struct AttendanceRecord {
    std::string  participant_id;
    std::string  display_name;
    Role         role = Role::kMember;
    bool         connected = false;
    std::size_t  session_count = 0;
    std::int64_t total_duration_sec = 0;
};

const char* RoleToString(Role role);
std::optional<Role> RoleFromString(const std::string& value);
const char* MediaStateToString(MediaState state);
std::optional<MediaState> MediaStateFromString(const std::string& value);
const char* MediaFieldToString(MediaField field);
const char* SignalTypeToString(SignalType type);

}
}
