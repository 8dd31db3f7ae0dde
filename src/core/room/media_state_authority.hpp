#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/room/room_types.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace huddle {
namespace core {

// 轨道状态最后一次写入者的权限级别, 数值越大权限越高
enum class AuthorityLevel {
    kNone = 0,
    kSelf,
    kCoHost,
    kHost,
    kAdmin,
};

struct TrackState {
    MediaState     state = MediaState::kOff;
    AuthorityLevel authority = AuthorityLevel::kNone;
};

struct MediaChange {
    std::string    peer_id;
    MediaField     field = MediaField::kMic;
    MediaState     state = MediaState::kOff;
    AuthorityLevel authority = AuthorityLevel::kNone;
};

// 参与者名录, 用于查询角色
class ParticipantDirectory {
public:
    virtual ~ParticipantDirectory() = default;
    virtual std::optional<Role> RoleOf(const std::string& peer_id) const = 0;
};

bool IsForced(MediaState state);
bool IsValidFor(MediaField field, MediaState state);
AuthorityLevel ModeratorLevel(Role role);
bool CanModerate(Role actor, Role target);

// 本人可写: 非强制状态
bool CanSelfWrite(const TrackState& track);
// 主持人可写: 级别不低于设置强制状态者
bool CanModeratorWrite(const TrackState& track, AuthorityLevel level);

// 麦克风/摄像头状态机
// 不加锁, 由所属房间的互斥锁保护
class MediaStateAuthority {
public:
    using Status = huddle::common::Status;
    using StatusOrChange = huddle::common::StatusOr<MediaChange>;

    void Init(const std::string& peer_id, const MediaInit& init);
    void Reset(const std::string& peer_id);

    Status CheckSelfUpdate(const std::string& peer_id, MediaField field, MediaState value) const;
    StatusOrChange SelfUpdate(const std::string& peer_id, MediaField field, MediaState value);

    Status CheckModeratorUpdate(const ParticipantDirectory& directory
                                , const std::string& actor_id
                                , const std::string& target_id
                                , MediaField field
                                , MediaState value) const;
    StatusOrChange ModeratorUpdate(const ParticipantDirectory& directory
                                   , const std::string& actor_id
                                   , const std::string& target_id
                                   , MediaField field
                                   , MediaState value);

    std::optional<TrackState> Track(const std::string& peer_id, MediaField field) const;
    bool Contains(const std::string& peer_id) const;

private:
    struct Entry {
        TrackState mic;
        TrackState camera;
    };

    static TrackState& Select(Entry& entry, MediaField field);
    static const TrackState& Select(const Entry& entry, MediaField field);

    std::unordered_map<std::string, Entry> entries_;
};

} // namespace core
} // namespace huddle
