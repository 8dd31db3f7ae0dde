#include "core/room/media_state_authority.hpp"
#include "core/room/errors.hpp"

namespace huddle {
namespace core {

bool IsForced(MediaState state) {
    return state == MediaState::kMutedByHost || state == MediaState::kOffByAdmin;
}

bool IsValidFor(MediaField field, MediaState state) {
    if (field == MediaField::kMic) {
        return state == MediaState::kOn || state == MediaState::kOff
            || state == MediaState::kMuted || state == MediaState::kMutedByHost;
    }
    return state == MediaState::kOn || state == MediaState::kOff || state == MediaState::kOffByAdmin;
}

AuthorityLevel ModeratorLevel(Role role) {
    switch (role) {
        case Role::kCoHost:
            return AuthorityLevel::kCoHost;
        case Role::kHost:
            return AuthorityLevel::kHost;
        case Role::kAdmin:
            return AuthorityLevel::kAdmin;
        case Role::kMember:
            break;
    }
    return AuthorityLevel::kNone;
}

// 联席主持人只能管理普通成员, 主持人不能管理管理员
bool CanModerate(Role actor, Role target) {
    switch (actor) {
        case Role::kAdmin:
            return true;
        case Role::kHost:
            return target != Role::kAdmin;
        case Role::kCoHost:
            return target == Role::kMember;
        case Role::kMember:
            break;
    }
    return false;
}

bool CanSelfWrite(const TrackState& track) {
    return !IsForced(track.state);
}

bool CanModeratorWrite(const TrackState& track, AuthorityLevel level) {
    if (level < AuthorityLevel::kCoHost) {
        return false;
    }
    return !IsForced(track.state) || level >= track.authority;
}

void MediaStateAuthority::Init(const std::string& peer_id, const MediaInit& init) {
    Entry entry;
    entry.mic.state = init.mic_on ? MediaState::kOn : MediaState::kOff;
    entry.mic.authority = AuthorityLevel::kSelf;
    entry.camera.state = init.camera_on ? MediaState::kOn : MediaState::kOff;
    entry.camera.authority = AuthorityLevel::kSelf;
    entries_[peer_id] = entry;
}

void MediaStateAuthority::Reset(const std::string& peer_id) {
    entries_.erase(peer_id);
}

MediaStateAuthority::Status MediaStateAuthority::CheckSelfUpdate(const std::string& peer_id
                                                                 , MediaField field
                                                                 , MediaState value) const {
    auto it = entries_.find(peer_id);
    if (it == entries_.end()) {
        return FromRoomError(RoomErrorCode::kNotAMember, "Peer " + peer_id + " has no media state.");
    }
    if (!IsValidFor(field, value)) {
        return FromRoomError(RoomErrorCode::kInvalidArgument,
                             std::string(MediaStateToString(value)) + " is not a valid " + MediaFieldToString(field) + " state.");
    }
    if (IsForced(value)) {
        return FromRoomError(RoomErrorCode::kForbidden, "Forced states can only be set by a moderator.");
    }
    if (!CanSelfWrite(Select(it->second, field))) {
        return FromRoomError(RoomErrorCode::kForbidden,
                             std::string(MediaFieldToString(field)) + " is locked by a moderator.");
    }
    return Status::OK();
}

MediaStateAuthority::StatusOrChange MediaStateAuthority::SelfUpdate(const std::string& peer_id
                                                                    , MediaField field
                                                                    , MediaState value) {
    auto status = CheckSelfUpdate(peer_id, field, value);
    if (!status.IsOk()) {
        return status;
    }
    TrackState& track = Select(entries_[peer_id], field);
    track.state = value;
    track.authority = AuthorityLevel::kSelf;
    return StatusOrChange(MediaChange{peer_id, field, track.state, track.authority});
}

MediaStateAuthority::Status MediaStateAuthority::CheckModeratorUpdate(const ParticipantDirectory& directory
                                                                      , const std::string& actor_id
                                                                      , const std::string& target_id
                                                                      , MediaField field
                                                                      , MediaState value) const {
    auto actor_role = directory.RoleOf(actor_id);
    if (!actor_role) {
        return FromRoomError(RoomErrorCode::kNotAMember, "Peer " + actor_id + " is not in the room.");
    }
    auto target_role = directory.RoleOf(target_id);
    auto it = entries_.find(target_id);
    if (!target_role || it == entries_.end()) {
        return FromRoomError(RoomErrorCode::kUnknownTarget, "Peer " + target_id + " is not in the room.");
    }
    const AuthorityLevel level = ModeratorLevel(*actor_role);
    if (level == AuthorityLevel::kNone) {
        return FromRoomError(RoomErrorCode::kForbidden, "Only hosts, co-hosts and admins can change another participant's media.");
    }
    if (!CanModerate(*actor_role, *target_role)) {
        return FromRoomError(RoomErrorCode::kForbidden,
                             std::string(RoleToString(*actor_role)) + " cannot moderate " + RoleToString(*target_role) + ".");
    }
    if (!IsValidFor(field, value)) {
        return FromRoomError(RoomErrorCode::kInvalidArgument,
                             std::string(MediaStateToString(value)) + " is not a valid " + MediaFieldToString(field) + " state.");
    }
    if (!CanModeratorWrite(Select(it->second, field), level)) {
        return FromRoomError(RoomErrorCode::kForbidden,
                             std::string(MediaFieldToString(field)) + " was locked by a higher authority.");
    }
    // 替他人打开设备仅限主持人及以上
    if (value == MediaState::kOn && !IsForced(Select(it->second, field).state) && level < AuthorityLevel::kHost) {
        return FromRoomError(RoomErrorCode::kForbidden, "Only the host can turn on another participant's media.");
    }
    return Status::OK();
}

MediaStateAuthority::StatusOrChange MediaStateAuthority::ModeratorUpdate(const ParticipantDirectory& directory
                                                                         , const std::string& actor_id
                                                                         , const std::string& target_id
                                                                         , MediaField field
                                                                         , MediaState value) {
    auto status = CheckModeratorUpdate(directory, actor_id, target_id, field, value);
    if (!status.IsOk()) {
        return status;
    }
    const AuthorityLevel level = ModeratorLevel(*directory.RoleOf(actor_id));
    TrackState& track = Select(entries_[target_id], field);
    if (IsForced(value)) {
        track.state = value;
        track.authority = level;
    } else if (IsForced(track.state)) {
        // 解除强制状态一律回到 OFF, 不直接打开设备
        track.state = MediaState::kOff;
        track.authority = AuthorityLevel::kNone;
    } else {
        track.state = value;
        track.authority = level;
    }
    return StatusOrChange(MediaChange{target_id, field, track.state, track.authority});
}

std::optional<TrackState> MediaStateAuthority::Track(const std::string& peer_id, MediaField field) const {
    auto it = entries_.find(peer_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return Select(it->second, field);
}

bool MediaStateAuthority::Contains(const std::string& peer_id) const {
    return entries_.count(peer_id) > 0;
}

TrackState& MediaStateAuthority::Select(Entry& entry, MediaField field) {
    return field == MediaField::kMic ? entry.mic : entry.camera;
}

const TrackState& MediaStateAuthority::Select(const Entry& entry, MediaField field) {
    return field == MediaField::kMic ? entry.mic : entry.camera;
}

} // namespace core
} // namespace huddle
