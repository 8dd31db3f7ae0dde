#include "core/room/room_coordinator.hpp"
#include "core/room/errors.hpp"
#include "common/logger.hpp"

#include <deque>
#include <unordered_set>
#include <utility>

namespace huddle {
namespace core {

namespace {

constexpr const char* kGuestPrefix = "guest:";

std::string DescribeMedia(const std::optional<MediaState>& mic, const std::optional<MediaState>& camera) {
    std::string text;
    if (mic) {
        text.append("mic=").append(MediaStateToString(*mic));
    }
    if (camera) {
        if (!text.empty()) {
            text.append(",");
        }
        text.append("camera=").append(MediaStateToString(*camera));
    }
    return text;
}

} // namespace

RoomCoordinator::RoomCoordinator(std::shared_ptr<RoomRegistry> registry
                                 , std::shared_ptr<RoomStore> store
                                 , std::shared_ptr<EventSink> sink
                                 , std::shared_ptr<PersistenceDispatcher> dispatcher
                                 , std::shared_ptr<huddle::common::Clock> clock
                                 , CoordinatorOptions options)
    : registry_(std::move(registry))
    , store_(std::move(store))
    , sink_(std::move(sink))
    , dispatcher_(std::move(dispatcher))
    , clock_(clock ? std::move(clock) : std::make_shared<huddle::common::SystemClock>())
    , relay_(sink_)
    , options_(options) {
    if (!registry_) {
        registry_ = std::make_shared<RoomRegistry>();
    }
    if (!store_) {
        store_ = std::make_shared<InMemoryRoomStore>();
    }
    if (!dispatcher_) {
        dispatcher_ = std::make_shared<PersistenceDispatcher>();
    }
}

huddle::common::StatusOr<MembershipSnapshot> RoomCoordinator::Connect(const ConnectCommand& command) {
    if (command.room_id.empty() || command.peer_id.empty()) {
        return Reject(command.peer_id, command.room_id,
                      FromRoomError(RoomErrorCode::kInvalidArgument, "Room ID and peer ID are required."));
    }

    // 存储 I/O 在加房间锁之前完成
    auto meta = LoadMeta(command.room_id);
    if (!meta.IsOk()) {
        return Reject(command.peer_id, command.room_id, meta.GetStatus());
    }

    Participant participant;
    participant.peer_id = command.peer_id;
    participant.user_id = command.user_id;
    participant.participant_id = command.user_id.empty() ? kGuestPrefix + command.peer_id : command.user_id;
    participant.display_name = command.display_name.empty() ? participant.participant_id : command.display_name;
    // 角色只由服务端配置与房间设置决定, 客户端不能自报
    participant.role = Role::kMember;
    participant.room_id = command.room_id;
    if (!command.user_id.empty()) {
        if (options_.admin_user_ids.count(command.user_id) > 0) {
            participant.role = Role::kAdmin;
        } else if (command.user_id == meta.Value().host_user_id) {
            participant.role = Role::kHost;
        }
    }

    JoinRequest request;
    request.participant = participant;
    request.passcode = command.passcode;
    request.media = command.media;
    if (!command.user_id.empty()) {
        auto history = store_->LoadSessions(command.room_id, participant.participant_id);
        if (history.IsOk()) {
            request.history = std::move(history.Value());
        } else {
            HUDDLE_LOG_WARN("[RoomCoordinator] Failed to load session history of {}: {}",
                            participant.participant_id, history.GetStatus().Message());
        }
    }

    PeerList overflowed;
    MembershipSnapshot snapshot;
    Status status = Status::OK();
    {
        auto lease = registry_->AcquireOrCreate(meta.Value());
        request.at = clock_->NowSeconds();
        auto joined = registry_->Join(lease, request);
        if (!joined.IsOk()) {
            status = joined.GetStatus();
            // 本次新建的空房间不保留
            if (lease->members.empty()) {
                auto destroyed = registry_->Destroy(lease);
                if (!destroyed.IsOk()) {
                    HUDDLE_LOG_WARN("[RoomCoordinator] Failed to drop empty room {}: {}", command.room_id, destroyed.Message());
                }
            }
        } else {
            snapshot = std::move(joined.Value());

            OutboundEvent peer_joined = MakeEvent(OutboundEventType::kPeerJoined, command.room_id, participant.peer_id);
            peer_joined.display_name = participant.display_name;
            peer_joined.role = participant.role;
            peer_joined.mic = lease->media.Track(participant.peer_id, MediaField::kMic)->state;
            peer_joined.camera = lease->media.Track(participant.peer_id, MediaField::kCamera)->state;
            Broadcast(lease, peer_joined, participant.peer_id, overflowed);

            OutboundEvent membership = MakeEvent(OutboundEventType::kMembership, command.room_id, participant.peer_id);
            membership.display_name = participant.display_name;
            membership.role = participant.role;
            membership.membership = snapshot;
            Unicast(participant.peer_id, membership, overflowed);

            HUDDLE_LOG_INFO("[RoomCoordinator] Peer {} ({}) joined room {} as {} ({} members)",
                            participant.peer_id, participant.participant_id, command.room_id,
                            RoleToString(participant.role), lease->members.size());
        }
    }
    Evict(std::move(overflowed));

    if (!status.IsOk()) {
        return Reject(command.peer_id, command.room_id, status);
    }
    return huddle::common::StatusOr<MembershipSnapshot>(std::move(snapshot));
}

RoomCoordinator::Status RoomCoordinator::Disconnect(const DisconnectCommand& command) {
    const std::string room_id = ResolveRoom(command.room_id, command.peer_id);
    if (room_id.empty()) {
        // 重复断开是空操作
        return Status::OK();
    }
    PeerList overflowed;
    auto status = LeaveRoom(room_id, command.peer_id, command.reason.empty() ? "left" : command.reason, overflowed);
    Evict(std::move(overflowed));
    return status;
}

RoomCoordinator::Status RoomCoordinator::Signal(const SignalCommand& command) {
    const auto& envelope = command.envelope;
    const std::string room_id = ResolveRoom(command.room_id, envelope.from);
    if (room_id.empty()) {
        return Reject(envelope.from, command.room_id,
                      FromRoomError(RoomErrorCode::kNotAMember, "Peer " + envelope.from + " is not in a room."));
    }

    PeerList overflowed;
    Status status = Status::OK();
    {
        auto lease = registry_->Acquire(room_id);
        if (!lease.IsOk()) {
            status = FromRoomError(RoomErrorCode::kNotAMember, "Room " + room_id + " is not active.");
        } else {
            const auto now = clock_->NowSeconds();
            Touch(lease.Value(), envelope.from, now);
            auto relayed = relay_.Relay(lease.Value(), envelope, now);
            if (!relayed.IsOk()) {
                status = relayed.GetStatus();
            } else if (relayed.Value() == DeliveryResult::kOverflow) {
                overflowed.push_back(envelope.to);
            }
        }
    }
    Evict(std::move(overflowed));

    if (!status.IsOk()) {
        return Reject(envelope.from, room_id, status);
    }
    return status;
}

RoomCoordinator::Status RoomCoordinator::UpdateMedia(const MediaUpdateCommand& command) {
    if (!command.mic && !command.camera) {
        return Reject(command.actor_peer_id, command.room_id,
                      FromRoomError(RoomErrorCode::kInvalidArgument, "Media update carries neither mic nor camera."));
    }
    const std::string room_id = ResolveRoom(command.room_id, command.actor_peer_id);
    if (room_id.empty()) {
        return Reject(command.actor_peer_id, command.room_id,
                      FromRoomError(RoomErrorCode::kNotAMember, "Peer " + command.actor_peer_id + " is not in a room."));
    }

    PeerList overflowed;
    Status status = Status::OK();
    {
        auto lease_or = registry_->Acquire(room_id);
        if (!lease_or.IsOk() || !lease_or.Value()->IsMember(command.actor_peer_id)) {
            status = FromRoomError(RoomErrorCode::kNotAMember,
                                   "Peer " + command.actor_peer_id + " is not in room " + room_id + ".");
        } else {
            auto lease = std::move(lease_or.Value());
            const auto now = clock_->NowSeconds();
            Touch(lease, command.actor_peer_id, now);

            const std::string target = command.target_peer_id.empty() ? command.actor_peer_id : command.target_peer_id;
            const bool self = target == command.actor_peer_id;
            RoomState& room = *lease;

            // 两个轨道先全部校验, 再一起生效, 避免部分更新
            std::vector<std::pair<MediaField, MediaState>> changes;
            if (command.mic) {
                changes.emplace_back(MediaField::kMic, *command.mic);
            }
            if (command.camera) {
                changes.emplace_back(MediaField::kCamera, *command.camera);
            }
            for (const auto& change : changes) {
                status = self ? room.media.CheckSelfUpdate(target, change.first, change.second)
                              : room.media.CheckModeratorUpdate(room, command.actor_peer_id, target, change.first, change.second);
                if (!status.IsOk()) {
                    break;
                }
            }

            if (status.IsOk()) {
                OutboundEvent changed = MakeEvent(OutboundEventType::kMediaChanged, room_id, target);
                for (const auto& change : changes) {
                    auto applied = self ? room.media.SelfUpdate(target, change.first, change.second)
                                        : room.media.ModeratorUpdate(room, command.actor_peer_id, target, change.first, change.second);
                    if (!applied.IsOk()) {
                        status = applied.GetStatus();
                        break;
                    }
                    if (change.first == MediaField::kMic) {
                        changed.mic = applied.Value().state;
                    } else {
                        changed.camera = applied.Value().state;
                    }
                }
                if (changed.mic || changed.camera) {
                    Broadcast(lease, changed, "", overflowed);
                }
                if (status.IsOk() && !self) {
                    AuditEntry entry;
                    entry.admin_id = room.Find(command.actor_peer_id)->participant_id;
                    entry.action = "UPDATE_MEDIA";
                    entry.target_id = room.Find(target)->participant_id;
                    entry.metadata = DescribeMedia(changed.mic, changed.camera);
                    entry.created_at = now;
                    RecordAudit(std::move(entry));
                    HUDDLE_LOG_INFO("[RoomCoordinator] {} set {} of {} in room {}", command.actor_peer_id,
                                    DescribeMedia(changed.mic, changed.camera), target, room_id);
                }
            }
        }
    }
    Evict(std::move(overflowed));

    if (!status.IsOk()) {
        return Reject(command.actor_peer_id, room_id, status);
    }
    return status;
}

RoomCoordinator::Status RoomCoordinator::EndMeeting(const EndMeetingCommand& command) {
    const std::string room_id = ResolveRoom(command.room_id, command.actor_peer_id);
    PeerList overflowed;
    PeerList ended_peers;
    Status status = Status::OK();
    {
        auto lease_or = room_id.empty() ? huddle::common::StatusOr<RoomRegistry::Lease>(Status::NotFound("no room"))
                                        : registry_->Acquire(room_id);
        const Participant* actor = lease_or.IsOk() ? lease_or.Value()->Find(command.actor_peer_id) : nullptr;
        if (actor == nullptr) {
            status = FromRoomError(RoomErrorCode::kNotAMember,
                                   "Peer " + command.actor_peer_id + " is not in room " + command.room_id + ".");
        } else if (actor->role != Role::kHost && actor->role != Role::kAdmin) {
            status = FromRoomError(RoomErrorCode::kForbidden, "Only the host or an admin can end the meeting.");
        } else {
            auto lease = std::move(lease_or.Value());
            const auto now = clock_->NowSeconds();
            const std::string reason = command.reason.empty() ? "ended by host" : command.reason;

            AuditEntry entry;
            entry.admin_id = actor->participant_id;
            entry.action = "END_MEETING";
            entry.target_id = room_id;
            entry.metadata = reason;
            entry.created_at = now;

            OutboundEvent ended = MakeEvent(OutboundEventType::kMeetingEnded, room_id, command.actor_peer_id);
            ended.reason = reason;
            Broadcast(lease, ended, "", overflowed);

            const auto members = registry_->MembersOf(lease);
            for (const auto& peer_id : members) {
                auto left = registry_->Leave(lease, peer_id, now);
                if (!left.IsOk()) {
                    HUDDLE_LOG_WARN("[RoomCoordinator] Failed to remove {} from room {}: {}",
                                    peer_id, room_id, left.GetStatus().Message());
                    continue;
                }
                if (left.Value().closed) {
                    PersistClosedSession(room_id, *left.Value().closed);
                }
            }
            ended_peers = members;
            RecordAudit(std::move(entry));

            auto destroyed = registry_->Destroy(lease);
            if (!destroyed.IsOk()) {
                HUDDLE_LOG_ERROR("[RoomCoordinator] Room {} not destroyed after meeting end: {}", room_id, destroyed.Message());
            }
            HUDDLE_LOG_INFO("[RoomCoordinator] Meeting in room {} ended by {} ({} peers disconnected): {}",
                            room_id, command.actor_peer_id, members.size(), reason);
        }
    }
    // 房间锁释放后再关闭各成员的连接
    for (const auto& peer_id : ended_peers) {
        sink_->Close(peer_id);
    }
    Evict(std::move(overflowed));

    if (!status.IsOk()) {
        return Reject(command.actor_peer_id, room_id.empty() ? command.room_id : room_id, status);
    }
    return status;
}

RoomCoordinator::Status RoomCoordinator::Kick(const KickCommand& command) {
    const std::string room_id = ResolveRoom(command.room_id, command.actor_peer_id);
    if (room_id.empty()) {
        return Reject(command.actor_peer_id, command.room_id,
                      FromRoomError(RoomErrorCode::kNotAMember, "Peer " + command.actor_peer_id + " is not in a room."));
    }

    PeerList overflowed;
    Status status = Status::OK();
    bool kicked = false;
    {
        auto lease_or = registry_->Acquire(room_id);
        const Participant* actor = lease_or.IsOk() ? lease_or.Value()->Find(command.actor_peer_id) : nullptr;
        const Participant* target = lease_or.IsOk() ? lease_or.Value()->Find(command.target_peer_id) : nullptr;
        if (actor == nullptr) {
            status = FromRoomError(RoomErrorCode::kNotAMember,
                                   "Peer " + command.actor_peer_id + " is not in room " + room_id + ".");
        } else if (target == nullptr) {
            status = FromRoomError(RoomErrorCode::kUnknownTarget,
                                   "Peer " + command.target_peer_id + " is not in room " + room_id + ".");
        } else if (actor == target) {
            status = FromRoomError(RoomErrorCode::kInvalidArgument, "A participant cannot kick themselves.");
        } else if (ModeratorLevel(actor->role) == AuthorityLevel::kNone || !CanModerate(actor->role, target->role)) {
            status = FromRoomError(RoomErrorCode::kForbidden,
                                   std::string(RoleToString(actor->role)) + " cannot kick " + RoleToString(target->role) + ".");
        } else {
            auto lease = std::move(lease_or.Value());
            const auto now = clock_->NowSeconds();
            Touch(lease, command.actor_peer_id, now);
            const std::string reason = command.reason.empty() ? "removed by moderator" : command.reason;

            AuditEntry entry;
            entry.admin_id = actor->participant_id;
            entry.action = "KICK_PARTICIPANT";
            entry.target_id = target->participant_id;
            entry.metadata = reason;
            entry.created_at = now;

            OutboundEvent notice = MakeEvent(OutboundEventType::kKicked, room_id, command.target_peer_id);
            notice.reason = reason;
            Unicast(command.target_peer_id, notice, overflowed);

            auto left = registry_->Leave(lease, command.target_peer_id, now);
            if (left.IsOk()) {
                FinishLeave(lease, left.Value(), "kicked", overflowed);
                kicked = true;
            } else {
                status = left.GetStatus();
            }
            RecordAudit(std::move(entry));
            HUDDLE_LOG_INFO("[RoomCoordinator] {} kicked {} from room {}: {}",
                            command.actor_peer_id, command.target_peer_id, room_id, reason);
        }
    }
    if (kicked) {
        sink_->Close(command.target_peer_id);
    }
    Evict(std::move(overflowed));

    if (!status.IsOk()) {
        return Reject(command.actor_peer_id, room_id, status);
    }
    return status;
}

RoomCoordinator::Status RoomCoordinator::ChangeRole(const ChangeRoleCommand& command) {
    const std::string room_id = ResolveRoom(command.room_id, command.actor_peer_id);
    if (room_id.empty()) {
        return Reject(command.actor_peer_id, command.room_id,
                      FromRoomError(RoomErrorCode::kNotAMember, "Peer " + command.actor_peer_id + " is not in a room."));
    }

    PeerList overflowed;
    Status status = Status::OK();
    {
        auto lease_or = registry_->Acquire(room_id);
        const Participant* actor = lease_or.IsOk() ? lease_or.Value()->Find(command.actor_peer_id) : nullptr;
        const Participant* target = lease_or.IsOk() ? lease_or.Value()->Find(command.target_peer_id) : nullptr;
        if (actor == nullptr) {
            status = FromRoomError(RoomErrorCode::kNotAMember,
                                   "Peer " + command.actor_peer_id + " is not in room " + room_id + ".");
        } else if (target == nullptr) {
            status = FromRoomError(RoomErrorCode::kUnknownTarget,
                                   "Peer " + command.target_peer_id + " is not in room " + room_id + ".");
        } else if (command.role == Role::kAdmin) {
            status = FromRoomError(RoomErrorCode::kInvalidArgument, "The ADMIN role cannot be granted inside a room.");
        } else if ((actor->role != Role::kHost && actor->role != Role::kAdmin) || !CanModerate(actor->role, target->role)) {
            status = FromRoomError(RoomErrorCode::kForbidden,
                                   std::string(RoleToString(actor->role)) + " cannot change the role of "
                                   + RoleToString(target->role) + ".");
        } else if (target->role != command.role) {
            auto lease = std::move(lease_or.Value());
            RoomState& room = *lease;
            const auto now = clock_->NowSeconds();
            Touch(lease, command.actor_peer_id, now);

            const Role previous = target->role;
            AuditEntry entry;
            entry.admin_id = actor->participant_id;
            entry.action = "CHANGE_ROLE";
            entry.target_id = target->participant_id;
            entry.metadata = std::string(RoleToString(previous)) + "->" + RoleToString(command.role);
            entry.created_at = now;

            auto apply = [&](const std::string& peer_id, Role role) {
                Participant& participant = room.roster.at(peer_id);
                participant.role = role;
                room.known[participant.participant_id].role = role;
                OutboundEvent changed = MakeEvent(OutboundEventType::kRoleChanged, room_id, peer_id);
                changed.display_name = participant.display_name;
                changed.role = role;
                Broadcast(lease, changed, "", overflowed);
            };

            // 主持人唯一: 移交时原主持人降为联席主持人
            if (command.role == Role::kHost) {
                for (const auto& peer_id : room.members) {
                    if (peer_id != command.target_peer_id && room.roster.at(peer_id).role == Role::kHost) {
                        apply(peer_id, Role::kCoHost);
                    }
                }
            }
            apply(command.target_peer_id, command.role);
            RecordAudit(std::move(entry));
            HUDDLE_LOG_INFO("[RoomCoordinator] {} changed role of {} in room {}: {} -> {}", command.actor_peer_id,
                            command.target_peer_id, room_id, RoleToString(previous), RoleToString(command.role));
        }
    }
    Evict(std::move(overflowed));

    if (!status.IsOk()) {
        return Reject(command.actor_peer_id, room_id, status);
    }
    return status;
}

RoomCoordinator::Status RoomCoordinator::Heartbeat(const std::string& room_id, const std::string& peer_id) {
    const std::string resolved = ResolveRoom(room_id, peer_id);
    PeerList overflowed;
    Status status = Status::OK();
    {
        auto lease = resolved.empty() ? huddle::common::StatusOr<RoomRegistry::Lease>(Status::NotFound("no room"))
                                      : registry_->Acquire(resolved);
        if (!lease.IsOk() || !lease.Value()->IsMember(peer_id)) {
            status = FromRoomError(RoomErrorCode::kNotAMember, "Peer " + peer_id + " is not in a room.");
        } else {
            const auto now = clock_->NowSeconds();
            Touch(lease.Value(), peer_id, now);
            Unicast(peer_id, MakeEvent(OutboundEventType::kPong, resolved, peer_id), overflowed);
        }
    }
    Evict(std::move(overflowed));

    if (!status.IsOk()) {
        return Reject(peer_id, room_id, status);
    }
    return status;
}

void RoomCoordinator::OnPeerGone(const std::string& peer_id, const std::string& reason) {
    auto status = Disconnect(DisconnectCommand{"", peer_id, reason});
    if (!status.IsOk()) {
        HUDDLE_LOG_WARN("[RoomCoordinator] Cleanup of peer {} failed: {}", peer_id, status.Message());
    }
}

std::size_t RoomCoordinator::SweepStalePeers() {
    const auto now = clock_->NowSeconds();
    std::size_t swept = 0;
    for (const auto& room_id : registry_->RoomIds()) {
        PeerList stale;
        PeerList overflowed;
        {
            auto lease_or = registry_->Acquire(room_id);
            if (!lease_or.IsOk()) {
                continue;
            }
            auto lease = std::move(lease_or.Value());
            for (const auto& peer_id : lease->members) {
                auto seen = lease->last_seen.find(peer_id);
                if (seen != lease->last_seen.end() && now - seen->second > options_.heartbeat_timeout_sec) {
                    stale.push_back(peer_id);
                }
            }
            for (const auto& peer_id : stale) {
                auto left = registry_->Leave(lease, peer_id, now);
                if (!left.IsOk()) {
                    continue;
                }
                HUDDLE_LOG_WARN("[RoomCoordinator] Peer {} in room {} timed out", peer_id, room_id);
                FinishLeave(lease, left.Value(), "heartbeat timeout", overflowed);
                ++swept;
                if (left.Value().room_empty) {
                    break;
                }
            }
        }
        for (const auto& peer_id : stale) {
            sink_->Close(peer_id);
        }
        Evict(std::move(overflowed));
    }
    return swept;
}

huddle::common::StatusOr<std::vector<AttendanceRecord>> RoomCoordinator::Attendance(const std::string& room_id) {
    auto lease = registry_->Acquire(room_id);
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    const RoomState& room = *lease.Value();
    const auto now = clock_->NowSeconds();

    std::vector<AttendanceRecord> records;
    for (const auto& participant_id : room.ledger.Participants()) {
        AttendanceRecord record;
        record.participant_id = participant_id;
        auto known = room.known.find(participant_id);
        if (known != room.known.end()) {
            record.display_name = known->second.display_name;
            record.role = known->second.role;
        }
        record.connected = room.ledger.HasActiveSession(participant_id);
        record.session_count = room.ledger.Sessions(participant_id).size();
        record.total_duration_sec = room.ledger.LiveDurationSec(participant_id, now);
        records.push_back(std::move(record));
    }
    return huddle::common::StatusOr<std::vector<AttendanceRecord>>(std::move(records));
}

huddle::common::StatusOr<std::int64_t> RoomCoordinator::RepairParticipant(const std::string& room_id, const std::string& participant_id) {
    auto lease = registry_->Acquire(room_id);
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    RoomState& room = *lease.Value();
    auto dropped = room.ledger.Repair(participant_id);
    if (!dropped.IsOk()) {
        return FromRoomError(RoomErrorCode::kUnknownTarget, dropped.GetStatus().Message());
    }
    const auto total = room.ledger.TotalDurationSec(participant_id);
    auto store = store_;
    Persist("UpdateParticipantTotals(" + participant_id + ")", [store, room_id, participant_id, total] {
        return store->UpdateParticipantTotals(room_id, participant_id, total);
    });
    HUDDLE_LOG_INFO("[RoomCoordinator] Repaired {} in room {}: dropped {} malformed sessions, total={}s",
                    participant_id, room_id, dropped.Value(), total);
    return huddle::common::StatusOr<std::int64_t>(total);
}

huddle::common::StatusOr<RoomMeta> RoomCoordinator::LoadMeta(const std::string& room_id) const {
    auto meta = store_->LoadRoomMeta(room_id);
    if (meta.IsOk()) {
        RoomMeta value = meta.Value();
        value.room_id = room_id;
        return huddle::common::StatusOr<RoomMeta>(std::move(value));
    }
    if (meta.GetStatus().Code() == huddle::common::StatusCode::kNotFound) {
        // 未登记的房间: 无口令, 默认容量
        RoomMeta value;
        value.room_id = room_id;
        return huddle::common::StatusOr<RoomMeta>(std::move(value));
    }
    HUDDLE_LOG_ERROR("[RoomCoordinator] Failed to load meta of room {}: {}", room_id, meta.GetStatus().Message());
    return FromRoomError(RoomErrorCode::kStorageUnavailable, "Room settings are temporarily unavailable.");
}

std::string RoomCoordinator::ResolveRoom(const std::string& room_id, const std::string& peer_id) const {
    if (!room_id.empty()) {
        return room_id;
    }
    return registry_->RoomOf(peer_id).value_or("");
}

RoomCoordinator::Status RoomCoordinator::LeaveRoom(const std::string& room_id
                                                   , const std::string& peer_id
                                                   , const std::string& reason
                                                   , PeerList& overflowed) {
    auto lease_or = registry_->Acquire(room_id);
    if (!lease_or.IsOk()) {
        HUDDLE_LOG_DEBUG("[RoomCoordinator] Disconnect of {} ignored, room {} is gone", peer_id, room_id);
        return Status::OK();
    }
    auto lease = std::move(lease_or.Value());
    auto left = registry_->Leave(lease, peer_id, clock_->NowSeconds());
    if (!left.IsOk()) {
        HUDDLE_LOG_DEBUG("[RoomCoordinator] Disconnect of {} ignored: {}", peer_id, left.GetStatus().Message());
        return Status::OK();
    }
    FinishLeave(lease, left.Value(), reason, overflowed);
    HUDDLE_LOG_INFO("[RoomCoordinator] Peer {} left room {} ({})", peer_id, room_id, reason);
    return Status::OK();
}

void RoomCoordinator::FinishLeave(RoomRegistry::Lease& lease
                                  , const LeaveResult& result
                                  , const std::string& reason
                                  , PeerList& overflowed) {
    OutboundEvent peer_left = MakeEvent(OutboundEventType::kPeerLeft, lease.RoomId(), result.participant.peer_id);
    peer_left.display_name = result.participant.display_name;
    peer_left.reason = reason;
    Broadcast(lease, peer_left, "", overflowed);

    if (result.closed) {
        PersistClosedSession(lease.RoomId(), *result.closed);
    }
    if (result.room_empty) {
        auto destroyed = registry_->Destroy(lease);
        if (!destroyed.IsOk()) {
            HUDDLE_LOG_WARN("[RoomCoordinator] Failed to destroy room {}: {}", lease.RoomId(), destroyed.Message());
        }
    }
}

void RoomCoordinator::Broadcast(const RoomRegistry::Lease& lease
                                , const OutboundEvent& event
                                , const std::string& exclude
                                , PeerList& overflowed) {
    for (const auto& peer_id : lease->members) {
        if (peer_id == exclude) {
            continue;
        }
        if (sink_->Deliver(peer_id, event) == DeliveryResult::kOverflow) {
            overflowed.push_back(peer_id);
        }
    }
}

void RoomCoordinator::Unicast(const std::string& peer_id, const OutboundEvent& event, PeerList& overflowed) {
    if (sink_->Deliver(peer_id, event) == DeliveryResult::kOverflow) {
        overflowed.push_back(peer_id);
    }
}

RoomCoordinator::Status RoomCoordinator::Reject(const std::string& peer_id, const std::string& room_id, const Status& status) {
    const RoomErrorCode code = ToRoomError(status);
    HUDDLE_LOG_INFO("[RoomCoordinator] Rejected request from {} in room {}: {} ({})",
                    peer_id, room_id, status.Message(), RoomErrorName(code));
    if (peer_id.empty()) {
        return status;
    }
    OutboundEvent rejected = MakeEvent(OutboundEventType::kRejected, room_id, peer_id);
    rejected.code = static_cast<int>(code);
    rejected.reason = status.Message();
    PeerList overflowed;
    Unicast(peer_id, rejected, overflowed);
    Evict(std::move(overflowed));
    return status;
}

void RoomCoordinator::Evict(PeerList overflowed) {
    std::deque<std::string> pending(overflowed.begin(), overflowed.end());
    std::unordered_set<std::string> seen;
    while (!pending.empty()) {
        const std::string peer_id = std::move(pending.front());
        pending.pop_front();
        if (!seen.insert(peer_id).second) {
            continue;
        }
        auto room_id = registry_->RoomOf(peer_id);
        if (!room_id) {
            continue;
        }
        HUDDLE_LOG_WARN("[RoomCoordinator] Disconnecting slow peer {} from room {}", peer_id, *room_id);
        PeerList more;
        auto status = LeaveRoom(*room_id, peer_id, "outbound queue overflow", more);
        if (!status.IsOk()) {
            HUDDLE_LOG_WARN("[RoomCoordinator] Failed to disconnect slow peer {}: {}", peer_id, status.Message());
        }
        pending.insert(pending.end(), more.begin(), more.end());
    }
}

void RoomCoordinator::Touch(RoomRegistry::Lease& lease, const std::string& peer_id, std::int64_t now) {
    auto it = lease->last_seen.find(peer_id);
    if (it != lease->last_seen.end()) {
        it->second = now;
    }
}

void RoomCoordinator::PersistClosedSession(const std::string& room_id, const ClosedSession& closed) {
    auto store = store_;
    Persist("SaveSession(" + room_id + ", " + closed.participant_id + ")", [store, room_id, closed] {
        return store->SaveSession(room_id, closed.participant_id, closed.session);
    });
    Persist("UpdateParticipantTotals(" + room_id + ", " + closed.participant_id + ")", [store, room_id, closed] {
        return store->UpdateParticipantTotals(room_id, closed.participant_id, closed.total_duration_sec);
    });
}

void RoomCoordinator::RecordAudit(AuditEntry entry) {
    auto store = store_;
    const std::string description = "AppendAuditEntry(" + entry.action + ", " + entry.target_id + ")";
    Persist(description, [store, entry = std::move(entry)] {
        return store->AppendAuditEntry(entry);
    });
}

void RoomCoordinator::Persist(std::string description, PersistenceDispatcher::Task task) {
    const std::string copy = description;
    if (!dispatcher_->Post(std::move(description), std::move(task))) {
        HUDDLE_LOG_ERROR("[RoomCoordinator] {} was not queued, attendance data may be lost", copy);
    }
}

OutboundEvent RoomCoordinator::MakeEvent(OutboundEventType type, const std::string& room_id, const std::string& peer_id) const {
    OutboundEvent event;
    event.type = type;
    event.room_id = room_id;
    event.peer_id = peer_id;
    event.timestamp = clock_->NowSeconds();
    return event;
}

} // namespace core
} // namespace huddle
