#include "core/room/room_registry.hpp"
#include "core/room/errors.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace huddle {
namespace core {

std::optional<Role> RoomState::RoleOf(const std::string& peer_id) const {
    auto it = roster.find(peer_id);
    if (it == roster.end()) {
        return std::nullopt;
    }
    return it->second.role;
}

const Participant* RoomState::Find(const std::string& peer_id) const {
    auto it = roster.find(peer_id);
    return it == roster.end() ? nullptr : &it->second;
}

MemberView RoomState::ViewOf(const Participant& participant) const {
    MemberView view;
    view.peer_id = participant.peer_id;
    view.participant_id = participant.participant_id;
    view.display_name = participant.display_name;
    view.role = participant.role;
    if (auto mic = media.Track(participant.peer_id, MediaField::kMic)) {
        view.mic = mic->state;
    }
    if (auto camera = media.Track(participant.peer_id, MediaField::kCamera)) {
        view.camera = camera->state;
    }
    return view;
}

// 房间租赁
RoomRegistry::Lease::Lease(std::shared_ptr<Room> room, std::unique_lock<std::mutex> lock)
    : room_(std::move(room)), lock_(std::move(lock)) {}

RoomRegistry::Lease& RoomRegistry::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        // 先解锁当前房间, 再释放其引用
        Release();
        room_ = std::move(other.room_);
        lock_ = std::move(other.lock_);
    }
    return *this;
}

RoomState* RoomRegistry::Lease::operator->() noexcept {
    return &room_->state_;
}

RoomState& RoomRegistry::Lease::operator*() noexcept {
    return room_->state_;
}

const RoomState* RoomRegistry::Lease::operator->() const noexcept {
    return &room_->state_;
}

const RoomState& RoomRegistry::Lease::operator*() const noexcept {
    return room_->state_;
}

const std::string& RoomRegistry::Lease::RoomId() const noexcept {
    return room_->room_id_;
}

void RoomRegistry::Lease::Release() {
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
    room_.reset();
}

RoomRegistry::RoomRegistry(int default_capacity)
    : default_capacity_(default_capacity > 0 ? default_capacity : 1) {}

huddle::common::StatusOr<RoomRegistry::Lease> RoomRegistry::Acquire(const std::string& room_id) {
    std::shared_ptr<Room> room;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = rooms_.find(room_id);
        if (it == rooms_.end()) {
            return huddle::common::Status::NotFound("Room " + room_id + " does not exist.");
        }
        room = it->second;
    }
    std::unique_lock<std::mutex> room_lock(room->mutex_);
    if (room->destroyed_) {
        return huddle::common::Status::NotFound("Room " + room_id + " does not exist.");
    }
    return huddle::common::StatusOr<Lease>(Lease(std::move(room), std::move(room_lock)));
}

RoomRegistry::Lease RoomRegistry::AcquireOrCreate(const RoomMeta& meta) {
    for (;;) {
        std::shared_ptr<Room> room;
        bool created = false;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto& slot = rooms_[meta.room_id];
            if (!slot) {
                slot = std::make_shared<Room>(meta.room_id);
                slot->state_.meta = meta;
                slot->state_.capacity = meta.capacity > 0 ? meta.capacity : default_capacity_;
                created = true;
            }
            room = slot;
        }
        std::unique_lock<std::mutex> room_lock(room->mutex_);
        // 等锁期间房间可能已被销毁, 重新查找或创建
        if (room->destroyed_) {
            continue;
        }
        if (created) {
            HUDDLE_LOG_INFO("[RoomRegistry] Room {} created (capacity={})", meta.room_id, room->state_.capacity);
        }
        return Lease(std::move(room), std::move(room_lock));
    }
}

huddle::common::StatusOr<MembershipSnapshot> RoomRegistry::Join(Lease& lease, const JoinRequest& request) {
    if (!lease) {
        return FromRoomError(RoomErrorCode::kInternal, "Join requires a locked room.");
    }
    const Participant& participant = request.participant;
    if (participant.peer_id.empty() || participant.participant_id.empty()) {
        return FromRoomError(RoomErrorCode::kInvalidArgument, "Peer ID and participant ID are required.");
    }

    RoomState& room = *lease;
    const std::string& room_id = lease.RoomId();
    if (room.IsMember(participant.peer_id)) {
        return FromRoomError(RoomErrorCode::kAlreadyActive, "Peer " + participant.peer_id + " is already in the room.");
    }
    if (!room.meta.passcode.empty() && request.passcode != room.meta.passcode) {
        return FromRoomError(RoomErrorCode::kWrongPasscode);
    }
    if (room.members.size() >= static_cast<std::size_t>(room.capacity)) {
        return FromRoomError(RoomErrorCode::kRoomFull,
                             "Room " + room_id + " is full (" + std::to_string(room.capacity) + ").");
    }

    // 连接同一时刻最多属于一个房间, 检查与登记在注册表锁内原子完成
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto inserted = peer_rooms_.emplace(participant.peer_id, room_id);
        if (!inserted.second) {
            return FromRoomError(RoomErrorCode::kAlreadyActive,
                                 "Peer " + participant.peer_id + " is already in room " + inserted.first->second + ".");
        }
    }

    if (request.history && !room.ledger.Contains(participant.participant_id)) {
        room.ledger.Restore(participant.participant_id, *request.history);
    }
    auto opened = room.ledger.OpenSession(participant.participant_id, request.at);
    if (!opened.IsOk()) {
        if (ToRoomError(opened) != RoomErrorCode::kAlreadyActive) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            peer_rooms_.erase(participant.peer_id);
            return opened;
        }
        // 同一参与者的另一个连接仍在房间内, 沿用其会话
        HUDDLE_LOG_WARN("[RoomRegistry] {} in room {}: {}", participant.participant_id, room_id, opened.Message());
    }

    Participant stored = participant;
    stored.room_id = room_id;
    room.members.push_back(stored.peer_id);
    room.known[stored.participant_id] = stored;
    room.last_seen[stored.peer_id] = request.at;
    room.roster.emplace(stored.peer_id, stored);
    room.media.Init(stored.peer_id, request.media);
    room.destroyable = false;

    MembershipSnapshot snapshot;
    snapshot.room_id = room_id;
    snapshot.self_peer_id = stored.peer_id;
    for (const auto& peer_id : room.members) {
        if (peer_id == stored.peer_id) {
            continue;
        }
        if (const Participant* other = room.Find(peer_id)) {
            snapshot.members.push_back(room.ViewOf(*other));
        }
    }
    return huddle::common::StatusOr<MembershipSnapshot>(std::move(snapshot));
}

huddle::common::StatusOr<LeaveResult> RoomRegistry::Leave(Lease& lease, const std::string& peer_id, std::int64_t at) {
    if (!lease) {
        return FromRoomError(RoomErrorCode::kInternal, "Leave requires a locked room.");
    }
    RoomState& room = *lease;
    auto it = room.roster.find(peer_id);
    if (it == room.roster.end()) {
        return FromRoomError(RoomErrorCode::kNotAMember, "Peer " + peer_id + " is not in room " + lease.RoomId() + ".");
    }

    LeaveResult result;
    result.participant = std::move(it->second);
    room.roster.erase(it);
    room.members.erase(std::remove(room.members.begin(), room.members.end(), peer_id), room.members.end());
    room.last_seen.erase(peer_id);
    room.media.Reset(peer_id);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto pit = peer_rooms_.find(peer_id);
        if (pit != peer_rooms_.end() && pit->second == lease.RoomId()) {
            peer_rooms_.erase(pit);
        }
    }

    const std::string& participant_id = result.participant.participant_id;
    const bool still_present = std::any_of(room.roster.begin(), room.roster.end(),
                                           [&](const auto& entry) { return entry.second.participant_id == participant_id; });
    if (!still_present) {
        auto closed = room.ledger.CloseSession(participant_id, at);
        if (closed.IsOk()) {
            result.closed = std::move(closed.Value());
        } else {
            HUDDLE_LOG_WARN("[RoomRegistry] {} in room {}: {}", participant_id, lease.RoomId(), closed.GetStatus().Message());
        }
    }

    result.room_empty = room.members.empty();
    room.destroyable = result.room_empty;
    return huddle::common::StatusOr<LeaveResult>(std::move(result));
}

huddle::common::Status RoomRegistry::Destroy(Lease& lease) {
    if (!lease) {
        return FromRoomError(RoomErrorCode::kInternal, "Destroy requires a locked room.");
    }
    if (!lease->members.empty() || !lease->destroyable) {
        return huddle::common::Status::FailedPrecondition("Room " + lease.RoomId() + " still has members.");
    }
    lease.room_->destroyed_ = true;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = rooms_.find(lease.RoomId());
        if (it != rooms_.end() && it->second == lease.room_) {
            rooms_.erase(it);
        }
    }
    HUDDLE_LOG_INFO("[RoomRegistry] Room {} destroyed", lease.RoomId());
    return huddle::common::Status::OK();
}

std::vector<std::string> RoomRegistry::MembersOf(const Lease& lease) const {
    if (!lease) {
        return {};
    }
    return lease->members;
}

huddle::common::StatusOr<std::vector<std::string>> RoomRegistry::MembersOf(const std::string& room_id) {
    auto lease = Acquire(room_id);
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    return huddle::common::StatusOr<std::vector<std::string>>(MembersOf(lease.Value()));
}

std::optional<std::string> RoomRegistry::RoomOf(const std::string& peer_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = peer_rooms_.find(peer_id);
    if (it == peer_rooms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> RoomRegistry::RoomIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(rooms_.size());
    for (const auto& entry : rooms_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::size_t RoomRegistry::RoomCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rooms_.size();
}

} // namespace core
} // namespace huddle
