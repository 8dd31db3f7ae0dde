#include "common/clock.hpp"
#include "core/room/errors.hpp"
#include "core/room/room_coordinator.hpp"
#include "test_room_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using huddle::common::ManualClock;
using huddle::common::Status;
using huddle::core::ChangeRoleCommand;
using huddle::core::ConnectCommand;
using huddle::core::CoordinatorOptions;
using huddle::core::DisconnectCommand;
using huddle::core::EndMeetingCommand;
using huddle::core::InMemoryRoomStore;
using huddle::core::KickCommand;
using huddle::core::MediaState;
using huddle::core::MediaUpdateCommand;
using huddle::core::MembershipSnapshot;
using huddle::core::OutboundEventType;
using huddle::core::PersistenceDispatcher;
using huddle::core::RetryPolicy;
using huddle::core::Role;
using huddle::core::RoomCoordinator;
using huddle::core::RoomErrorCode;
using huddle::core::RoomMeta;
using huddle::core::RoomRegistry;
using huddle::core::SignalCommand;
using huddle::core::SignalType;
using huddle::core::ToRoomError;

namespace {

RetryPolicy FastPolicy() {
    RetryPolicy policy;
    policy.max_attempts = 5;
    policy.initial_backoff = std::chrono::milliseconds(1);
    policy.max_backoff = std::chrono::milliseconds(1);
    return policy;
}

constexpr auto kWait = std::chrono::seconds(5);

// 房间元数据读取失败的存储
class BrokenMetaStore : public InMemoryRoomStore {
public:
    huddle::common::StatusOr<RoomMeta> LoadRoomMeta(const std::string& room_id) const override {
        (void)room_id;
        return Status::Unavailable("mysql gone away");
    }
};

} // namespace

class RoomCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Build(std::make_shared<InMemoryRoomStore>());
    }

    void TearDown() override {
        dispatcher_->Stop();
    }

    void Build(std::shared_ptr<InMemoryRoomStore> store) {
        if (dispatcher_) {
            dispatcher_->Stop();
        }
        clock_ = std::make_shared<ManualClock>(1000);
        store_ = std::move(store);
        sink_ = std::make_shared<testutils::RecordingSink>();
        dispatcher_ = std::make_shared<PersistenceDispatcher>(FastPolicy());
        registry_ = std::make_shared<RoomRegistry>(100);
        CoordinatorOptions options;
        options.heartbeat_timeout_sec = 60;
        options.admin_user_ids = {"ops"};
        coordinator_ = std::make_unique<RoomCoordinator>(registry_, store_, sink_, dispatcher_, clock_, options);
    }

    huddle::common::StatusOr<MembershipSnapshot> Join(const std::string& room_id
                                                      , const std::string& peer_id
                                                      , const std::string& user_id
                                                      , const std::string& passcode = "") {
        ConnectCommand command;
        command.room_id = room_id;
        command.peer_id = peer_id;
        command.user_id = user_id;
        command.display_name = user_id.empty() ? peer_id : user_id;
        command.passcode = passcode;
        return coordinator_->Connect(command);
    }

    void PutMeta(const std::string& room_id, const std::string& host_user_id, const std::string& passcode = "", int capacity = 0) {
        RoomMeta meta;
        meta.room_id = room_id;
        meta.host_user_id = host_user_id;
        meta.passcode = passcode;
        meta.capacity = capacity;
        ASSERT_TRUE(store_->PutRoomMeta(meta).IsOk());
    }

    Status Mute(const std::string& actor, const std::string& target, MediaState mic) {
        MediaUpdateCommand command;
        command.room_id = "r1";
        command.actor_peer_id = actor;
        command.target_peer_id = target;
        command.mic = mic;
        return coordinator_->UpdateMedia(command);
    }

    std::vector<huddle::core::AuditEntry> AuditOf(const std::string& action) const {
        std::vector<huddle::core::AuditEntry> matched;
        for (const auto& entry : store_->AuditEntries()) {
            if (entry.action == action) {
                matched.push_back(entry);
            }
        }
        return matched;
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemoryRoomStore> store_;
    std::shared_ptr<testutils::RecordingSink> sink_;
    std::shared_ptr<PersistenceDispatcher> dispatcher_;
    std::shared_ptr<RoomRegistry> registry_;
    std::unique_ptr<RoomCoordinator> coordinator_;
};

TEST_F(RoomCoordinatorTest, TwoPeersExchangeOfferAndLeave) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    auto joined_b = Join("r1", "B", "bob");
    ASSERT_TRUE(joined_b.IsOk());
    ASSERT_EQ(joined_b.Value().members.size(), 1u);
    EXPECT_EQ(joined_b.Value().members[0].peer_id, "A");

    auto announced = sink_->EventsOf("A", OutboundEventType::kPeerJoined);
    ASSERT_EQ(announced.size(), 1u);
    EXPECT_EQ(announced[0].peer_id, "B");
    EXPECT_EQ(sink_->CountOf("B", OutboundEventType::kPeerJoined), 0u);
    EXPECT_EQ(sink_->CountOf("B", OutboundEventType::kMembership), 1u);

    SignalCommand offer;
    offer.room_id = "r1";
    offer.envelope.from = "A";
    offer.envelope.to = "B";
    offer.envelope.type = SignalType::kOffer;
    offer.envelope.sdp = "v=0 offer";
    ASSERT_TRUE(coordinator_->Signal(offer).IsOk());

    auto signals = sink_->EventsOf("B", OutboundEventType::kSignal);
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].signal.from, "A");
    EXPECT_EQ(signals[0].signal.sdp, "v=0 offer");
    EXPECT_EQ(sink_->CountOf("A", OutboundEventType::kSignal), 0u);

    clock_->Advance(20);
    ASSERT_TRUE(coordinator_->Disconnect(DisconnectCommand{"r1", "A", "left"}).IsOk());

    auto left = sink_->EventsOf("B", OutboundEventType::kPeerLeft);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].peer_id, "A");

    auto members = registry_->MembersOf("r1");
    ASSERT_TRUE(members.IsOk());
    EXPECT_EQ(members.Value(), std::vector<std::string>{"B"});

    ASSERT_TRUE(dispatcher_->WaitIdle(kWait));
    EXPECT_EQ(store_->TotalDurationSec("r1", "alice"), 20);
    auto sessions = store_->LoadSessions("r1", "alice");
    ASSERT_TRUE(sessions.IsOk());
    ASSERT_EQ(sessions.Value().size(), 1u);
    EXPECT_EQ(*sessions.Value()[0].duration_sec, 20);
}

TEST_F(RoomCoordinatorTest, SignalToUnknownPeerRejectedToSenderOnly) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    ASSERT_TRUE(Join("r1", "B", "bob").IsOk());
    sink_->Clear();

    SignalCommand stray;
    stray.envelope.from = "A";
    stray.envelope.to = "ghost";
    auto status = coordinator_->Signal(stray);
    EXPECT_EQ(ToRoomError(status), RoomErrorCode::kUnknownTarget);

    auto rejected = sink_->EventsOf("A", OutboundEventType::kRejected);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].code, static_cast<int>(RoomErrorCode::kUnknownTarget));
    EXPECT_TRUE(sink_->EventsFor("B").empty());
}

TEST_F(RoomCoordinatorTest, HostMuteLocksSelfUnmute) {
    PutMeta("r1", "hostuser");
    auto host = Join("r1", "H", "hostuser");
    ASSERT_TRUE(host.IsOk());
    ASSERT_TRUE(Join("r1", "M", "member").IsOk());
    sink_->Clear();

    ASSERT_TRUE(Mute("H", "M", MediaState::kMutedByHost).IsOk());
    auto changed = sink_->EventsOf("M", OutboundEventType::kMediaChanged);
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0].peer_id, "M");
    ASSERT_TRUE(changed[0].mic.has_value());
    EXPECT_EQ(*changed[0].mic, MediaState::kMutedByHost);
    EXPECT_FALSE(changed[0].camera.has_value());
    EXPECT_EQ(sink_->CountOf("H", OutboundEventType::kMediaChanged), 1u);

    auto self_unmute = Mute("M", "", MediaState::kOn);
    EXPECT_EQ(ToRoomError(self_unmute), RoomErrorCode::kForbidden);
    auto rejected = sink_->EventsOf("M", OutboundEventType::kRejected);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].code, static_cast<int>(RoomErrorCode::kForbidden));
    EXPECT_EQ(sink_->CountOf("H", OutboundEventType::kRejected), 0u);
    EXPECT_EQ(sink_->CountOf("H", OutboundEventType::kMediaChanged), 1u);

    ASSERT_TRUE(dispatcher_->WaitIdle(kWait));
    auto audit = AuditOf("UPDATE_MEDIA");
    ASSERT_EQ(audit.size(), 1u);
    EXPECT_EQ(audit[0].admin_id, "hostuser");
    EXPECT_EQ(audit[0].target_id, "member");
    EXPECT_EQ(audit[0].metadata, "mic=MUTED_BY_HOST");
}

TEST_F(RoomCoordinatorTest, MediaUpdateIsAllOrNothing) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    MediaUpdateCommand command;
    command.room_id = "r1";
    command.actor_peer_id = "A";
    command.mic = MediaState::kOff;
    command.camera = MediaState::kMuted;  // 摄像头没有 MUTED
    EXPECT_EQ(ToRoomError(coordinator_->UpdateMedia(command)), RoomErrorCode::kInvalidArgument);

    auto lease = registry_->Acquire("r1");
    ASSERT_TRUE(lease.IsOk());
    EXPECT_EQ(lease.Value()->media.Track("A", huddle::core::MediaField::kMic)->state, MediaState::kOn);
}

TEST_F(RoomCoordinatorTest, EmptyMediaUpdateRejected) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    MediaUpdateCommand command;
    command.room_id = "r1";
    command.actor_peer_id = "A";
    EXPECT_EQ(ToRoomError(coordinator_->UpdateMedia(command)), RoomErrorCode::kInvalidArgument);
}

TEST_F(RoomCoordinatorTest, EventsObservedInCommitOrder) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    ASSERT_TRUE(Join("r1", "B", "bob").IsOk());
    sink_->Clear();

    const std::vector<MediaState> sequence{MediaState::kOff, MediaState::kOn, MediaState::kMuted, MediaState::kOn};
    for (auto state : sequence) {
        ASSERT_TRUE(Mute("A", "", state).IsOk());
    }
    auto observed = sink_->EventsOf("B", OutboundEventType::kMediaChanged);
    ASSERT_EQ(observed.size(), sequence.size());
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        EXPECT_EQ(*observed[i].mic, sequence[i]);
    }
}

TEST_F(RoomCoordinatorTest, WrongPasscodeRejectedAndRoomNotKept) {
    PutMeta("r1", "", "1234");
    auto joined = Join("r1", "A", "alice", "9999");
    ASSERT_FALSE(joined.IsOk());
    EXPECT_EQ(ToRoomError(joined.GetStatus()), RoomErrorCode::kWrongPasscode);
    EXPECT_EQ(sink_->CountOf("A", OutboundEventType::kRejected), 1u);
    EXPECT_EQ(registry_->RoomCount(), 0u);

    EXPECT_TRUE(Join("r1", "A", "alice", "1234").IsOk());
}

TEST_F(RoomCoordinatorTest, RoomFullRejected) {
    PutMeta("r1", "", "", 1);
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    auto joined = Join("r1", "B", "bob");
    EXPECT_EQ(ToRoomError(joined.GetStatus()), RoomErrorCode::kRoomFull);
    EXPECT_EQ(sink_->CountOf("A", OutboundEventType::kPeerJoined), 0u);
}

TEST_F(RoomCoordinatorTest, PeerCannotJoinTwoRooms) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    auto second = Join("r2", "A", "alice");
    EXPECT_EQ(ToRoomError(second.GetStatus()), RoomErrorCode::kAlreadyActive);
    EXPECT_EQ(registry_->RoomOf("A").value_or(""), "r1");
    EXPECT_EQ(registry_->RoomCount(), 1u);
}

TEST_F(RoomCoordinatorTest, MetaLoadFailureIsStorageUnavailable) {
    Build(std::make_shared<BrokenMetaStore>());
    auto joined = Join("r1", "A", "alice");
    EXPECT_EQ(ToRoomError(joined.GetStatus()), RoomErrorCode::kStorageUnavailable);
    EXPECT_EQ(registry_->RoomCount(), 0u);
}

TEST_F(RoomCoordinatorTest, GuestsGetPeerScopedParticipantId) {
    auto joined = Join("r1", "G1", "");
    ASSERT_TRUE(joined.IsOk());
    auto attendance = coordinator_->Attendance("r1");
    ASSERT_TRUE(attendance.IsOk());
    ASSERT_EQ(attendance.Value().size(), 1u);
    EXPECT_EQ(attendance.Value()[0].participant_id, "guest:G1");
}

TEST_F(RoomCoordinatorTest, DisconnectIsIdempotent) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    ASSERT_TRUE(Join("r1", "B", "bob").IsOk());
    EXPECT_TRUE(coordinator_->Disconnect(DisconnectCommand{"", "A", "left"}).IsOk());
    EXPECT_TRUE(coordinator_->Disconnect(DisconnectCommand{"", "A", "left"}).IsOk());
    EXPECT_TRUE(coordinator_->Disconnect(DisconnectCommand{"r1", "nobody", "left"}).IsOk());
    EXPECT_EQ(sink_->CountOf("B", OutboundEventType::kPeerLeft), 1u);
}

TEST_F(RoomCoordinatorTest, LastLeaveDestroysRoom) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    coordinator_->OnPeerGone("A", "connection closed");
    EXPECT_EQ(registry_->RoomCount(), 0u);
    EXPECT_FALSE(coordinator_->Attendance("r1").IsOk());
}

TEST_F(RoomCoordinatorTest, SlowConsumerIsEvicted) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    ASSERT_TRUE(Join("r1", "B", "bob").IsOk());
    ASSERT_TRUE(Join("r1", "C", "carol").IsOk());
    sink_->SetOverflow("C");

    ASSERT_TRUE(Mute("A", "", MediaState::kOff).IsOk());

    EXPECT_FALSE(registry_->RoomOf("C").has_value());
    auto left = sink_->EventsOf("B", OutboundEventType::kPeerLeft);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].peer_id, "C");
    EXPECT_EQ(left[0].reason, "outbound queue overflow");
    auto members = registry_->MembersOf("r1");
    ASSERT_TRUE(members.IsOk());
    EXPECT_EQ(members.Value(), (std::vector<std::string>{"A", "B"}));
}

TEST_F(RoomCoordinatorTest, TransientStoreFailuresAreRetried) {
    auto flaky = std::make_shared<testutils::FlakyRoomStore>(2);
    Build(flaky);
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    clock_->Advance(15);
    ASSERT_TRUE(coordinator_->Disconnect(DisconnectCommand{"r1", "A", "left"}).IsOk());

    ASSERT_TRUE(dispatcher_->WaitIdle(kWait));
    EXPECT_EQ(flaky->SaveCalls(), 3);
    auto saved = flaky->Saved("alice");
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(*saved[0].duration_sec, 15);
    EXPECT_EQ(flaky->TotalDurationSec("r1", "alice"), 15);
    EXPECT_EQ(dispatcher_->Failed(), 0u);
}

TEST_F(RoomCoordinatorTest, KickRemovesTargetAndClosesChannel) {
    PutMeta("r1", "hostuser");
    ASSERT_TRUE(Join("r1", "H", "hostuser").IsOk());
    ASSERT_TRUE(Join("r1", "M", "member").IsOk());
    ASSERT_TRUE(Join("r1", "O", "observer").IsOk());

    EXPECT_EQ(ToRoomError(coordinator_->Kick(KickCommand{"r1", "H", "H", ""})), RoomErrorCode::kInvalidArgument);
    EXPECT_EQ(ToRoomError(coordinator_->Kick(KickCommand{"r1", "M", "O", ""})), RoomErrorCode::kForbidden);
    EXPECT_EQ(ToRoomError(coordinator_->Kick(KickCommand{"r1", "H", "ghost", ""})), RoomErrorCode::kUnknownTarget);

    ASSERT_TRUE(coordinator_->Kick(KickCommand{"r1", "H", "M", "spam"}).IsOk());
    auto notice = sink_->EventsOf("M", OutboundEventType::kKicked);
    ASSERT_EQ(notice.size(), 1u);
    EXPECT_EQ(notice[0].reason, "spam");
    EXPECT_TRUE(sink_->WasClosed("M"));
    EXPECT_FALSE(registry_->RoomOf("M").has_value());

    auto left = sink_->EventsOf("O", OutboundEventType::kPeerLeft);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].reason, "kicked");

    ASSERT_TRUE(dispatcher_->WaitIdle(kWait));
    auto audit = AuditOf("KICK_PARTICIPANT");
    ASSERT_EQ(audit.size(), 1u);
    EXPECT_EQ(audit[0].target_id, "member");
}

TEST_F(RoomCoordinatorTest, PromotingToHostDemotesPreviousHost) {
    PutMeta("r1", "hostuser");
    ASSERT_TRUE(Join("r1", "H", "hostuser").IsOk());
    ASSERT_TRUE(Join("r1", "M", "member").IsOk());

    EXPECT_EQ(ToRoomError(coordinator_->ChangeRole(ChangeRoleCommand{"r1", "M", "H", Role::kMember})),
              RoomErrorCode::kForbidden);
    EXPECT_EQ(ToRoomError(coordinator_->ChangeRole(ChangeRoleCommand{"r1", "H", "M", Role::kAdmin})),
              RoomErrorCode::kInvalidArgument);

    ASSERT_TRUE(coordinator_->ChangeRole(ChangeRoleCommand{"r1", "H", "M", Role::kHost}).IsOk());
    {
        auto lease = registry_->Acquire("r1");
        ASSERT_TRUE(lease.IsOk());
        EXPECT_EQ(*lease.Value()->RoleOf("M"), Role::kHost);
        EXPECT_EQ(*lease.Value()->RoleOf("H"), Role::kCoHost);
    }
    auto changes = sink_->EventsOf("H", OutboundEventType::kRoleChanged);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].peer_id, "H");
    EXPECT_EQ(*changes[0].role, Role::kCoHost);
    EXPECT_EQ(changes[1].peer_id, "M");
    EXPECT_EQ(*changes[1].role, Role::kHost);

    ASSERT_TRUE(dispatcher_->WaitIdle(kWait));
    auto audit = AuditOf("CHANGE_ROLE");
    ASSERT_EQ(audit.size(), 1u);
    EXPECT_EQ(audit[0].metadata, "MEMBER->HOST");
}

TEST_F(RoomCoordinatorTest, HostEndsMeetingForEveryone) {
    PutMeta("r1", "hostuser");
    ASSERT_TRUE(Join("r1", "H", "hostuser").IsOk());
    ASSERT_TRUE(Join("r1", "M", "member").IsOk());

    EXPECT_EQ(ToRoomError(coordinator_->EndMeeting(EndMeetingCommand{"r1", "M", ""})), RoomErrorCode::kForbidden);
    EXPECT_EQ(registry_->RoomCount(), 1u);

    clock_->Advance(30);
    ASSERT_TRUE(coordinator_->EndMeeting(EndMeetingCommand{"r1", "H", ""}).IsOk());
    for (const char* peer : {"H", "M"}) {
        auto ended = sink_->EventsOf(peer, OutboundEventType::kMeetingEnded);
        ASSERT_EQ(ended.size(), 1u) << peer;
        EXPECT_EQ(ended[0].reason, "ended by host");
    }
    EXPECT_EQ(registry_->RoomCount(), 0u);
    EXPECT_FALSE(registry_->RoomOf("M").has_value());
    EXPECT_TRUE(sink_->WasClosed("H"));
    EXPECT_TRUE(sink_->WasClosed("M"));

    ASSERT_TRUE(dispatcher_->WaitIdle(kWait));
    EXPECT_EQ(store_->TotalDurationSec("r1", "hostuser"), 30);
    EXPECT_EQ(store_->TotalDurationSec("r1", "member"), 30);
    EXPECT_EQ(AuditOf("END_MEETING").size(), 1u);
}

TEST_F(RoomCoordinatorTest, SweepRemovesStalePeers) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    ASSERT_TRUE(Join("r1", "B", "bob").IsOk());

    clock_->Advance(50);
    ASSERT_TRUE(coordinator_->Heartbeat("", "B").IsOk());
    EXPECT_EQ(sink_->CountOf("B", OutboundEventType::kPong), 1u);

    clock_->Advance(20);
    EXPECT_EQ(coordinator_->SweepStalePeers(), 1u);
    EXPECT_FALSE(registry_->RoomOf("A").has_value());
    EXPECT_TRUE(sink_->WasClosed("A"));
    auto left = sink_->EventsOf("B", OutboundEventType::kPeerLeft);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].reason, "heartbeat timeout");

    EXPECT_EQ(coordinator_->SweepStalePeers(), 0u);
}

TEST_F(RoomCoordinatorTest, HeartbeatFromStrangerRejected) {
    EXPECT_EQ(ToRoomError(coordinator_->Heartbeat("", "ghost")), RoomErrorCode::kNotAMember);
}

TEST_F(RoomCoordinatorTest, AttendanceReportsLiveTotals) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    ASSERT_TRUE(Join("r1", "B", "bob").IsOk());
    clock_->Advance(30);
    ASSERT_TRUE(coordinator_->Disconnect(DisconnectCommand{"r1", "A", "left"}).IsOk());
    clock_->Advance(70);
    ASSERT_TRUE(Join("r1", "A2", "alice").IsOk());
    clock_->Advance(10);

    auto attendance = coordinator_->Attendance("r1");
    ASSERT_TRUE(attendance.IsOk());
    ASSERT_EQ(attendance.Value().size(), 2u);
    const auto& alice = attendance.Value()[0];
    EXPECT_EQ(alice.participant_id, "alice");
    EXPECT_TRUE(alice.connected);
    EXPECT_EQ(alice.session_count, 2u);
    EXPECT_EQ(alice.total_duration_sec, 40);
    const auto& bob = attendance.Value()[1];
    EXPECT_EQ(bob.total_duration_sec, 110);

    EXPECT_EQ(coordinator_->Attendance("nowhere").GetStatus().Code(), huddle::common::StatusCode::kNotFound);
}

TEST_F(RoomCoordinatorTest, AttendanceIsScopedToOneMeeting) {
    ASSERT_TRUE(Join("r1", "A", "alice").IsOk());
    clock_->Advance(100);
    ASSERT_TRUE(coordinator_->Disconnect(DisconnectCommand{"r1", "A", "left"}).IsOk());
    ASSERT_TRUE(dispatcher_->WaitIdle(kWait));

    ASSERT_TRUE(Join("r2", "A2", "alice").IsOk());
    clock_->Advance(10);
    auto attendance = coordinator_->Attendance("r2");
    ASSERT_TRUE(attendance.IsOk());
    ASSERT_EQ(attendance.Value().size(), 1u);
    EXPECT_EQ(attendance.Value()[0].session_count, 1u);
    EXPECT_EQ(attendance.Value()[0].total_duration_sec, 10);

    ASSERT_TRUE(coordinator_->Disconnect(DisconnectCommand{"r2", "A2", "left"}).IsOk());
    ASSERT_TRUE(dispatcher_->WaitIdle(kWait));
    EXPECT_EQ(store_->TotalDurationSec("r1", "alice"), 100);
    EXPECT_EQ(store_->TotalDurationSec("r2", "alice"), 10);
    EXPECT_EQ(store_->LoadSessions("r2", "alice").Value().size(), 1u);
}

TEST_F(RoomCoordinatorTest, RolesComeFromServerSideSettings) {
    PutMeta("r1", "hostuser");
    ASSERT_TRUE(Join("r1", "M", "member").IsOk());
    ASSERT_TRUE(Join("r1", "H", "hostuser").IsOk());
    ASSERT_TRUE(Join("r1", "X", "ops").IsOk());
    ASSERT_TRUE(Join("r1", "G", "").IsOk());

    auto lease = registry_->Acquire("r1");
    ASSERT_TRUE(lease.IsOk());
    EXPECT_EQ(*lease.Value()->RoleOf("M"), Role::kMember);
    EXPECT_EQ(*lease.Value()->RoleOf("H"), Role::kHost);
    EXPECT_EQ(*lease.Value()->RoleOf("X"), Role::kAdmin);
    EXPECT_EQ(*lease.Value()->RoleOf("G"), Role::kMember);
}

TEST_F(RoomCoordinatorTest, RepairDropsMalformedHistory) {
    huddle::core::SessionRecord first;
    first.joined_at = 100;
    first.left_at = 130;
    first.duration_sec = 30;
    huddle::core::SessionRecord broken;
    broken.left_at = 400;
    huddle::core::SessionRecord second;
    second.joined_at = 200;
    second.left_at = 245;
    second.duration_sec = 45;
    for (const auto& record : {first, broken, second}) {
        ASSERT_TRUE(store_->SaveSession("r1", "carol", record).IsOk());
    }

    ASSERT_TRUE(Join("r1", "C", "carol").IsOk());
    auto total = coordinator_->RepairParticipant("r1", "carol");
    ASSERT_TRUE(total.IsOk()) << total.GetStatus().Message();
    EXPECT_EQ(total.Value(), 75);

    ASSERT_TRUE(dispatcher_->WaitIdle(kWait));
    EXPECT_EQ(store_->TotalDurationSec("r1", "carol"), 75);

    auto unknown = coordinator_->RepairParticipant("r1", "nobody");
    EXPECT_EQ(ToRoomError(unknown.GetStatus()), RoomErrorCode::kUnknownTarget);
}

TEST_F(RoomCoordinatorTest, RoomsProgressIndependently) {
    constexpr int kRooms = 8;
    constexpr int kPeersPerRoom = 5;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int r = 0; r < kRooms; ++r) {
        threads.emplace_back([&, r]() {
            const std::string room_id = "room-" + std::to_string(r);
            for (int p = 0; p < kPeersPerRoom; ++p) {
                const std::string peer = room_id + "-p" + std::to_string(p);
                if (!Join(room_id, peer, peer).IsOk()) {
                    ++failures;
                }
                MediaUpdateCommand command;
                command.actor_peer_id = peer;
                command.camera = MediaState::kOff;
                if (!coordinator_->UpdateMedia(command).IsOk()) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(registry_->RoomCount(), static_cast<std::size_t>(kRooms));
    for (int r = 0; r < kRooms; ++r) {
        auto members = registry_->MembersOf("room-" + std::to_string(r));
        ASSERT_TRUE(members.IsOk());
        EXPECT_EQ(members.Value().size(), static_cast<std::size_t>(kPeersPerRoom));
    }
}
