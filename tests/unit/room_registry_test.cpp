#include "core/room/errors.hpp"
#include "core/room/room_registry.hpp"
#include "test_room_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using huddle::core::JoinRequest;
using huddle::core::MediaState;
using huddle::core::RoomErrorCode;
using huddle::core::RoomMeta;
using huddle::core::RoomRegistry;
using huddle::core::ToRoomError;
using testutils::MakeParticipant;

class RoomRegistryTest : public ::testing::Test {
protected:
    static RoomMeta Meta(const std::string& room_id, int capacity = 0, const std::string& passcode = "") {
        RoomMeta meta;
        meta.room_id = room_id;
        meta.capacity = capacity;
        meta.passcode = passcode;
        return meta;
    }

    static JoinRequest Request(const std::string& peer, const std::string& pid, std::int64_t at = 0) {
        JoinRequest request;
        request.participant = MakeParticipant(peer, pid);
        request.at = at;
        return request;
    }

    RoomRegistry registry_{4};
};

TEST_F(RoomRegistryTest, JoinReturnsSnapshotWithoutSelf) {
    {
        auto lease = registry_.AcquireOrCreate(Meta("r1"));
        ASSERT_TRUE(registry_.Join(lease, Request("a", "ua")).IsOk());
        auto snapshot = registry_.Join(lease, Request("b", "ub"));
        ASSERT_TRUE(snapshot.IsOk());
        EXPECT_EQ(snapshot.Value().self_peer_id, "b");
        ASSERT_EQ(snapshot.Value().members.size(), 1u);
        EXPECT_EQ(snapshot.Value().members[0].peer_id, "a");
        EXPECT_EQ(snapshot.Value().members[0].mic, MediaState::kOn);
    }
    EXPECT_EQ(registry_.RoomOf("a").value_or(""), "r1");
    auto members = registry_.MembersOf("r1");
    ASSERT_TRUE(members.IsOk());
    EXPECT_EQ(members.Value(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(RoomRegistryTest, RejectsDuplicatePeerInSameRoom) {
    auto lease = registry_.AcquireOrCreate(Meta("r1"));
    ASSERT_TRUE(registry_.Join(lease, Request("a", "ua")).IsOk());
    auto again = registry_.Join(lease, Request("a", "ua"));
    EXPECT_EQ(ToRoomError(again.GetStatus()), RoomErrorCode::kAlreadyActive);
    EXPECT_EQ(lease->members.size(), 1u);
}

TEST_F(RoomRegistryTest, PeerBelongsToOneRoomAtATime) {
    {
        auto lease = registry_.AcquireOrCreate(Meta("r1"));
        ASSERT_TRUE(registry_.Join(lease, Request("a", "ua")).IsOk());
    }
    auto lease = registry_.AcquireOrCreate(Meta("r2"));
    auto joined = registry_.Join(lease, Request("a", "ua"));
    EXPECT_EQ(ToRoomError(joined.GetStatus()), RoomErrorCode::kAlreadyActive);
    EXPECT_TRUE(lease->members.empty());
    EXPECT_EQ(registry_.RoomOf("a").value_or(""), "r1");
}

TEST_F(RoomRegistryTest, WrongPasscodeRejected) {
    auto lease = registry_.AcquireOrCreate(Meta("secret", 0, "1234"));
    auto request = Request("a", "ua");
    request.passcode = "0000";
    EXPECT_EQ(ToRoomError(registry_.Join(lease, request).GetStatus()), RoomErrorCode::kWrongPasscode);

    request.passcode = "1234";
    EXPECT_TRUE(registry_.Join(lease, request).IsOk());
}

TEST_F(RoomRegistryTest, CapacityEnforced) {
    auto lease = registry_.AcquireOrCreate(Meta("small", 2));
    EXPECT_EQ(lease->capacity, 2);
    ASSERT_TRUE(registry_.Join(lease, Request("a", "ua")).IsOk());
    ASSERT_TRUE(registry_.Join(lease, Request("b", "ub")).IsOk());
    auto full = registry_.Join(lease, Request("c", "uc"));
    EXPECT_EQ(ToRoomError(full.GetStatus()), RoomErrorCode::kRoomFull);
    EXPECT_FALSE(registry_.RoomOf("c").has_value());
}

TEST_F(RoomRegistryTest, DefaultCapacityUsedWhenUnset) {
    auto lease = registry_.AcquireOrCreate(Meta("r1"));
    EXPECT_EQ(lease->capacity, 4);
}

TEST_F(RoomRegistryTest, LeaveClosesSessionAndReportsEmpty) {
    auto lease = registry_.AcquireOrCreate(Meta("r1"));
    ASSERT_TRUE(registry_.Join(lease, Request("a", "ua", 100)).IsOk());
    ASSERT_TRUE(registry_.Join(lease, Request("b", "ub", 105)).IsOk());

    auto left = registry_.Leave(lease, "a", 130);
    ASSERT_TRUE(left.IsOk());
    ASSERT_TRUE(left.Value().closed.has_value());
    EXPECT_EQ(*left.Value().closed->session.duration_sec, 30);
    EXPECT_FALSE(left.Value().room_empty);
    EXPECT_FALSE(lease->media.Contains("a"));

    auto last = registry_.Leave(lease, "b", 140);
    ASSERT_TRUE(last.IsOk());
    EXPECT_TRUE(last.Value().room_empty);

    auto missing = registry_.Leave(lease, "a", 150);
    EXPECT_EQ(ToRoomError(missing.GetStatus()), RoomErrorCode::kNotAMember);
}

TEST_F(RoomRegistryTest, SameParticipantSharesSessionAcrossConnections) {
    auto lease = registry_.AcquireOrCreate(Meta("r1"));
    ASSERT_TRUE(registry_.Join(lease, Request("phone", "u1", 10)).IsOk());
    ASSERT_TRUE(registry_.Join(lease, Request("laptop", "u1", 20)).IsOk());
    EXPECT_EQ(lease->ledger.Sessions("u1").size(), 1u);

    auto first = registry_.Leave(lease, "phone", 30);
    ASSERT_TRUE(first.IsOk());
    EXPECT_FALSE(first.Value().closed.has_value());
    EXPECT_TRUE(lease->ledger.HasActiveSession("u1"));

    auto second = registry_.Leave(lease, "laptop", 50);
    ASSERT_TRUE(second.IsOk());
    ASSERT_TRUE(second.Value().closed.has_value());
    EXPECT_EQ(second.Value().closed->total_duration_sec, 40);
}

TEST_F(RoomRegistryTest, DestroyedRoomIsRecreatedFresh) {
    {
        auto lease = registry_.AcquireOrCreate(Meta("r1"));
        ASSERT_TRUE(registry_.Join(lease, Request("a", "ua", 0)).IsOk());
        ASSERT_TRUE(registry_.Leave(lease, "a", 10).IsOk());
        ASSERT_TRUE(registry_.Destroy(lease).IsOk());
    }
    EXPECT_EQ(registry_.RoomCount(), 0u);
    EXPECT_FALSE(registry_.Acquire("r1").IsOk());

    auto lease = registry_.AcquireOrCreate(Meta("r1"));
    EXPECT_TRUE(lease->members.empty());
    EXPECT_FALSE(lease->ledger.Contains("ua"));
}

TEST_F(RoomRegistryTest, DestroyRefusesOccupiedRoom) {
    auto lease = registry_.AcquireOrCreate(Meta("r1"));
    ASSERT_TRUE(registry_.Join(lease, Request("a", "ua")).IsOk());
    EXPECT_FALSE(registry_.Destroy(lease).IsOk());
    EXPECT_EQ(registry_.RoomCount(), 1u);
}

TEST_F(RoomRegistryTest, HistoryRestoredOnFirstAppearance) {
    huddle::core::SessionRecord past;
    past.joined_at = 0;
    past.left_at = 60;
    past.duration_sec = 60;

    auto lease = registry_.AcquireOrCreate(Meta("r1"));
    auto request = Request("a", "ua", 100);
    request.history = std::vector<huddle::core::SessionRecord>{past};
    ASSERT_TRUE(registry_.Join(lease, request).IsOk());
    EXPECT_EQ(lease->ledger.Sessions("ua").size(), 2u);
    EXPECT_EQ(lease->ledger.TotalDurationSec("ua"), 60);
}

TEST_F(RoomRegistryTest, ConcurrentJoinsRespectCapacity) {
    RoomRegistry registry(100);
    constexpr int kCapacity = 10;
    constexpr int kThreads = 40;
    std::atomic<int> joined{0};
    std::atomic<int> full{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            auto lease = registry.AcquireOrCreate(Meta("busy", kCapacity));
            auto result = registry.Join(lease, Request("p" + std::to_string(i), "u" + std::to_string(i)));
            if (result.IsOk()) {
                ++joined;
            } else if (ToRoomError(result.GetStatus()) == RoomErrorCode::kRoomFull) {
                ++full;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(joined.load(), kCapacity);
    EXPECT_EQ(full.load(), kThreads - kCapacity);
    auto members = registry.MembersOf("busy");
    ASSERT_TRUE(members.IsOk());
    EXPECT_EQ(members.Value().size(), static_cast<std::size_t>(kCapacity));
}
