#include "common/clock.hpp"
#include "core/room/room_coordinator.hpp"
#include "server/presence_sweeper.hpp"
#include "test_room_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using huddle::server::PresenceSweeper;

class PresenceSweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<huddle::common::ManualClock>(0);
        registry_ = std::make_shared<huddle::core::RoomRegistry>();
        dispatcher_ = std::make_shared<huddle::core::PersistenceDispatcher>();
        huddle::core::CoordinatorOptions options;
        options.heartbeat_timeout_sec = 5;
        coordinator_ = std::make_shared<huddle::core::RoomCoordinator>(
            registry_, std::make_shared<huddle::core::InMemoryRoomStore>(),
            std::make_shared<testutils::RecordingSink>(), dispatcher_, clock_, options);
    }

    void TearDown() override {
        dispatcher_->Stop();
    }

    std::shared_ptr<huddle::common::ManualClock> clock_;
    std::shared_ptr<huddle::core::RoomRegistry> registry_;
    std::shared_ptr<huddle::core::PersistenceDispatcher> dispatcher_;
    std::shared_ptr<huddle::core::RoomCoordinator> coordinator_;
};

TEST_F(PresenceSweeperTest, ZeroIntervalDisables) {
    PresenceSweeper sweeper(coordinator_, std::chrono::milliseconds(0));
    sweeper.Start();
    EXPECT_FALSE(sweeper.Running());
    sweeper.Stop();
}

TEST_F(PresenceSweeperTest, RemovesStalePeersPeriodically) {
    huddle::core::ConnectCommand command;
    command.room_id = "r1";
    command.peer_id = "idle";
    command.user_id = "u-idle";
    ASSERT_TRUE(coordinator_->Connect(command).IsOk());
    clock_->Advance(10);

    PresenceSweeper sweeper(coordinator_, std::chrono::milliseconds(5));
    sweeper.Start();
    EXPECT_TRUE(sweeper.Running());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (registry_->RoomOf("idle").has_value() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    sweeper.Stop();
    EXPECT_FALSE(sweeper.Running());
    EXPECT_FALSE(registry_->RoomOf("idle").has_value());
    EXPECT_EQ(registry_->RoomCount(), 0u);
}
