#include <gtest/gtest.h>

#include "storage/mysql/room_store.hpp"
#include "test_mysql_utils.hpp"

using huddle::core::AuditEntry;
using huddle::core::RoomMeta;
using huddle::core::SessionRecord;

class MysqlRoomStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = testutils::CreatePoolFromConfig();
        if (!pool_) {
            GTEST_SKIP() << "MySQL disabled in configuration";
        }
        auto conn = pool_->Acquire();
        ASSERT_TRUE(conn.IsOk()) << conn.GetStatus().Message();
        store_ = std::make_unique<huddle::storage::MySqlRoomStore>(pool_);
        testutils::ClearRoomTables(*pool_);
    }

    void TearDown() override {
        if (pool_) {
            testutils::ClearRoomTables(*pool_);
        }
    }

    static SessionRecord Closed(std::int64_t joined, std::int64_t left) {
        SessionRecord session;
        session.joined_at = joined;
        session.left_at = left;
        session.duration_sec = left - joined;
        return session;
    }

    std::shared_ptr<huddle::storage::ConnectionPool> pool_;
    std::unique_ptr<huddle::storage::MySqlRoomStore> store_;
};

TEST_F(MysqlRoomStoreTest, RoomMetaUpsertAndLoad) {
    EXPECT_EQ(store_->LoadRoomMeta("standup").GetStatus().Code(), huddle::common::StatusCode::kNotFound);

    RoomMeta meta;
    meta.room_id = "standup";
    meta.passcode = "it's-secret";
    meta.capacity = 8;
    meta.host_user_id = "u-host";
    ASSERT_TRUE(store_->UpsertRoomMeta(meta).IsOk());

    auto loaded = store_->LoadRoomMeta("standup");
    ASSERT_TRUE(loaded.IsOk()) << loaded.GetStatus().Message();
    EXPECT_EQ(loaded.Value().passcode, "it's-secret");
    EXPECT_EQ(loaded.Value().capacity, 8);
    EXPECT_EQ(loaded.Value().host_user_id, "u-host");

    meta.capacity = 20;
    ASSERT_TRUE(store_->UpsertRoomMeta(meta).IsOk());
    EXPECT_EQ(store_->LoadRoomMeta("standup").Value().capacity, 20);
}

TEST_F(MysqlRoomStoreTest, SessionsKeepInsertOrderAndNulls) {
    ASSERT_TRUE(store_->SaveSession("r1", "alice", Closed(100, 130)).IsOk());
    SessionRecord broken;
    broken.left_at = 400;
    ASSERT_TRUE(store_->SaveSession("r1", "alice", broken).IsOk());
    ASSERT_TRUE(store_->SaveSession("r1", "alice", Closed(200, 245)).IsOk());

    auto sessions = store_->LoadSessions("r1", "alice");
    ASSERT_TRUE(sessions.IsOk()) << sessions.GetStatus().Message();
    ASSERT_EQ(sessions.Value().size(), 3u);
    EXPECT_EQ(*sessions.Value()[0].duration_sec, 30);
    EXPECT_FALSE(sessions.Value()[1].joined_at.has_value());
    EXPECT_EQ(*sessions.Value()[2].joined_at, 200);

    auto none = store_->LoadSessions("r1", "nobody");
    ASSERT_TRUE(none.IsOk());
    EXPECT_TRUE(none.Value().empty());
}

TEST_F(MysqlRoomStoreTest, SessionsAreScopedToMeeting) {
    ASSERT_TRUE(store_->SaveSession("r1", "alice", Closed(100, 200)).IsOk());
    ASSERT_TRUE(store_->SaveSession("r2", "alice", Closed(300, 310)).IsOk());

    auto r2 = store_->LoadSessions("r2", "alice");
    ASSERT_TRUE(r2.IsOk()) << r2.GetStatus().Message();
    ASSERT_EQ(r2.Value().size(), 1u);
    EXPECT_EQ(*r2.Value()[0].duration_sec, 10);
    EXPECT_TRUE(store_->LoadSessions("r3", "alice").Value().empty());
}

TEST_F(MysqlRoomStoreTest, TotalsAndAudit) {
    ASSERT_TRUE(store_->UpdateParticipantTotals("r1", "alice", 40).IsOk());
    ASSERT_TRUE(store_->UpdateParticipantTotals("r1", "alice", 75).IsOk());
    ASSERT_TRUE(store_->UpdateParticipantTotals("r2", "alice", 10).IsOk());

    AuditEntry entry;
    entry.admin_id = "u-host";
    entry.action = "KICK_PARTICIPANT";
    entry.target_id = "alice";
    entry.metadata = "spam";
    entry.created_at = 1234;
    ASSERT_TRUE(store_->AppendAuditEntry(entry).IsOk());

    auto lease_or = pool_->Acquire();
    ASSERT_TRUE(lease_or.IsOk());
    auto lease = std::move(lease_or.Value());
    const std::string sql = "SELECT total_duration_sec FROM participants WHERE meeting_id = 'r1' AND participant_id = 'alice'";
    ASSERT_EQ(0, mysql_real_query(lease.Raw(), sql.c_str(), sql.size())) << mysql_error(lease.Raw());
    MYSQL_RES* result = mysql_store_result(lease.Raw());
    ASSERT_NE(result, nullptr);
    MYSQL_ROW row = mysql_fetch_row(result);
    ASSERT_NE(row, nullptr);
    EXPECT_STREQ(row[0], "75");
    mysql_free_result(result);
}
