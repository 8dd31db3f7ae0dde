#include "storage/mysql/room_store.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <memory>
#include <optional>

namespace huddle {
namespace storage {

namespace {

std::string Escape(MYSQL* conn, const std::string& value) {
    std::string buf;
    buf.resize(value.size() * 2 + 1);
    unsigned long escaped_len = mysql_real_escape_string(conn, buf.data(), value.data(), value.size());
    buf.resize(escaped_len);
    return buf;
}

std::string SqlOptional(const std::optional<std::int64_t>& value) {
    return value ? std::to_string(*value) : std::string("NULL");
}

std::optional<std::int64_t> ParseOptional(const char* field) {
    if (!field) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(std::strtoll(field, nullptr, 10));
}

using ResultPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

} // namespace

MySqlRoomStore::MySqlRoomStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

std::string MySqlRoomStore::EscapeAndQuote(MYSQL* conn, const std::string& value) {
    return fmt::format("'{}'", Escape(conn, value));
}

huddle::common::Status MySqlRoomStore::SaveSession(const std::string& room_id
                                                   , const std::string& participant_id
                                                   , const huddle::core::SessionRecord& session) {
    Transaction transaction(pool_);
    auto status = transaction.Begin();
    if (!status.IsOk()) {
        return status;
    }
    MYSQL* conn = transaction.Raw();
    const auto rid = EscapeAndQuote(conn, room_id);
    const auto pid = EscapeAndQuote(conn, participant_id);

    status = transaction.Execute(fmt::format(
        "INSERT INTO participant_sessions (meeting_id, participant_id, joined_at, left_at, duration_sec) "
        "VALUES ({}, {}, {}, {}, {})",
        rid, pid, SqlOptional(session.joined_at), SqlOptional(session.left_at), SqlOptional(session.duration_sec)));
    if (!status.IsOk()) {
        return status;
    }

    status = transaction.Execute(fmt::format(
        "INSERT INTO participants (meeting_id, participant_id, last_joined_at, last_left_at) VALUES ({0}, {1}, {2}, {3}) "
        "ON DUPLICATE KEY UPDATE last_joined_at = {2}, last_left_at = {3}",
        rid, pid, SqlOptional(session.joined_at), SqlOptional(session.left_at)));
    if (!status.IsOk()) {
        return status;
    }
    return transaction.Commit();
}

huddle::common::Status MySqlRoomStore::UpdateParticipantTotals(const std::string& room_id
                                                               , const std::string& participant_id
                                                               , std::int64_t total_duration_sec) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto sql = fmt::format(
        "INSERT INTO participants (meeting_id, participant_id, total_duration_sec) VALUES ({0}, {1}, {2}) "
        "ON DUPLICATE KEY UPDATE total_duration_sec = {2}",
        EscapeAndQuote(conn, room_id), EscapeAndQuote(conn, participant_id), total_duration_sec);
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn, "update participant totals");
    }
    return huddle::common::Status::OK();
}

huddle::common::Status MySqlRoomStore::AppendAuditEntry(const huddle::core::AuditEntry& entry) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto sql = fmt::format(
        "INSERT INTO audit_log (admin_id, action, target_id, metadata, created_at) VALUES ({}, {}, {}, {}, {})",
        EscapeAndQuote(conn, entry.admin_id),
        EscapeAndQuote(conn, entry.action),
        EscapeAndQuote(conn, entry.target_id),
        EscapeAndQuote(conn, entry.metadata),
        entry.created_at);
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn, "append audit entry");
    }
    return huddle::common::Status::OK();
}

huddle::common::StatusOr<huddle::core::RoomMeta> MySqlRoomStore::LoadRoomMeta(const std::string& room_id) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto sql = fmt::format(
        "SELECT room_id, passcode, capacity, host_user_id FROM rooms WHERE room_id = {} LIMIT 1",
        EscapeAndQuote(conn, room_id));
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn, "load room meta");
    }
    MYSQL_RES* result = mysql_store_result(conn);
    if (!result) {
        return MapMySqlError(conn, "load room meta");
    }
    ResultPtr cleanup(result, mysql_free_result);
    MYSQL_ROW row = mysql_fetch_row(result);
    if (!row) {
        return huddle::common::Status::NotFound("room not found");
    }

    huddle::core::RoomMeta meta;
    meta.room_id = row[0] ? row[0] : room_id;
    meta.passcode = row[1] ? row[1] : "";
    meta.capacity = row[2] ? std::atoi(row[2]) : 0;
    meta.host_user_id = row[3] ? row[3] : "";
    return huddle::common::StatusOr<huddle::core::RoomMeta>(std::move(meta));
}

huddle::common::StatusOr<std::vector<huddle::core::SessionRecord>> MySqlRoomStore::LoadSessions(const std::string& room_id
                                                                                 , const std::string& participant_id) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto sql = fmt::format(
        "SELECT joined_at, left_at, duration_sec FROM participant_sessions "
        "WHERE meeting_id = {} AND participant_id = {} ORDER BY id",
        EscapeAndQuote(conn, room_id), EscapeAndQuote(conn, participant_id));
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn, "load sessions");
    }
    MYSQL_RES* result = mysql_store_result(conn);
    if (!result) {
        return MapMySqlError(conn, "load sessions");
    }
    ResultPtr cleanup(result, mysql_free_result);

    std::vector<huddle::core::SessionRecord> sessions;
    while (MYSQL_ROW row = mysql_fetch_row(result)) {
        huddle::core::SessionRecord session;
        session.joined_at = ParseOptional(row[0]);
        session.left_at = ParseOptional(row[1]);
        session.duration_sec = ParseOptional(row[2]);
        sessions.push_back(session);
    }
    return huddle::common::StatusOr<std::vector<huddle::core::SessionRecord>>(std::move(sessions));
}

huddle::common::Status MySqlRoomStore::UpsertRoomMeta(const huddle::core::RoomMeta& meta) {
    if (meta.room_id.empty()) {
        return huddle::common::Status::InvalidArgument("room id is empty");
    }
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto sql = fmt::format(
        "INSERT INTO rooms (room_id, passcode, capacity, host_user_id) VALUES ({0}, {1}, {2}, {3}) "
        "ON DUPLICATE KEY UPDATE passcode = {1}, capacity = {2}, host_user_id = {3}",
        EscapeAndQuote(conn, meta.room_id),
        EscapeAndQuote(conn, meta.passcode),
        meta.capacity,
        EscapeAndQuote(conn, meta.host_user_id));
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn, "upsert room meta");
    }
    return huddle::common::Status::OK();
}

} // namespace storage
} // namespace huddle
