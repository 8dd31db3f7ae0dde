#include "storage/mysql/transaction.hpp"
#include "common/logger.hpp"

namespace huddle {
namespace storage {

Transaction::Transaction(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

Transaction::~Transaction() {
    if (active_) {
        auto status = Rollback();
        if (!status.IsOk()) {
            HUDDLE_LOG_WARN("[MySql] Rollback on scope exit failed: {}", status.Message());
        }
    }
}

huddle::common::Status Transaction::Begin() {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    lease_ = std::move(lease_or.Value());
    conn_ = lease_.Raw();
    if (mysql_autocommit(conn_, 0) != 0) {
        return MapMySqlError(conn_, "disable autocommit");
    }
    active_ = true;
    return huddle::common::Status::OK();
}

huddle::common::Status Transaction::Execute(const std::string& sql) {
    if (!active_) {
        return huddle::common::Status::FailedPrecondition("transaction is not active");
    }
    if (mysql_real_query(conn_, sql.c_str(), sql.size()) != 0) {
        auto status = MapMySqlError(conn_);
        auto rollback = Rollback();
        if (!rollback.IsOk()) {
            HUDDLE_LOG_WARN("[MySql] Rollback after failed statement failed: {}", rollback.Message());
        }
        return status;
    }
    return huddle::common::Status::OK();
}

huddle::common::Status Transaction::Commit() {
    if (!active_) {
        return huddle::common::Status::OK();
    }
    if (mysql_commit(conn_) != 0) {
        auto status = MapMySqlError(conn_, "commit");
        auto rollback = Rollback();
        if (!rollback.IsOk()) {
            HUDDLE_LOG_WARN("[MySql] Rollback after failed commit failed: {}", rollback.Message());
        }
        return status;
    }
    active_ = false;
    RestoreAutocommit();
    return huddle::common::Status::OK();
}

huddle::common::Status Transaction::Rollback() {
    if (!active_) {
        return huddle::common::Status::OK();
    }
    active_ = false;
    const bool rolled_back = mysql_rollback(conn_) == 0;
    auto status = rolled_back ? huddle::common::Status::OK() : MapMySqlError(conn_, "rollback");
    RestoreAutocommit();
    return status;
}

void Transaction::RestoreAutocommit() {
    // 连接归还连接池前恢复自动提交
    if (mysql_autocommit(conn_, 1) != 0) {
        HUDDLE_LOG_WARN("[MySql] Failed to restore autocommit: {}", mysql_error(conn_));
    }
}

} // namespace storage
} // namespace huddle
