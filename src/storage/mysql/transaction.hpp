#pragma once

#include "common/status.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>
#include <string>

namespace huddle {
namespace storage {

// MySQL 事务, 析构时未提交则回滚
class Transaction {
public:
    explicit Transaction(std::shared_ptr<ConnectionPool> pool);
    ~Transaction();

    huddle::common::Status Begin();
    // 执行一条语句, 失败时自动回滚
    huddle::common::Status Execute(const std::string& sql);
    huddle::common::Status Commit();
    huddle::common::Status Rollback();

    MYSQL* Raw() const noexcept { return conn_; }
    bool Active() const noexcept { return active_; }
private:
    void RestoreAutocommit();

    std::shared_ptr<ConnectionPool> pool_;
    ConnectionPool::Lease lease_;
    MYSQL* conn_ = nullptr;
    bool active_ = false;
};

} // namespace storage
} // namespace huddle
