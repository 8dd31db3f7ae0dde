#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>

namespace huddle {
namespace storage {

class ConnectionPool {
public:
    explicit ConnectionPool(Options options);

    // 连接租赁类, RAII管理连接的获取和归还
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Connection* operator->() noexcept { return connection_.get(); }
        Connection& operator*() noexcept { return *connection_; }
        MYSQL* Raw() const noexcept { return connection_ ? connection_->Raw() : nullptr; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }
    private:
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        void Return();

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Connection> connection_;
    };

    // 获取连接, 池满时最多等待 acquire_timeout
    huddle::common::StatusOr<Lease> Acquire();

    const Options& GetOptions() const noexcept { return options_; }
    std::size_t IdleCount() const;
    std::size_t TotalCount() const;

private:
    void Release(std::unique_ptr<Connection> connection);

    Options options_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Connection>> connections_; // 空闲连接
    std::size_t total_connections_ = 0;                   // 已创建的连接数
};

} // namespace storage
} // namespace huddle
