#include "storage/mysql/connection_pool.hpp"

#include <chrono>

namespace huddle {
namespace storage {

ConnectionPool::ConnectionPool(Options options) : options_(std::move(options)) {}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Return();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Return();
}

void ConnectionPool::Lease::Return() {
    if (pool_ && connection_) {
        pool_->Release(std::move(connection_));
    }
    pool_ = nullptr;
}

huddle::common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    std::unique_ptr<Connection> connection;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!connections_.empty()) {
            // 有空闲连接
            connection = std::move(connections_.front());
            connections_.pop();
        } else if (total_connections_ < options_.pool_size) {
            // 未达上限, 在锁外建连
            ++total_connections_;
            lock.unlock();
            auto created = Connection::Create(options_);
            if (!created.IsOk()) {
                std::lock_guard<std::mutex> guard(mutex_);
                --total_connections_;
                cv_.notify_one();
                return created.GetStatus();
            }
            connection = std::move(created.Value());
        } else {
            // 已达上限, 等待归还
            if (!cv_.wait_for(lock, options_.acquire_timeout, [this] { return !connections_.empty(); })) {
                return huddle::common::Status::Unavailable("Timed out acquiring a MySQL connection");
            }
            connection = std::move(connections_.front());
            connections_.pop();
        }
    }
    return huddle::common::StatusOr<Lease>(Lease(this, std::move(connection)));
}

std::size_t ConnectionPool::IdleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

std::size_t ConnectionPool::TotalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_connections_;
}

void ConnectionPool::Release(std::unique_ptr<Connection> connection) {
    if (!connection->Ping()) {
        // 断开的连接直接丢弃
        std::lock_guard<std::mutex> lock(mutex_);
        --total_connections_;
        cv_.notify_one();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.push(std::move(connection));
    }
    cv_.notify_one();
}

} // namespace storage
} // namespace huddle
