#pragma once

#include "common/config.hpp"
#include "common/status.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace huddle {
namespace core {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{2000};
    std::size_t queue_capacity = 4096;  // 排队任务上限, 不含执行中的任务

    static RetryPolicy FromConfig(const huddle::common::PersistenceConfig& config);
};

// 持久化任务调度器
// 单个后台线程按提交顺序执行写任务, 同一参与者的写入因此保持有序;
// 只有 Unavailable 视为瞬时错误并按指数退避重试
class PersistenceDispatcher {
public:
    using Task = std::function<huddle::common::Status()>;

    explicit PersistenceDispatcher(RetryPolicy policy = RetryPolicy{});
    ~PersistenceDispatcher();

    PersistenceDispatcher(const PersistenceDispatcher&) = delete;
    PersistenceDispatcher& operator=(const PersistenceDispatcher&) = delete;

    // 提交任务, 调度器已停止或队列已满时返回 false
    bool Post(std::string description, Task task);

    // 执行完已提交的任务后停止工作线程
    void Stop();

    // 等待队列清空且无执行中的任务
    bool WaitIdle(std::chrono::milliseconds timeout);

    std::size_t Pending() const;
    std::size_t Completed() const { return completed_.load(std::memory_order_relaxed); }
    std::size_t Failed() const { return failed_.load(std::memory_order_relaxed); }
    std::size_t Retries() const { return retries_.load(std::memory_order_relaxed); }
    std::size_t Dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    struct Job {
        std::string description;
        Task        task;
    };

    void WorkerLoop();
    void Execute(Job& job);

    const RetryPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    bool stopping_{false};
    bool busy_{false};

    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> retries_{0};
    std::atomic<std::size_t> dropped_{0};

    std::thread worker_;
};

} // namespace core
} // namespace huddle
