#include "core/room/persistence_dispatcher.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace huddle {
namespace core {

RetryPolicy RetryPolicy::FromConfig(const huddle::common::PersistenceConfig& config) {
    RetryPolicy policy;
    policy.max_attempts = std::max(1, config.max_attempts);
    policy.initial_backoff = std::chrono::milliseconds(std::max(0, config.initial_backoff_ms));
    policy.max_backoff = std::chrono::milliseconds(std::max(config.initial_backoff_ms, config.max_backoff_ms));
    policy.queue_capacity = static_cast<std::size_t>(std::max(1, config.queue_capacity));
    return policy;
}

PersistenceDispatcher::PersistenceDispatcher(RetryPolicy policy)
    : policy_(std::move(policy)) {
    worker_ = std::thread([this] { WorkerLoop(); });
}

PersistenceDispatcher::~PersistenceDispatcher() {
    Stop();
}

bool PersistenceDispatcher::Post(std::string description, Task task) {
    if (!task) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            HUDDLE_LOG_WARN("[Persistence] Dispatcher stopped, dropping task: {}", description);
            return false;
        }
        if (jobs_.size() >= policy_.queue_capacity) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            HUDDLE_LOG_WARN("[Persistence] Queue full ({} pending), dropping task: {}", jobs_.size(), description);
            return false;
        }
        jobs_.push_back(Job{std::move(description), std::move(task)});
    }
    cv_.notify_one();
    return true;
}

void PersistenceDispatcher::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool PersistenceDispatcher::WaitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return jobs_.empty() && !busy_; });
}

std::size_t PersistenceDispatcher::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void PersistenceDispatcher::WorkerLoop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                // stopping_ 且已取空
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
            busy_ = true;
        }

        Execute(job);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void PersistenceDispatcher::Execute(Job& job) {
    auto backoff = policy_.initial_backoff;
    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        huddle::common::Status status = huddle::common::Status::OK();
        try {
            status = job.task();
        } catch (const std::exception& ex) {
            status = huddle::common::Status::Internal(ex.what());
        }

        if (status.IsOk()) {
            completed_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (status.Code() != huddle::common::StatusCode::kUnavailable) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            HUDDLE_LOG_ERROR("[Persistence] {} failed: {} ({})", job.description, status.Message(),
                             huddle::common::StatusCodeToString(status.Code()));
            return;
        }
        if (attempt == policy_.max_attempts) {
            break;
        }

        retries_.fetch_add(1, std::memory_order_relaxed);
        HUDDLE_LOG_WARN("[Persistence] {} attempt {}/{} failed: {}, retrying in {}ms",
                        job.description, attempt, policy_.max_attempts, status.Message(), backoff.count());
        {
            // 停止时不再等待退避, 但仍完成剩余重试
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, backoff, [this] { return stopping_; });
        }
        backoff = std::min(backoff * 2, policy_.max_backoff);
    }

    failed_.fetch_add(1, std::memory_order_relaxed);
    HUDDLE_LOG_ERROR("[Persistence] {} gave up after {} attempts, storage unavailable",
                     job.description, policy_.max_attempts);
}

} // namespace core
} // namespace huddle
