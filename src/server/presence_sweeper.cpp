#include "server/presence_sweeper.hpp"
#include "common/logger.hpp"

namespace huddle {
namespace server {

PresenceSweeper::PresenceSweeper(std::shared_ptr<core::RoomCoordinator> coordinator, std::chrono::milliseconds interval)
    : coordinator_(std::move(coordinator)), interval_(interval) {}

PresenceSweeper::~PresenceSweeper() {
    Stop();
}

void PresenceSweeper::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    if (interval_.count() <= 0) {
        HUDDLE_LOG_INFO("[PresenceSweeper] Disabled");
        return;
    }
    stop_ = false;
    running_ = true;
    worker_ = std::thread(&PresenceSweeper::Loop, this);
    HUDDLE_LOG_INFO("[PresenceSweeper] Started, interval {} ms", interval_.count());
}

void PresenceSweeper::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    HUDDLE_LOG_INFO("[PresenceSweeper] Stopped");
}

bool PresenceSweeper::Running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PresenceSweeper::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (cv_.wait_for(lock, interval_, [this]() { return stop_; })) {
            break;
        }
        lock.unlock();
        const auto evicted = coordinator_->SweepStalePeers();
        if (evicted > 0) {
            HUDDLE_LOG_INFO("[PresenceSweeper] Removed {} stale peers", evicted);
        }
        lock.lock();
    }
}

} // namespace server
} // namespace huddle
