#pragma once

#include "core/room/room_coordinator.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace huddle {
namespace server {

// 周期性清理心跳超时的连接
class PresenceSweeper {
public:
    PresenceSweeper(std::shared_ptr<core::RoomCoordinator> coordinator, std::chrono::milliseconds interval);
    ~PresenceSweeper();

    PresenceSweeper(const PresenceSweeper&) = delete;
    PresenceSweeper& operator=(const PresenceSweeper&) = delete;

    // interval 为 0 时不启动
    void Start();
    void Stop();
    bool Running() const;

private:
    void Loop();

    std::shared_ptr<core::RoomCoordinator> coordinator_;
    std::chrono::milliseconds interval_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    bool running_ = false;
    std::thread worker_;
};

} // namespace server
} // namespace huddle
