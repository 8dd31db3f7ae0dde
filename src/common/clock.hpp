#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace huddle {
namespace common {

// 时间源接口, 单位为 Unix 秒
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::int64_t NowSeconds() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t NowSeconds() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// 手动推进的时钟, 测试与回放使用
class ManualClock : public Clock {
public:
    explicit ManualClock(std::int64_t start = 0) : now_(start) {}

    std::int64_t NowSeconds() const override {
        return now_.load(std::memory_order_acquire);
    }
    void Set(std::int64_t now) {
        now_.store(now, std::memory_order_release);
    }
    void Advance(std::int64_t seconds) {
        now_.fetch_add(seconds, std::memory_order_acq_rel);
    }
private:
    std::atomic<std::int64_t> now_;
};

}
}
