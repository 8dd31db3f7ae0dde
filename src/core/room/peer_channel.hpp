#pragma once

#include "core/room/event_sink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace huddle {
namespace core {

// 单个连接的有界出站队列
// 生产者为房间协调器, 消费者为该连接的写线程
class PeerChannel {
public:
    PeerChannel(std::string peer_id, std::size_t capacity);

    // 非阻塞入队, 队列满时关闭通道并丢弃积压事件
    DeliveryResult TryPush(OutboundEvent event);

    // 等待出队; 超时或通道关闭且已取空时返回 false
    bool WaitPop(OutboundEvent& out, std::chrono::milliseconds timeout);

    // 关闭通道, 已入队事件仍可被取出
    void Close();

    bool Closed() const;
    bool Overflowed() const;
    std::size_t Pending() const;
    std::size_t Capacity() const { return capacity_; }
    const std::string& PeerId() const { return peer_id_; }

private:
    const std::string peer_id_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<OutboundEvent> queue_;
    bool closed_{false};
    std::atomic<bool> overflowed_{false};
};

// 按连接ID管理出站通道
class PeerChannelHub : public EventSink {
public:
    explicit PeerChannelHub(std::size_t capacity);

    // 为连接打开通道, 已存在的旧通道会被关闭并替换
    std::shared_ptr<PeerChannel> Open(const std::string& peer_id);

    // 关闭并移除通道; 仅当 expected 为空或与当前通道一致时移除
    void Remove(const std::string& peer_id, const std::shared_ptr<PeerChannel>& expected = nullptr);

    std::shared_ptr<PeerChannel> Find(const std::string& peer_id) const;
    std::size_t Size() const;

    DeliveryResult Deliver(const std::string& peer_id, const OutboundEvent& event) override;
    void Close(const std::string& peer_id) override;

private:
    const std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PeerChannel>> channels_;
};

} // namespace core
} // namespace huddle
