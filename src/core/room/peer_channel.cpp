#include "core/room/peer_channel.hpp"
#include "common/logger.hpp"

#include <utility>

namespace huddle {
namespace core {

PeerChannel::PeerChannel(std::string peer_id, std::size_t capacity)
    : peer_id_(std::move(peer_id))
    , capacity_(capacity == 0 ? 1 : capacity) {}

DeliveryResult PeerChannel::TryPush(OutboundEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return overflowed_.load(std::memory_order_acquire) ? DeliveryResult::kOverflow : DeliveryResult::kNoChannel;
        }
        if (queue_.size() >= capacity_) {
            // 慢消费者: 不阻塞生产者, 直接断开
            queue_.clear();
            closed_ = true;
            overflowed_.store(true, std::memory_order_release);
        } else {
            const bool was_empty = queue_.empty();
            queue_.push_back(std::move(event));
            if (!was_empty) {
                return DeliveryResult::kDelivered;
            }
        }
    }
    not_empty_.notify_all();
    return overflowed_.load(std::memory_order_acquire) ? DeliveryResult::kOverflow : DeliveryResult::kDelivered;
}

bool PeerChannel::WaitPop(OutboundEvent& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
        return false;
    }
    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void PeerChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

bool PeerChannel::Closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool PeerChannel::Overflowed() const {
    return overflowed_.load(std::memory_order_acquire);
}

std::size_t PeerChannel::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

PeerChannelHub::PeerChannelHub(std::size_t capacity) : capacity_(capacity) {}

std::shared_ptr<PeerChannel> PeerChannelHub::Open(const std::string& peer_id) {
    auto channel = std::make_shared<PeerChannel>(peer_id, capacity_);
    std::shared_ptr<PeerChannel> previous;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& slot = channels_[peer_id];
        previous = std::move(slot);
        slot = channel;
    }
    if (previous) {
        HUDDLE_LOG_WARN("[PeerChannel] Replacing existing channel for peer {}", peer_id);
        previous->Close();
    }
    return channel;
}

void PeerChannelHub::Remove(const std::string& peer_id, const std::shared_ptr<PeerChannel>& expected) {
    std::shared_ptr<PeerChannel> channel;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = channels_.find(peer_id);
        if (it == channels_.end()) {
            return;
        }
        if (expected && it->second != expected) {
            return;
        }
        channel = std::move(it->second);
        channels_.erase(it);
    }
    channel->Close();
}

void PeerChannelHub::Close(const std::string& peer_id) {
    if (auto channel = Find(peer_id)) {
        channel->Close();
    }
}

std::shared_ptr<PeerChannel> PeerChannelHub::Find(const std::string& peer_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = channels_.find(peer_id);
    return it == channels_.end() ? nullptr : it->second;
}

std::size_t PeerChannelHub::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return channels_.size();
}

DeliveryResult PeerChannelHub::Deliver(const std::string& peer_id, const OutboundEvent& event) {
    auto channel = Find(peer_id);
    if (!channel) {
        return DeliveryResult::kNoChannel;
    }
    auto result = channel->TryPush(event);
    if (result == DeliveryResult::kOverflow) {
        HUDDLE_LOG_WARN("[PeerChannel] Outbound queue of peer {} overflowed (capacity={})", peer_id, channel->Capacity());
    }
    return result;
}

} // namespace core
} // namespace huddle
