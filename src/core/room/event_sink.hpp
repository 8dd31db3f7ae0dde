#pragma once

#include "core/room/room_types.hpp"

#include <string>

namespace huddle {
namespace core {

enum class DeliveryResult {
    kDelivered = 0,
    kNoChannel,   // 对端没有打开的出站通道
    kOverflow,    // 出站队列已满, 通道已关闭
};

// 出站事件投递接口
// 实现必须非阻塞, 调用方可能持有房间锁
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual DeliveryResult Deliver(const std::string& peer_id, const OutboundEvent& event) = 0;
    // 关闭对端的出站通道, 已入队的事件仍会发出
    virtual void Close(const std::string& peer_id) = 0;
};

} // namespace core
} // namespace huddle
