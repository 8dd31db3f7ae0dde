#pragma once

#include "common/status_or.hpp"
#include "core/room/event_sink.hpp"
#include "core/room/room_registry.hpp"

#include <memory>

namespace huddle {
namespace core {

// 房间内点对点转发 SDP/ICE 信令
// 服务端不解析信令内容
class SignalingRelay {
public:
    explicit SignalingRelay(std::shared_ptr<EventSink> sink);

    // 调用方须持有目标房间的租赁
    huddle::common::StatusOr<DeliveryResult> Relay(const RoomRegistry::Lease& lease
                                                   , const SignalEnvelope& envelope
                                                   , std::int64_t at);

private:
    std::shared_ptr<EventSink> sink_;
};

} // namespace core
} // namespace huddle
