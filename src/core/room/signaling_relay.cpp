#include "core/room/signaling_relay.hpp"
#include "core/room/errors.hpp"
#include "common/logger.hpp"

namespace huddle {
namespace core {

SignalingRelay::SignalingRelay(std::shared_ptr<EventSink> sink) : sink_(std::move(sink)) {}

huddle::common::StatusOr<DeliveryResult> SignalingRelay::Relay(const RoomRegistry::Lease& lease
                                                               , const SignalEnvelope& envelope
                                                               , std::int64_t at) {
    if (!lease) {
        return FromRoomError(RoomErrorCode::kInternal, "Relay requires a locked room.");
    }
    if (!lease->IsMember(envelope.from)) {
        return FromRoomError(RoomErrorCode::kNotAMember,
                             "Peer " + envelope.from + " is not in room " + lease.RoomId() + ".");
    }
    if (envelope.to.empty() || !lease->IsMember(envelope.to)) {
        return FromRoomError(RoomErrorCode::kUnknownTarget,
                             "Peer " + envelope.to + " is not in room " + lease.RoomId() + ".");
    }

    OutboundEvent event;
    event.type = OutboundEventType::kSignal;
    event.room_id = lease.RoomId();
    event.peer_id = envelope.from;
    event.signal = envelope;
    event.timestamp = at;

    auto result = sink_->Deliver(envelope.to, event);
    HUDDLE_LOG_DEBUG("[SignalingRelay] {} {} -> {} in room {}", SignalTypeToString(envelope.type),
                     envelope.from, envelope.to, lease.RoomId());
    return huddle::common::StatusOr<DeliveryResult>(result);
}

} // namespace core
} // namespace huddle
