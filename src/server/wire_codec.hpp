#pragma once

#include "common/status.hpp"
#include "core/room/errors.hpp"
#include "core/room/room_types.hpp"

#include "signaling_service.pb.h"

#include <optional>

namespace huddle {
namespace server {

proto::signaling::Role RoleToProto(core::Role role);
core::Role RoleFromProto(proto::signaling::Role role);

proto::signaling::MediaState MediaStateToProto(core::MediaState state);
// MEDIA_UNSPECIFIED 表示未请求修改
std::optional<core::MediaState> MediaStateFromProto(proto::signaling::MediaState state);

proto::signaling::SignalType SignalTypeToProto(core::SignalType type);
// 未指定或未知的类型返回空
std::optional<core::SignalType> SignalTypeFromProto(proto::signaling::SignalType type);

// 将出站事件编码为流消息
proto::signaling::ServerMessage ToProto(const core::OutboundEvent& event);

inline void ErrorToProto(core::RoomErrorCode code
                         , const huddle::common::Status& status
                         , proto::common::Error* error_proto) {
    if (error_proto == nullptr) {
        return;
    }
    error_proto->set_code(static_cast<int32_t>(code));
    error_proto->set_message(status.Message());
}

} // namespace server
} // namespace huddle
