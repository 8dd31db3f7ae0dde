#include "server/wire_codec.hpp"

namespace huddle {
namespace server {

proto::signaling::Role RoleToProto(core::Role role) {
    switch (role) {
        case core::Role::kMember:
            return proto::signaling::ROLE_MEMBER;
        case core::Role::kCoHost:
            return proto::signaling::ROLE_CO_HOST;
        case core::Role::kHost:
            return proto::signaling::ROLE_HOST;
        case core::Role::kAdmin:
            return proto::signaling::ROLE_ADMIN;
    }
    return proto::signaling::ROLE_MEMBER;
}

core::Role RoleFromProto(proto::signaling::Role role) {
    switch (role) {
        case proto::signaling::ROLE_CO_HOST:
            return core::Role::kCoHost;
        case proto::signaling::ROLE_HOST:
            return core::Role::kHost;
        case proto::signaling::ROLE_ADMIN:
            return core::Role::kAdmin;
        default:
            return core::Role::kMember;
    }
}

proto::signaling::MediaState MediaStateToProto(core::MediaState state) {
    switch (state) {
        case core::MediaState::kOn:
            return proto::signaling::MEDIA_ON;
        case core::MediaState::kOff:
            return proto::signaling::MEDIA_OFF;
        case core::MediaState::kMuted:
            return proto::signaling::MEDIA_MUTED;
        case core::MediaState::kMutedByHost:
            return proto::signaling::MEDIA_MUTED_BY_HOST;
        case core::MediaState::kOffByAdmin:
            return proto::signaling::MEDIA_OFF_BY_ADMIN;
    }
    return proto::signaling::MEDIA_UNSPECIFIED;
}

std::optional<core::MediaState> MediaStateFromProto(proto::signaling::MediaState state) {
    switch (state) {
        case proto::signaling::MEDIA_ON:
            return core::MediaState::kOn;
        case proto::signaling::MEDIA_OFF:
            return core::MediaState::kOff;
        case proto::signaling::MEDIA_MUTED:
            return core::MediaState::kMuted;
        case proto::signaling::MEDIA_MUTED_BY_HOST:
            return core::MediaState::kMutedByHost;
        case proto::signaling::MEDIA_OFF_BY_ADMIN:
            return core::MediaState::kOffByAdmin;
        default:
            return std::nullopt;
    }
}

proto::signaling::SignalType SignalTypeToProto(core::SignalType type) {
    switch (type) {
        case core::SignalType::kOffer:
            return proto::signaling::SIGNAL_OFFER;
        case core::SignalType::kAnswer:
            return proto::signaling::SIGNAL_ANSWER;
        case core::SignalType::kCandidate:
            return proto::signaling::SIGNAL_CANDIDATE;
    }
    return proto::signaling::SIGNAL_UNSPECIFIED;
}

std::optional<core::SignalType> SignalTypeFromProto(proto::signaling::SignalType type) {
    switch (type) {
        case proto::signaling::SIGNAL_OFFER:
            return core::SignalType::kOffer;
        case proto::signaling::SIGNAL_ANSWER:
            return core::SignalType::kAnswer;
        case proto::signaling::SIGNAL_CANDIDATE:
            return core::SignalType::kCandidate;
        default:
            return std::nullopt;
    }
}

proto::signaling::ServerMessage ToProto(const core::OutboundEvent& event) {
    proto::signaling::ServerMessage message;
    message.set_room_id(event.room_id);
    message.set_timestamp(event.timestamp);

    switch (event.type) {
        case core::OutboundEventType::kMembership: {
            auto* membership = message.mutable_membership();
            membership->set_self_peer_id(event.membership.self_peer_id);
            membership->set_role(RoleToProto(event.role.value_or(core::Role::kMember)));
            for (const auto& member : event.membership.members) {
                auto* info = membership->add_members();
                info->set_peer_id(member.peer_id);
                info->set_participant_id(member.participant_id);
                info->set_display_name(member.display_name);
                info->set_role(RoleToProto(member.role));
                info->set_mic(MediaStateToProto(member.mic));
                info->set_camera(MediaStateToProto(member.camera));
            }
            break;
        }
        case core::OutboundEventType::kPeerJoined: {
            auto* joined = message.mutable_peer_joined();
            joined->set_peer_id(event.peer_id);
            joined->set_display_name(event.display_name);
            joined->set_role(RoleToProto(event.role.value_or(core::Role::kMember)));
            if (event.mic) {
                joined->set_mic(MediaStateToProto(*event.mic));
            }
            if (event.camera) {
                joined->set_camera(MediaStateToProto(*event.camera));
            }
            break;
        }
        case core::OutboundEventType::kPeerLeft: {
            auto* left = message.mutable_peer_left();
            left->set_peer_id(event.peer_id);
            left->set_reason(event.reason);
            break;
        }
        case core::OutboundEventType::kMediaChanged: {
            auto* changed = message.mutable_media_changed();
            changed->set_peer_id(event.peer_id);
            if (event.mic) {
                changed->set_mic(MediaStateToProto(*event.mic));
            }
            if (event.camera) {
                changed->set_camera(MediaStateToProto(*event.camera));
            }
            break;
        }
        case core::OutboundEventType::kMeetingEnded:
            message.mutable_meeting_ended()->set_reason(event.reason);
            break;
        case core::OutboundEventType::kSignal: {
            auto* signal = message.mutable_signal();
            signal->set_from(event.signal.from);
            signal->set_type(SignalTypeToProto(event.signal.type));
            signal->set_sdp(event.signal.sdp);
            signal->set_candidate(event.signal.candidate);
            break;
        }
        case core::OutboundEventType::kRejected: {
            auto* error = message.mutable_rejected()->mutable_error();
            error->set_code(event.code);
            error->set_message(event.reason);
            break;
        }
        case core::OutboundEventType::kRoleChanged: {
            auto* changed = message.mutable_role_changed();
            changed->set_peer_id(event.peer_id);
            changed->set_role(RoleToProto(event.role.value_or(core::Role::kMember)));
            break;
        }
        case core::OutboundEventType::kKicked:
            message.mutable_kicked()->set_reason(event.reason);
            break;
        case core::OutboundEventType::kPong:
            message.mutable_pong()->set_server_time(event.timestamp);
            break;
    }
    return message;
}

} // namespace server
} // namespace huddle
