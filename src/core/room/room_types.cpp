#include "core/room/room_types.hpp"

namespace huddle {
namespace core {

const char* RoleToString(Role role) {
    switch (role) {
        case Role::kMember:
            return "MEMBER";
        case Role::kCoHost:
            return "CO_HOST";
        case Role::kHost:
            return "HOST";
        case Role::kAdmin:
            return "ADMIN";
    }
    return "MEMBER";
}

std::optional<Role> RoleFromString(const std::string& value) {
    if (value == "MEMBER" || value == "PARTICIPANT" || value == "GUEST") {
        return Role::kMember;
    }
    if (value == "CO_HOST") {
        return Role::kCoHost;
    }
    if (value == "HOST") {
        return Role::kHost;
    }
    if (value == "ADMIN") {
        return Role::kAdmin;
    }
    return std::nullopt;
}

const char* MediaStateToString(MediaState state) {
    switch (state) {
        case MediaState::kOn:
            return "ON";
        case MediaState::kOff:
            return "OFF";
        case MediaState::kMuted:
            return "MUTED";
        case MediaState::kMutedByHost:
            return "MUTED_BY_HOST";
        case MediaState::kOffByAdmin:
            return "OFF_BY_ADMIN";
    }
    return "OFF";
}

std::optional<MediaState> MediaStateFromString(const std::string& value) {
    if (value == "ON") {
        return MediaState::kOn;
    }
    if (value == "OFF") {
        return MediaState::kOff;
    }
    if (value == "MUTED") {
        return MediaState::kMuted;
    }
    if (value == "MUTED_BY_HOST") {
        return MediaState::kMutedByHost;
    }
    if (value == "OFF_BY_ADMIN") {
        return MediaState::kOffByAdmin;
    }
    return std::nullopt;
}

const char* MediaFieldToString(MediaField field) {
    return field == MediaField::kMic ? "mic" : "camera";
}

const char* SignalTypeToString(SignalType type) {
    switch (type) {
        case SignalType::kOffer:
            return "offer";
        case SignalType::kAnswer:
            return "answer";
        case SignalType::kCandidate:
            return "candidate";
    }
    return "offer";
}

}
}
