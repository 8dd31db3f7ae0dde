#pragma once

#include "common/status.hpp"

#include <string>

namespace huddle {
namespace core {

// 房间相关错误码, 与 common::StatusCode 一一对应
enum class RoomErrorCode {
    kOk = 0,
    kRoomFull = 1,
    kWrongPasscode = 2,
    kNotAMember = 3,
    kUnknownTarget = 4,
    kForbidden = 5,
    kAlreadyActive = 6,
    kNoActiveSession = 7,
    kStorageUnavailable = 8,
    kInvalidArgument = 9,
    kInternal = 10,
};

// 将 RoomErrorCode 转换为通用 Status
inline ::huddle::common::Status FromRoomError(RoomErrorCode error, std::string message = "") {
    using ::huddle::common::Status;
    switch (error) {
        case RoomErrorCode::kOk:
            return Status::OK();
        case RoomErrorCode::kRoomFull:
            return Status::ResourceExhausted(message.empty() ? "Room is full" : message);
        case RoomErrorCode::kWrongPasscode:
            return Status::Unauthenticated(message.empty() ? "Wrong passcode" : message);
        case RoomErrorCode::kNotAMember:
            return Status::FailedPrecondition(message.empty() ? "Not a member of the room" : message);
        case RoomErrorCode::kUnknownTarget:
            return Status::NotFound(message.empty() ? "Target peer is not in the room" : message);
        case RoomErrorCode::kForbidden:
            return Status::PermissionDenied(message.empty() ? "Forbidden" : message);
        case RoomErrorCode::kAlreadyActive:
            return Status::AlreadyExists(message.empty() ? "Already active" : message);
        case RoomErrorCode::kNoActiveSession:
            return Status::Aborted(message.empty() ? "No active session" : message);
        case RoomErrorCode::kStorageUnavailable:
            return Status::Unavailable(message.empty() ? "Storage unavailable" : message);
        case RoomErrorCode::kInvalidArgument:
            return Status::InvalidArgument(message.empty() ? "Invalid argument" : message);
        case RoomErrorCode::kInternal:
            return Status::Internal(message.empty() ? "Internal error" : message);
    }
    return Status::Internal("Unknown room error");
}

// 从通用 Status 还原房间错误码
inline RoomErrorCode ToRoomError(const ::huddle::common::Status& status) {
    using ::huddle::common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return RoomErrorCode::kOk;
        case StatusCode::kResourceExhausted:
            return RoomErrorCode::kRoomFull;
        case StatusCode::kUnauthenticated:
            return RoomErrorCode::kWrongPasscode;
        case StatusCode::kFailedPrecondition:
            return RoomErrorCode::kNotAMember;
        case StatusCode::kNotFound:
            return RoomErrorCode::kUnknownTarget;
        case StatusCode::kPermissionDenied:
            return RoomErrorCode::kForbidden;
        case StatusCode::kAlreadyExists:
            return RoomErrorCode::kAlreadyActive;
        case StatusCode::kAborted:
            return RoomErrorCode::kNoActiveSession;
        case StatusCode::kUnavailable:
            return RoomErrorCode::kStorageUnavailable;
        case StatusCode::kInvalidArgument:
            return RoomErrorCode::kInvalidArgument;
        default:
            return RoomErrorCode::kInternal;
    }
}

inline const char* RoomErrorName(RoomErrorCode error) {
    switch (error) {
        case RoomErrorCode::kOk:
            return "OK";
        case RoomErrorCode::kRoomFull:
            return "RoomFull";
        case RoomErrorCode::kWrongPasscode:
            return "WrongPasscode";
        case RoomErrorCode::kNotAMember:
            return "NotAMember";
        case RoomErrorCode::kUnknownTarget:
            return "UnknownTarget";
        case RoomErrorCode::kForbidden:
            return "Forbidden";
        case RoomErrorCode::kAlreadyActive:
            return "AlreadyActive";
        case RoomErrorCode::kNoActiveSession:
            return "NoActiveSession";
        case RoomErrorCode::kStorageUnavailable:
            return "StorageUnavailable";
        case RoomErrorCode::kInvalidArgument:
            return "InvalidArgument";
        case RoomErrorCode::kInternal:
            return "Internal";
    }
    return "Internal";
}

} // namespace core
} // namespace huddle
