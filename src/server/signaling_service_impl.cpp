#include "server/signaling_service_impl.hpp"
#include "server/wire_codec.hpp"
#include "common/logger.hpp"

#include <fmt/format.h>

#include <chrono>
#include <thread>

namespace huddle {
namespace server {

namespace {

constexpr auto kWriterPollInterval = std::chrono::milliseconds(200);

void LogOutcome(const std::string& peer_id, const char* operation, const huddle::common::Status& status) {
    // 拒绝原因已单播给对端, 这里只留调试日志
    if (!status.IsOk()) {
        HUDDLE_LOG_DEBUG("[SignalingService] {} from {} rejected: {}", operation, peer_id, status.Message());
    }
}

} // namespace

SignalingServiceImpl::SignalingServiceImpl(std::shared_ptr<core::RoomCoordinator> coordinator
                                           , std::shared_ptr<core::PeerChannelHub> hub)
    : coordinator_(std::move(coordinator)), hub_(std::move(hub)) {}

std::string SignalingServiceImpl::NextPeerId() {
    const auto seq = next_peer_.fetch_add(1, std::memory_order_relaxed) + 1;
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("peer-{:x}-{}", now, seq);
}

grpc::Status SignalingServiceImpl::Connect(grpc::ServerContext* context
                                           , grpc::ServerReaderWriter<proto::signaling::ServerMessage, proto::signaling::ClientMessage>* stream) {
    const std::string peer_id = NextPeerId();
    auto channel = hub_->Open(peer_id);
    HUDDLE_LOG_INFO("[SignalingService] Stream opened for peer {} from {}", peer_id, context->peer());

    std::atomic<bool> reader_done{false};
    std::thread writer([&]() {
        core::OutboundEvent event;
        for (;;) {
            if (channel->WaitPop(event, kWriterPollInterval)) {
                if (!stream->Write(ToProto(event))) {
                    HUDDLE_LOG_WARN("[SignalingService] Write to peer {} failed, cancelling stream", peer_id);
                    context->TryCancel();
                    break;
                }
                continue;
            }
            if (channel->Closed() && channel->Pending() == 0) {
                // 通道被服务端关闭 (踢出/超时/溢出): 结束整条流
                if (!reader_done.load()) {
                    context->TryCancel();
                }
                break;
            }
        }
    });

    proto::signaling::ClientMessage message;
    while (stream->Read(&message)) {
        Dispatch(peer_id, message);
    }
    reader_done.store(true);

    coordinator_->OnPeerGone(peer_id, channel->Overflowed() ? "outbound queue overflow" : "connection closed");
    hub_->Remove(peer_id, channel);
    writer.join();
    HUDDLE_LOG_INFO("[SignalingService] Stream closed for peer {}", peer_id);
    return grpc::Status::OK;
}

void SignalingServiceImpl::Dispatch(const std::string& peer_id, const proto::signaling::ClientMessage& message) {
    using proto::signaling::ClientMessage;
    switch (message.payload_case()) {
        case ClientMessage::kJoin: {
            const auto& join = message.join();
            core::ConnectCommand command;
            command.room_id = join.room_id();
            command.peer_id = peer_id;
            command.user_id = join.user_id();
            command.display_name = join.display_name();
            command.passcode = join.passcode();
            command.media.mic_on = !join.mic_off();
            command.media.camera_on = !join.camera_off();
            auto snapshot = coordinator_->Connect(command);
            LogOutcome(peer_id, "join", snapshot.GetStatus());
            break;
        }
        case ClientMessage::kLeave:
            LogOutcome(peer_id, "leave", coordinator_->Disconnect(
                core::DisconnectCommand{message.leave().room_id(), peer_id, "left"}));
            break;
        case ClientMessage::kSignal: {
            const auto& signal = message.signal();
            const auto type = SignalTypeFromProto(signal.type());
            if (!type) {
                LogOutcome(peer_id, "signal", coordinator_->Reject(peer_id, "",
                    core::FromRoomError(core::RoomErrorCode::kInvalidArgument, "Signal type is required.")));
                break;
            }
            core::SignalCommand command;
            command.envelope.from = peer_id;
            command.envelope.to = signal.to();
            command.envelope.type = *type;
            command.envelope.sdp = signal.sdp();
            command.envelope.candidate = signal.candidate();
            LogOutcome(peer_id, "signal", coordinator_->Signal(command));
            break;
        }
        case ClientMessage::kMediaStateChange: {
            const auto& change = message.media_state_change();
            core::MediaUpdateCommand command;
            command.room_id = change.room_id();
            command.actor_peer_id = peer_id;
            command.target_peer_id = change.target_peer_id();
            command.mic = MediaStateFromProto(change.mic());
            command.camera = MediaStateFromProto(change.camera());
            LogOutcome(peer_id, "media_state_change", coordinator_->UpdateMedia(command));
            break;
        }
        case ClientMessage::kEndMeeting:
            LogOutcome(peer_id, "end_meeting", coordinator_->EndMeeting(
                core::EndMeetingCommand{message.end_meeting().room_id(), peer_id, message.end_meeting().reason()}));
            break;
        case ClientMessage::kKick: {
            const auto& kick = message.kick();
            LogOutcome(peer_id, "kick", coordinator_->Kick(
                core::KickCommand{kick.room_id(), peer_id, kick.target_peer_id(), kick.reason()}));
            break;
        }
        case ClientMessage::kChangeRole: {
            const auto& change = message.change_role();
            LogOutcome(peer_id, "change_role", coordinator_->ChangeRole(
                core::ChangeRoleCommand{change.room_id(), peer_id, change.target_peer_id(), RoleFromProto(change.role())}));
            break;
        }
        case ClientMessage::kPing:
            LogOutcome(peer_id, "ping", coordinator_->Heartbeat("", peer_id));
            break;
        case ClientMessage::PAYLOAD_NOT_SET:
            HUDDLE_LOG_WARN("[SignalingService] Empty message from peer {}", peer_id);
            break;
    }
}

grpc::Status SignalingServiceImpl::GetAttendance(grpc::ServerContext* context
                                                 , const proto::signaling::GetAttendanceRequest* request
                                                 , proto::signaling::GetAttendanceResponse* response) {
    (void)context;
    auto records = coordinator_->Attendance(request->room_id());
    if (!records.IsOk()) {
        ErrorToProto(core::ToRoomError(records.GetStatus()), records.GetStatus(), response->mutable_error());
        return ToGrpcStatus(records.GetStatus());
    }
    for (const auto& record : records.Value()) {
        auto* entry = response->add_entries();
        entry->set_participant_id(record.participant_id);
        entry->set_display_name(record.display_name);
        entry->set_role(RoleToProto(record.role));
        entry->set_connected(record.connected);
        entry->set_session_count(static_cast<int32_t>(record.session_count));
        entry->set_total_duration_sec(record.total_duration_sec);
    }
    ErrorToProto(core::RoomErrorCode::kOk, huddle::common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status SignalingServiceImpl::RepairParticipant(grpc::ServerContext* context
                                                     , const proto::signaling::RepairParticipantRequest* request
                                                     , proto::signaling::RepairParticipantResponse* response) {
    (void)context;
    HUDDLE_LOG_INFO("[SignalingService] RepairParticipant room={} participant={}",
                    request->room_id(), request->participant_id());
    auto total = coordinator_->RepairParticipant(request->room_id(), request->participant_id());
    if (!total.IsOk()) {
        ErrorToProto(core::ToRoomError(total.GetStatus()), total.GetStatus(), response->mutable_error());
        return ToGrpcStatus(total.GetStatus());
    }
    response->set_total_duration_sec(total.Value());
    ErrorToProto(core::RoomErrorCode::kOk, huddle::common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status SignalingServiceImpl::ToGrpcStatus(const huddle::common::Status& status) {
    using huddle::common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return grpc::Status::OK;
        case StatusCode::kInvalidArgument:
            return {grpc::StatusCode::INVALID_ARGUMENT, status.Message()};
        case StatusCode::kNotFound:
            return {grpc::StatusCode::NOT_FOUND, status.Message()};
        case StatusCode::kAlreadyExists:
            return {grpc::StatusCode::ALREADY_EXISTS, status.Message()};
        case StatusCode::kPermissionDenied:
            return {grpc::StatusCode::PERMISSION_DENIED, status.Message()};
        case StatusCode::kResourceExhausted:
            return {grpc::StatusCode::RESOURCE_EXHAUSTED, status.Message()};
        case StatusCode::kFailedPrecondition:
            return {grpc::StatusCode::FAILED_PRECONDITION, status.Message()};
        case StatusCode::kAborted:
            return {grpc::StatusCode::ABORTED, status.Message()};
        case StatusCode::kUnauthenticated:
            return {grpc::StatusCode::UNAUTHENTICATED, status.Message()};
        case StatusCode::kUnavailable:
            return {grpc::StatusCode::UNAVAILABLE, status.Message()};
        case StatusCode::kInternal:
            return {grpc::StatusCode::INTERNAL, status.Message()};
    }
    return {grpc::StatusCode::UNKNOWN, status.Message()};
}

} // namespace server
} // namespace huddle
