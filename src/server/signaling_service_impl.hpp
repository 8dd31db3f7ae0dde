#pragma once

#include "common/status.hpp"
#include "core/room/peer_channel.hpp"
#include "core/room/room_coordinator.hpp"

#include "signaling_service.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace huddle {
namespace server {

class SignalingServiceImpl final : public proto::signaling::SignalingService::Service {
public:
    SignalingServiceImpl(std::shared_ptr<core::RoomCoordinator> coordinator
                         , std::shared_ptr<core::PeerChannelHub> hub);

    // 每条流对应一个连接: 读线程分发入站消息, 写线程排空该连接的出站队列
    grpc::Status Connect(grpc::ServerContext* context
                         , grpc::ServerReaderWriter<proto::signaling::ServerMessage, proto::signaling::ClientMessage>* stream) override;

    grpc::Status GetAttendance(grpc::ServerContext* context
                               , const proto::signaling::GetAttendanceRequest* request
                               , proto::signaling::GetAttendanceResponse* response) override;

    grpc::Status RepairParticipant(grpc::ServerContext* context
                                   , const proto::signaling::RepairParticipantRequest* request
                                   , proto::signaling::RepairParticipantResponse* response) override;

    static grpc::Status ToGrpcStatus(const huddle::common::Status& status);

    // 把一条入站消息转换为协调器命令
    void Dispatch(const std::string& peer_id, const proto::signaling::ClientMessage& message);

private:
    std::string NextPeerId();

private:
    std::shared_ptr<core::RoomCoordinator> coordinator_;
    std::shared_ptr<core::PeerChannelHub> hub_;
    std::atomic<std::uint64_t> next_peer_{0};
};

} // namespace server
} // namespace huddle
