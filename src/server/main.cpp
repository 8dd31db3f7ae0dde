#include "cache/redis_client.hpp"
#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "core/room/cached_room_store.hpp"
#include "core/room/peer_channel.hpp"
#include "core/room/persistence_dispatcher.hpp"
#include "core/room/room_coordinator.hpp"
#include "core/room/room_registry.hpp"
#include "core/room/room_store.hpp"
#include "server/presence_sweeper.hpp"
#include "server/signaling_service_impl.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/room_store.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <csignal>
#include <chrono>
#include <grpcpp/grpcpp.h>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

// MySQL 未启用或不可用时退回内存存储
std::shared_ptr<huddle::core::RoomStore> BuildRoomStore(const huddle::common::AppConfig& config) {
    std::shared_ptr<huddle::core::RoomStore> store;
    if (config.storage.mysql.enabled) {
        auto pool = std::make_shared<huddle::storage::ConnectionPool>(
            huddle::storage::Options::FromConfig(config.storage.mysql));
        auto probe = pool->Acquire();
        if (probe.IsOk()) {
            store = std::make_shared<huddle::storage::MySqlRoomStore>(pool);
            HUDDLE_LOG_INFO("Using MySQL room store at {}:{}", config.storage.mysql.host, config.storage.mysql.port);
        } else {
            HUDDLE_LOG_ERROR("MySQL unavailable ({}), falling back to in-memory store", probe.GetStatus().Message());
        }
    }
    if (!store) {
        store = std::make_shared<huddle::core::InMemoryRoomStore>();
        HUDDLE_LOG_INFO("Using in-memory room store");
    }

    if (config.cache.redis.enabled) {
        auto redis = std::make_shared<huddle::cache::RedisClient>(config.cache.redis);
        auto status = redis->Connect();
        if (status.IsOk()) {
            HUDDLE_LOG_INFO("Room metadata cached in Redis {}:{}", config.cache.redis.host, config.cache.redis.port);
            return std::make_shared<huddle::core::CachedRoomStore>(store, redis, config.cache.redis.room_meta_ttl_sec);
        }
        HUDDLE_LOG_WARN("Redis unavailable ({}), room metadata cache disabled", status.Message());
    }
    return store;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("HUDDLE_SERVER_CONFIG")) {
        config_path = env;
    } else {
        config_path = huddle::common::GetConfigPath("app.example.json");
    }

    huddle::common::AppConfig config;
    try {
        config = huddle::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    huddle::common::InitLogger(config.logging);
    HUDDLE_LOG_INFO("Huddle server starting with config {}", config_path);

    auto store = BuildRoomStore(config);
    auto dispatcher = std::make_shared<huddle::core::PersistenceDispatcher>(
        huddle::core::RetryPolicy::FromConfig(config.persistence));
    auto registry = std::make_shared<huddle::core::RoomRegistry>(config.room.default_capacity);
    auto hub = std::make_shared<huddle::core::PeerChannelHub>(
        static_cast<std::size_t>(config.room.outbound_queue_capacity > 0 ? config.room.outbound_queue_capacity : 1));

    huddle::core::CoordinatorOptions options;
    options.heartbeat_timeout_sec = config.room.heartbeat_timeout_sec;
    options.admin_user_ids.insert(config.room.admin_user_ids.begin(), config.room.admin_user_ids.end());
    auto coordinator = std::make_shared<huddle::core::RoomCoordinator>(
        registry, store, hub, dispatcher, std::make_shared<huddle::common::SystemClock>(), options);

    huddle::server::SignalingServiceImpl signaling_service(coordinator, hub);
    huddle::server::PresenceSweeper sweeper(coordinator, std::chrono::milliseconds(config.room.sweep_interval_ms));

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&signaling_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        HUDDLE_LOG_ERROR("Failed to start gRPC server on {}", address);
        dispatcher->Stop();
        huddle::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    HUDDLE_LOG_INFO("Huddle server listening on {}", address);
    sweeper.Start();

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        HUDDLE_LOG_WARN("Signal {} received, shutting down gRPC server...", g_stop_signal);
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();

    sweeper.Stop();
    // 排空尚未写入的会话与审计记录
    dispatcher->Stop();
    HUDDLE_LOG_INFO("Persistence drained: {} completed, {} failed, {} dropped",
                    dispatcher->Completed(), dispatcher->Failed(), dispatcher->Dropped());
    huddle::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
