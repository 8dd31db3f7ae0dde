#pragma once

#include <string>
#include <vector>

namespace huddle {
namespace common {

// 服务器配置结构体
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50061;
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
};

// 房间配置结构体
struct RoomConfig {
    int default_capacity = 100;            // 房间元数据未指定容量时使用
    int outbound_queue_capacity = 256;     // 每个连接的出站事件队列上限
    int heartbeat_timeout_sec = 60;        // 超过该时长无消息的连接视为失联
    int sweep_interval_ms = 10000;         // 失联扫描周期, 0 表示关闭
    std::vector<std::string> admin_user_ids;  // 平台管理员, 加入任何房间都是 ADMIN
};

// 持久化重试配置结构体
struct PersistenceConfig {
    int max_attempts = 3;
    int initial_backoff_ms = 100;
    int max_backoff_ms = 2000;
    int queue_capacity = 4096;  // 待写任务上限, 超出后丢弃并记录
};

// Mysql配置结构体
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "huddle";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    bool enabled = false;
};

// 存储配置结构体
struct StorageConfig {
    MysqlConfig mysql;
};

// Redis配置结构体
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int socket_timeout_ms = 500;
    int room_meta_ttl_sec = 300;
    bool enabled = false;
};

// 缓存配置结构体
struct CacheConfig {
    RedisConfig redis;
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    RoomConfig room;
    PersistenceConfig persistence;
    StorageConfig storage;
    CacheConfig cache;
};

}
}
