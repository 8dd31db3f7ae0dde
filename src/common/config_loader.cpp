#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace huddle {
namespace common {

namespace {
AppConfig g_config;
std::once_flag g_config_once; // 全局配置只加载一次

// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("HUDDLE_SERVER_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

AppConfig ConfigLoader::LoadFromString(const std::string& content) {
    return FromJson(nlohmann::json::parse(content, nullptr, true, true));
}

const AppConfig& GlobalConfig() {
    std::call_once(g_config_once, []() {
        g_config = ConfigLoader::LoadFromEnvOrDefault();
    });
    return g_config;
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Server配置
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
    }
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
    }
    // Room配置
    if (j.contains("room")) {
        const auto& room = j["room"];
        cfg.room.default_capacity = room.value("default_capacity", cfg.room.default_capacity);
        cfg.room.outbound_queue_capacity = room.value("outbound_queue_capacity", cfg.room.outbound_queue_capacity);
        cfg.room.heartbeat_timeout_sec = room.value("heartbeat_timeout_sec", cfg.room.heartbeat_timeout_sec);
        cfg.room.sweep_interval_ms = room.value("sweep_interval_ms", cfg.room.sweep_interval_ms);
        cfg.room.admin_user_ids = room.value("admin_user_ids", cfg.room.admin_user_ids);
    }
    // Persistence配置
    if (j.contains("persistence")) {
        const auto& persistence = j["persistence"];
        cfg.persistence.max_attempts = persistence.value("max_attempts", cfg.persistence.max_attempts);
        cfg.persistence.initial_backoff_ms = persistence.value("initial_backoff_ms", cfg.persistence.initial_backoff_ms);
        cfg.persistence.max_backoff_ms = persistence.value("max_backoff_ms", cfg.persistence.max_backoff_ms);
        cfg.persistence.queue_capacity = persistence.value("queue_capacity", cfg.persistence.queue_capacity);
    }
    // Storage配置
    if (j.contains("storage")) {
        const auto& storage = j["storage"];
        if (storage.contains("mysql")) {
            const auto& mysql = storage["mysql"];
            cfg.storage.mysql.host = mysql.value("host", cfg.storage.mysql.host);
            cfg.storage.mysql.port = mysql.value("port", cfg.storage.mysql.port);
            cfg.storage.mysql.user = mysql.value("user", cfg.storage.mysql.user);
            cfg.storage.mysql.password = mysql.value("password", cfg.storage.mysql.password);
            cfg.storage.mysql.database = mysql.value("database", cfg.storage.mysql.database);
            cfg.storage.mysql.pool_size = mysql.value("pool_size", cfg.storage.mysql.pool_size);
            cfg.storage.mysql.connection_timeout_ms = mysql.value("connection_timeout_ms", cfg.storage.mysql.connection_timeout_ms);
            cfg.storage.mysql.read_timeout_ms = mysql.value("read_timeout_ms", cfg.storage.mysql.read_timeout_ms);
            cfg.storage.mysql.write_timeout_ms = mysql.value("write_timeout_ms", cfg.storage.mysql.write_timeout_ms);
            cfg.storage.mysql.enabled = mysql.value("enabled", cfg.storage.mysql.enabled);
        }
    }
    // Cache配置
    if (j.contains("cache")) {
        const auto& cache = j["cache"];
        if (cache.contains("redis")) {
            const auto& redis = cache["redis"];
            cfg.cache.redis.host = redis.value("host", cfg.cache.redis.host);
            cfg.cache.redis.port = redis.value("port", cfg.cache.redis.port);
            cfg.cache.redis.password = redis.value("password", cfg.cache.redis.password);
            cfg.cache.redis.db = redis.value("db", cfg.cache.redis.db);
            cfg.cache.redis.pool_size = redis.value("pool_size", cfg.cache.redis.pool_size);
            cfg.cache.redis.connection_timeout_ms = redis.value("connection_timeout_ms", cfg.cache.redis.connection_timeout_ms);
            cfg.cache.redis.socket_timeout_ms = redis.value("socket_timeout_ms", cfg.cache.redis.socket_timeout_ms);
            cfg.cache.redis.room_meta_ttl_sec = redis.value("room_meta_ttl_sec", cfg.cache.redis.room_meta_ttl_sec);
            cfg.cache.redis.enabled = redis.value("enabled", cfg.cache.redis.enabled);
        }
    }
    return cfg;
}

}
}
