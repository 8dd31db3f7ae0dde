#include "cache/redis_client.hpp"

#include <chrono>

namespace huddle {
namespace cache {

RedisClient::RedisClient(const huddle::common::RedisConfig& config)
    : config_(config) {}

RedisClient::~RedisClient() = default;

huddle::common::Status RedisClient::Connect() {
    if (!config_.enabled) {
        return huddle::common::Status::Unavailable("Redis is disabled in the configuration.");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (redis_) {
        return huddle::common::Status::OK();
    }

    try {
        sw::redis::ConnectionOptions opts;
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<std::size_t>(config_.pool_size > 0 ? config_.pool_size : 1);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        redis_ = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        return huddle::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return huddle::common::Status::Unavailable("Failed to connect to Redis: " + std::string(err.what()));
    }
}

std::shared_ptr<sw::redis::Redis> RedisClient::Handle() {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_;
}

huddle::common::Status RedisClient::SetEx(const std::string& key, const std::string& value, int ttl_seconds) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        Handle()->set(key, value, std::chrono::seconds(ttl_seconds));
        return huddle::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return huddle::common::Status::Unavailable("Failed to set key " + key + " in Redis: " + err.what());
    }
}

huddle::common::StatusOr<std::string> RedisClient::Get(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        auto value = Handle()->get(key);
        if (!value) {
            return huddle::common::Status::NotFound("Key not found in Redis: " + key);
        }
        return huddle::common::StatusOr<std::string>(*value);
    } catch (const sw::redis::Error& err) {
        return huddle::common::Status::Unavailable("Failed to get key " + key + " from Redis: " + err.what());
    }
}

huddle::common::Status RedisClient::Del(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        Handle()->del(key);
        return huddle::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return huddle::common::Status::Unavailable("Failed to delete key " + key + " from Redis: " + err.what());
    }
}

} // namespace cache
} // namespace huddle
