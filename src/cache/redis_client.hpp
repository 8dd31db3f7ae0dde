#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "common/config.hpp"

#include <sw/redis++/redis++.h>

#include <memory>
#include <mutex>
#include <string>

namespace huddle {
namespace cache {

// redis++ 的薄封装, 异常统一转换为 Unavailable
class RedisClient {
public:
    explicit RedisClient(const huddle::common::RedisConfig& config);
    ~RedisClient();

    // 懒连接, 配置未启用时返回 Unavailable
    huddle::common::Status Connect();

    huddle::common::Status SetEx(const std::string& key, const std::string& value, int ttl_seconds);
    // 键不存在时返回 NotFound
    huddle::common::StatusOr<std::string> Get(const std::string& key);
    huddle::common::Status Del(const std::string& key);

    bool Enabled() const { return config_.enabled; }

private:
    std::shared_ptr<sw::redis::Redis> Handle();

    huddle::common::RedisConfig config_;
    std::mutex mutex_; // 保护 redis_ 的创建
    std::shared_ptr<sw::redis::Redis> redis_;
};

} // namespace cache
} // namespace huddle
