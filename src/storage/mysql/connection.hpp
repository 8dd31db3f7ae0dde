#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>

namespace huddle {
namespace storage {

// 单个 MySQL 连接, 析构时关闭
class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static huddle::common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    // 连接仍可用
    bool Ping() const noexcept { return handle_ != nullptr && mysql_ping(handle_) == 0; }

    MYSQL* Raw() const noexcept { return handle_; }
    const Options& GetOptions() const noexcept { return options_; }
private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

// 连接类错误 (断线/超时) 映射为 Unavailable, 其余为 Internal
huddle::common::Status MapMySqlError(MYSQL* conn, const std::string& context = "");

} // namespace storage
} // namespace huddle
