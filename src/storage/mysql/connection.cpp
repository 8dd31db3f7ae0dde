#include "storage/mysql/connection.hpp"

#include <mysql/errmsg.h>

#include <algorithm>

namespace huddle {
namespace storage {

namespace {

unsigned int ToSeconds(std::chrono::milliseconds value) {
    // MySQL 客户端超时精度为秒, 不足一秒按一秒计
    return static_cast<unsigned int>(std::max<std::int64_t>(1, (value.count() + 999) / 1000));
}

} // namespace

huddle::common::Status MapMySqlError(MYSQL* conn, const std::string& context) {
    const std::string prefix = context.empty() ? "" : context + ": ";
    if (conn == nullptr) {
        return huddle::common::Status::Unavailable(prefix + "no connection");
    }
    const unsigned int err = mysql_errno(conn);
    switch (err) {
        case CR_CONNECTION_ERROR:
        case CR_CONN_HOST_ERROR:
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_UNKNOWN_HOST:
            return huddle::common::Status::Unavailable(prefix + mysql_error(conn));
        case 1062: // Duplicate entry
            return huddle::common::Status::AlreadyExists(prefix + mysql_error(conn));
        default:
            return huddle::common::Status::Internal(prefix + mysql_error(conn));
    }
}

Connection::Connection(MYSQL* handle, Options options) : handle_(handle), options_(std::move(options)) {}

Connection::~Connection() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

huddle::common::StatusOr<std::unique_ptr<Connection>> Connection::Create(const Options& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        return huddle::common::Status::Internal("mysql_init failed");
    }

    unsigned int connect_timeout_sec = ToSeconds(options.connect_timeout);
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_sec);
    unsigned int read_timeout_sec = ToSeconds(options.read_timeout);
    mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &read_timeout_sec);
    unsigned int write_timeout_sec = ToSeconds(options.write_timeout);
    mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout_sec);

    if (!mysql_real_connect(handle,
                            options.host.c_str(),
                            options.user.c_str(),
                            options.password.c_str(),
                            options.database.c_str(),
                            options.port,
                            nullptr,
                            0)) {
        // 建连失败一律视为暂时不可用, 交给调用方重试
        auto status = huddle::common::Status::Unavailable(std::string("mysql_real_connect failed: ") + mysql_error(handle));
        mysql_close(handle);
        return status;
    }

    if (!options.charset.empty() && mysql_set_character_set(handle, options.charset.c_str()) != 0) {
        auto status = MapMySqlError(handle, "mysql_set_character_set failed");
        mysql_close(handle);
        return status;
    }

    return huddle::common::StatusOr<std::unique_ptr<Connection>>(std::unique_ptr<Connection>(new Connection(handle, options)));
}

} // namespace storage
} // namespace huddle
