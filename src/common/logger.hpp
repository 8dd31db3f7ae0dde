#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace huddle {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define HUDDLE_LOG_DEBUG(...) ::huddle::common::GetLogger()->debug(__VA_ARGS__)
#define HUDDLE_LOG_INFO(...)  ::huddle::common::GetLogger()->info(__VA_ARGS__)
#define HUDDLE_LOG_WARN(...)  ::huddle::common::GetLogger()->warn(__VA_ARGS__)
#define HUDDLE_LOG_ERROR(...) ::huddle::common::GetLogger()->error(__VA_ARGS__)

}
}
