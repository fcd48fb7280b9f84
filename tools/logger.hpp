#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace tools
{
  /**
   * @brief 全局日志器，控制台彩色输出并同时写入 logs/ 下的日志文件
   * @return std::shared_ptr<spdlog::logger>
   */
  std::shared_ptr<spdlog::logger> logger();

} // namespace tools
