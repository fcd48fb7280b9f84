#include "logger.hpp"

#include <fmt/chrono.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace tools
{
  namespace
  {
    std::shared_ptr<spdlog::logger> LOGGER;
    std::once_flag LOGGER_FLAG;

    void set_logger()
    {
      auto file_name = fmt::format("logs/{:%Y-%m-%d_%H-%M-%S}.log", std::chrono::system_clock::now());

      auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::debug);

      std::vector<spdlog::sink_ptr> sinks{console_sink};
      std::string file_error;
      try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_name, true);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex& e) {
        // 日志目录不可写时只输出到控制台
        file_error = e.what();
      }

      LOGGER = std::make_shared<spdlog::logger>("auto_encounter", sinks.begin(), sinks.end());
      LOGGER->set_level(spdlog::level::debug);
      LOGGER->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
      LOGGER->flush_on(spdlog::level::info);

      if (!file_error.empty()) {
        LOGGER->warn("[Logger] 无法创建日志文件 {}: {}", file_name, file_error);
      }
    }
  } // namespace

  std::shared_ptr<spdlog::logger> logger()
  {
    std::call_once(LOGGER_FLAG, set_logger);
    return LOGGER;
  }

} // namespace tools
