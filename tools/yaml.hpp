#pragma once

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

#include "tools/logger.hpp"

namespace tools
{
  /**
   * @brief 读取 yaml 配置文件，文件不存在或格式错误时抛出异常
   * @param[in] path          配置文件路径
   * @return YAML::Node
   */
  inline YAML::Node load(const std::string& path)
  {
    try {
      return YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
      logger()->error("[YAML] 无法打开配置文件: {}", path);
      throw std::runtime_error("[YAML] 无法打开配置文件: " + path);
    } catch (const YAML::ParserException& e) {
      logger()->error("[YAML] 配置文件格式错误: {}", e.what());
      throw std::runtime_error(std::string("[YAML] 配置文件格式错误: ") + e.what());
    }
  }

  /**
   * @brief 读取必需的配置项，缺失时抛出异常
   */
  template <typename T> T read(const YAML::Node& yaml, const std::string& key)
  {
    if (!yaml[key]) {
      logger()->error("[YAML] 缺少 '{}' 配置项", key);
      throw std::runtime_error("[YAML] 缺少 '" + key + "' 配置项");
    }
    return yaml[key].as<T>();
  }

  /**
   * @brief 读取可选的配置项，缺失时返回默认值
   */
  template <typename T> T read_or(const YAML::Node& yaml, const std::string& key, const T& fallback)
  {
    return yaml[key] ? yaml[key].as<T>() : fallback;
  }

} // namespace tools
