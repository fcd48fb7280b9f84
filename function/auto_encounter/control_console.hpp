#pragma once

#include <string>

#include "encounter_bot.hpp"
#include "template_detector.hpp"

namespace auto_encounter
{
  /**
   * @brief 命令行控制端：解析一行命令，修改配置或启停自动化线程，返回给用户的提示。
   *        非法输入只返回错误提示，原有配置保持不变。
   */
  class ControlConsole
  {
  public:
    ControlConsole(EncounterBot& bot, TemplateDetector& detector, const std::string& template_dir);

    std::string handle(const std::string& line);

    // 状态、统计与 PP 的一行摘要
    std::string status() const;

    static std::string help();

    bool quit_requested() const { return quit_; }

  private:
    EncounterBot& bot_;
    TemplateDetector& detector_;
    std::string template_dir_;
    bool quit_;

    std::string start();
    std::string set_seconds(const std::string& name, const std::string& value);
  };

} // namespace auto_encounter
