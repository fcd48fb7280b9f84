#include "control_console.hpp"

#include <fmt/core.h>

#include <sstream>
#include <vector>

#include "tools/logger.hpp"

namespace auto_encounter
{
  namespace
  {
    std::vector<std::string> split(const std::string& line)
    {
      std::istringstream stream(line);
      std::vector<std::string> words;
      std::string word;
      while (stream >> word) {
        words.push_back(word);
      }
      return words;
    }

    // 整个字符串都是数字时才算成功
    bool to_int(const std::string& text, int& value)
    {
      try {
        std::size_t pos = 0;
        value = std::stoi(text, &pos);
        return pos == text.size();
      } catch (const std::exception&) {
        return false;
      }
    }

    bool to_double(const std::string& text, double& value)
    {
      try {
        std::size_t pos = 0;
        value = std::stod(text, &pos);
        return pos == text.size();
      } catch (const std::exception&) {
        return false;
      }
    }

    bool to_switch(const std::string& text, bool& value)
    {
      if (text == "on") {
        value = true;
        return true;
      }
      if (text == "off") {
        value = false;
        return true;
      }
      return false;
    }

    std::string ability_label(const Settings& settings)
    {
      if (settings.use_backup) {
        return fmt::format("主技能 {}, 备用技能 {}", settings.selected_ability,
                           settings.backup_ability);
      }
      return fmt::format("主技能 {} (无备用)", settings.selected_ability);
    }
  } // namespace

  ControlConsole::ControlConsole(EncounterBot& bot, TemplateDetector& detector,
                                 const std::string& template_dir)
      : bot_(bot)
      , detector_(detector)
      , template_dir_(template_dir)
      , quit_(false)
  {
  }

  std::string ControlConsole::handle(const std::string& line)
  {
    auto words = split(line);
    if (words.empty()) {
      return "";
    }

    const auto& command = words[0];
    auto& config = bot_.config();

    if (command == "start" && words.size() == 1) {
      return start();
    }
    if (command == "stop" && words.size() == 1) {
      bot_.stop();
      return "已停止";
    }
    if (command == "status" && words.size() == 1) {
      return status();
    }
    if (command == "help" && words.size() == 1) {
      return help();
    }
    if (command == "quit" && words.size() == 1) {
      quit_ = true;
      bot_.stop();
      return "退出";
    }
    if (command == "reset_pp" && words.size() == 1) {
      config.reset_pp();
      return "PP 已全部重置";
    }

    if (command == "ability" && words.size() == 2) {
      int id = 0;
      if (!to_int(words[1], id) || !config.set_selected_ability(id)) {
        return "技能编号应为 1 ~ 4";
      }
      return "当前使用: " + ability_label(config.snapshot());
    }

    if (command == "backup" && words.size() == 2) {
      bool use_backup = false;
      if (to_switch(words[1], use_backup)) {
        config.set_use_backup(use_backup);
        return "当前使用: " + ability_label(config.snapshot());
      }
      int id = 0;
      if (!to_int(words[1], id) || !config.set_backup_ability(id)) {
        return "备用技能应为 1 ~ 4 或 on/off";
      }
      return "当前使用: " + ability_label(config.snapshot());
    }

    if (command == "pp" && words.size() == 3) {
      int id = 0, max_uses = 0;
      if (!to_int(words[1], id) || !to_int(words[2], max_uses) ||
          !config.set_max_pp(id, max_uses)) {
        auto settings = config.snapshot();
        if (is_valid_ability(id)) {
          return fmt::format("最大 PP 应为正整数, 技能 {} 保持 {}", id,
                             settings.ability(id).max_uses);
        }
        return "用法: pp <1-4> <最大PP>";
      }
      return fmt::format("技能 {} PP: {}/{}", id, max_uses, max_uses);
    }

    if (command == "teleport" && words.size() == 2) {
      bool use_teleport = false;
      if (!to_switch(words[1], use_teleport)) {
        return "用法: teleport on|off";
      }
      config.set_use_teleport(use_teleport);
      return use_teleport ? "PP 耗尽后传送回复" : "PP 耗尽后只逃跑";
    }

    if (command == "pattern" && words.size() == 2) {
      Axis axis = Axis::HORIZONTAL;
      if (!parse_axis(words[1], axis)) {
        return "用法: pattern horizontal|vertical";
      }
      config.set_pattern(axis);
      return "移动方式: " + words[1];
    }

    if (command == "spaces" && words.size() == 2) {
      int spaces = 0;
      if (!to_int(words[1], spaces) || !config.set_spaces(spaces)) {
        return fmt::format("格数应为 {} ~ {}", MIN_SPACES, MAX_SPACES);
      }
      return fmt::format("每次移动 {} 格", spaces);
    }

    if ((command == "time_per_space" || command == "time_to_turn" || command == "movement_delay") &&
        words.size() == 2) {
      return set_seconds(command, words[1]);
    }

    if (command == "threshold" && words.size() == 2) {
      double threshold = 0.0;
      if (!to_double(words[1], threshold) || !config.set_detection_threshold(threshold)) {
        return fmt::format("阈值应在 [0, 1] 内, 保持 {:.2f}", config.snapshot().detection_threshold);
      }
      return fmt::format("检测阈值: {:.2f}", threshold);
    }

    if (command == "load" && words.size() == 3) {
      const auto& name = words[1];
      if (name != HP_INDICATOR && name != BATTLE_MENU) {
        return fmt::format("参考图名称应为 {} 或 {}", HP_INDICATOR, BATTLE_MENU);
      }
      if (!detector_.load(name, words[2])) {
        return "无法读取图片: " + words[2];
      }
      if (!detector_.save(name, template_dir_)) {
        return fmt::format("已加载 {}, 但未能保存到 {}", name, template_dir_);
      }
      return fmt::format("已加载 {} 并保存到 {}", name, template_dir_);
    }

    return "未知命令, 输入 help 查看用法";
  }

  std::string ControlConsole::status() const
  {
    auto settings = bot_.config().snapshot();
    auto stats = bot_.stats();

    std::string pp;
    for (int id = 1; id <= ABILITY_NUM; ++id) {
      const auto& ability = settings.ability(id);
      pp += fmt::format(" {}:{}/{}", id, ability.remaining_uses, ability.max_uses);
    }

    return fmt::format("状态: {} | 移动 {} 次 | 战斗 {} 场 | 逃跑 {} 次 | PP{} | {} | {} {}",
                       STATES[static_cast<int>(bot_.state())], stats.movements, stats.battles,
                       stats.flees, pp, ability_label(settings),
                       AXES[static_cast<int>(settings.pattern)], settings.spaces);
  }

  std::string ControlConsole::help()
  {
    return "命令:\n"
           "  start | stop | status | quit\n"
           "  ability <1-4>             主技能\n"
           "  backup <1-4>|on|off       备用技能\n"
           "  pp <1-4> <max>            设置最大 PP 并重置当前 PP\n"
           "  reset_pp                  重置全部 PP\n"
           "  teleport on|off           PP 耗尽逃跑后传送回复\n"
           "  pattern horizontal|vertical\n"
           "  spaces <1-4>\n"
           "  time_per_space|time_to_turn|movement_delay <秒>\n"
           "  threshold <0-1>\n"
           "  load hp_indicator|battle_menu <图片路径>";
  }

  std::string ControlConsole::start()
  {
    if (bot_.running()) {
      return "已在运行";
    }
    if (!detector_.has_template(HP_INDICATOR)) {
      return "请先加载 hp_indicator 参考图!";
    }
    // 每次启动都从满 PP 开始
    bot_.config().reset_pp();
    if (!bot_.start()) {
      return "启动失败";
    }
    return "已启动, " + ability_label(bot_.config().snapshot());
  }

  std::string ControlConsole::set_seconds(const std::string& name, const std::string& value)
  {
    auto& config = bot_.config();
    double seconds = 0.0;
    bool ok = to_double(value, seconds);
    if (ok) {
      if (name == "time_per_space") {
        ok = config.set_time_per_space(seconds);
      } else if (name == "time_to_turn") {
        ok = config.set_time_to_turn(seconds);
      } else {
        ok = config.set_movement_delay(seconds);
      }
    }
    if (!ok) {
      tools::logger()->warn("[ControlConsole] 拒绝 {} = {}", name, value);
      return name + " 应为正数, 保持原值";
    }
    return fmt::format("{} = {:.2f}s", name, seconds);
  }

} // namespace auto_encounter
