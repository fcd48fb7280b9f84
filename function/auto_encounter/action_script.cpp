#include "action_script.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

#include "tools/logger.hpp"

namespace auto_encounter
{
  namespace
  {
    constexpr double NAV_DELAY = 0.1;     // 菜单中移动一次光标
    constexpr double CONFIRM_DELAY = 0.3; // 确认后菜单切换

    Step press(ecu::Key key, double delay) { return Step{key, Stroke::PRESS, delay}; }
    Step wait(double delay) { return Step{ecu::confirm, Stroke::WAIT, delay}; }

    Step parse_step(const YAML::Node& node, const std::string& name)
    {
      if (!node.IsSequence() || node.size() != 3) {
        throw std::runtime_error("[ActionScript] 脚本 " + name + " 的步骤格式应为 [key, stroke, delay]");
      }

      Step step{};
      if (!ecu::parse_key(node[0].as<std::string>(), step.key)) {
        throw std::runtime_error("[ActionScript] 脚本 " + name + " 中有未知按键: " +
                                 node[0].as<std::string>());
      }

      auto stroke = node[1].as<std::string>();
      bool known = false;
      for (std::size_t i = 0; i < STROKES.size(); ++i) {
        if (STROKES[i] == stroke) {
          step.stroke = static_cast<Stroke>(i);
          known = true;
        }
      }
      if (!known) {
        throw std::runtime_error("[ActionScript] 脚本 " + name + " 中有未知按键方式: " + stroke);
      }

      step.delay = node[2].as<double>();
      if (!(step.delay >= 0.0)) {
        throw std::runtime_error("[ActionScript] 脚本 " + name + " 中的等待时间不能为负数");
      }
      return step;
    }

    Script parse_script(const YAML::Node& node, const std::string& name)
    {
      if (!node.IsSequence()) {
        throw std::runtime_error("[ActionScript] 脚本 " + name + " 应为步骤列表");
      }
      Script script;
      for (const auto& step : node) {
        script.push_back(parse_step(step, name));
      }
      return script;
    }
  } // namespace

  Script ScriptTable::fight(int ability) const
  {
    if (!is_valid_ability(ability)) {
      throw std::out_of_range("ability id " + std::to_string(ability) + " out of range");
    }
    Script script;
    for (const auto* part : {&open_fight, &cursor_home, &slot_offset[ability - 1], &confirm_ability}) {
      script.insert(script.end(), part->begin(), part->end());
    }
    return script;
  }

  ScriptTable default_scripts()
  {
    ScriptTable table;
    table.open_fight = {press(ecu::up, NAV_DELAY), press(ecu::confirm, CONFIRM_DELAY)};
    table.cursor_home = {press(ecu::up, NAV_DELAY), press(ecu::up, NAV_DELAY),
                         press(ecu::left, NAV_DELAY)};

    // 技能按 2x2 排列：1 左上，2 右上，3 左下，4 右下
    table.slot_offset[0] = {};
    table.slot_offset[1] = {press(ecu::right, NAV_DELAY)};
    table.slot_offset[2] = {press(ecu::down, NAV_DELAY)};
    table.slot_offset[3] = {press(ecu::down, NAV_DELAY), press(ecu::right, NAV_DELAY)};
    table.confirm_ability = {press(ecu::confirm, CONFIRM_DELAY)};

    table.flee = {press(ecu::up, NAV_DELAY), press(ecu::down, NAV_DELAY),
                  press(ecu::right, NAV_DELAY), press(ecu::confirm, CONFIRM_DELAY)};
    table.flee_settle = {wait(2.0)};

    table.travel = {press(ecu::teleport, 6.0), wait(2.0)};
    table.restore = {wait(0.8)};
    for (int i = 0; i < 5; ++i) {
      table.restore.push_back(press(ecu::confirm, 0.8));
    }
    return table;
  }

  ScriptTable load_scripts(const YAML::Node& yaml, const ScriptTable& base)
  {
    ScriptTable table = base;
    const auto& scripts = yaml["scripts"];
    if (!scripts) {
      return table;
    }

    const std::map<std::string, Script*> named = {
        {"open_fight", &table.open_fight},
        {"cursor_home", &table.cursor_home},
        {"slot_1", &table.slot_offset[0]},
        {"slot_2", &table.slot_offset[1]},
        {"slot_3", &table.slot_offset[2]},
        {"slot_4", &table.slot_offset[3]},
        {"confirm_ability", &table.confirm_ability},
        {"flee", &table.flee},
        {"flee_settle", &table.flee_settle},
        {"travel", &table.travel},
        {"restore", &table.restore},
    };

    for (const auto& entry : scripts) {
      auto name = entry.first.as<std::string>();
      auto it = named.find(name);
      if (it == named.end()) {
        throw std::runtime_error("[ActionScript] 未知脚本: " + name);
      }
      *it->second = parse_script(entry.second, name);
      tools::logger()->info("[ActionScript] 脚本 {} 已由配置文件覆盖, 共 {} 步", name,
                            it->second->size());
    }
    return table;
  }

  ScriptRunner::ScriptRunner(ecu::KeyboardBase& keyboard, tools::Clock& clock,
                             const std::atomic<bool>& running)
      : keyboard_(keyboard)
      , clock_(clock)
      , running_(running)
  {
  }

  bool ScriptRunner::run(const Script& script, const std::string& name)
  {
    tools::logger()->debug("[ActionScript] 执行脚本 {}", name);
    std::vector<ecu::Key> held;
    for (const auto& step : script) {
      if (!running_.load()) {
        // 中途停止时松开仍按着的键
        for (auto key : held) {
          keyboard_.key_up(key);
        }
        tools::logger()->info("[ActionScript] 脚本 {} 被停止", name);
        return false;
      }

      switch (step.stroke) {
        case Stroke::PRESS:
          keyboard_.press(step.key);
          break;
        case Stroke::DOWN:
          keyboard_.key_down(step.key);
          held.push_back(step.key);
          break;
        case Stroke::UP:
          keyboard_.key_up(step.key);
          held.erase(std::remove(held.begin(), held.end(), step.key), held.end());
          break;
        case Stroke::WAIT:
          break;
      }
      clock_.sleep_for(step.delay);
    }
    return true;
  }

} // namespace auto_encounter
