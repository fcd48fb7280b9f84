#pragma once

#include <yaml-cpp/yaml.h>

#include <array>
#include <atomic>
#include <string>
#include <vector>

#include "bot_config.hpp"
#include "ecu/keyboard.hpp"
#include "tools/clock.hpp"

namespace auto_encounter
{
  // 单步的按键方式，WAIT 只等待不按键
  enum class Stroke { PRESS, DOWN, UP, WAIT };
  const std::vector<std::string> STROKES = {"press", "down", "up", "wait"};

  /**
   * @brief 动作脚本中的一步：按键，随后等待 delay 秒
   */
  struct Step {
    ecu::Key key;
    Stroke stroke;
    double delay;
  };

  using Script = std::vector<Step>;

  /**
   * @brief 盲操作游戏菜单所用的全部脚本。菜单布局固定，脚本不读取画面状态
   */
  struct ScriptTable {
    Script open_fight;      // 打开 "战斗" 子菜单
    Script cursor_home;     // 把光标复位到 1 号技能
    std::array<Script, ABILITY_NUM> slot_offset; // 从 1 号技能移到各技能槽
    Script confirm_ability; // 确认出招并等待菜单关闭
    Script flee;            // 选择 "逃跑"
    Script flee_settle;     // 等待逃跑动画结束
    Script travel;          // 传送回复点并等待传送动画
    Script restore;         // 与回复点 NPC 反复对话

    // 完整的出招脚本：打开菜单、复位光标、移到技能槽、确认
    Script fight(int ability) const;
  };

  ScriptTable default_scripts();

  /**
   * @brief 用配置文件中的 scripts 节覆盖同名脚本，没有 scripts 节时原样返回
   *        每步写作 [key, stroke, delay]，如 [confirm, press, 0.3]
   */
  ScriptTable load_scripts(const YAML::Node& yaml, const ScriptTable& base);

  /**
   * @brief 按顺序执行脚本。每步之前检查 running，停止后不再发送后续按键；
   *        单步内的等待不可打断
   */
  class ScriptRunner
  {
  public:
    ScriptRunner(ecu::KeyboardBase& keyboard, tools::Clock& clock, const std::atomic<bool>& running);

    // 返回 false 表示脚本因停止而未执行完
    bool run(const Script& script, const std::string& name);

  private:
    ecu::KeyboardBase& keyboard_;
    tools::Clock& clock_;
    const std::atomic<bool>& running_;
  };

} // namespace auto_encounter
