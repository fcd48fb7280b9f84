#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "action_script.hpp"
#include "bot_config.hpp"
#include "template_detector.hpp"
#include "tools/clock.hpp"

namespace auto_encounter
{
  // 一场战斗的结果：打完，逃跑，超过轮询上限，被停止
  enum class Outcome { RESOLVED, FLED, TURN_LIMIT, INTERRUPTED };
  const std::vector<std::string> OUTCOMES = {"resolved", "fled", "turn_limit", "interrupted"};

  /**
   * @brief 选择本回合使用的技能：主技能有 PP 用主技能，否则在启用备用技能且其有 PP 时用备用技能
   * @return std::optional<int> 技能编号，std::nullopt 表示应当逃跑
   */
  std::optional<int> select_ability(const Settings& settings);

  class BattlePolicy
  {
  public:
    BattlePolicy(Detector& detector, ScriptRunner& runner, const ScriptTable& scripts,
                 BotConfig& config, tools::Clock& clock, const std::atomic<bool>& running);

    /**
     * @brief 处理一场遭遇战，直到战斗结束、逃跑或被停止。
     *        战斗菜单出现时出招或逃跑；出招后等待 attack_wait_time 再检查是否仍在战斗
     * @return Outcome
     */
    Outcome handle_battle();

    // 执行出招脚本，执行完整后扣除一次 PP
    bool fight(int ability);

    bool flee();

  private:
    Detector& detector_;
    ScriptRunner& runner_;
    const ScriptTable& scripts_;
    BotConfig& config_;
    tools::Clock& clock_;
    const std::atomic<bool>& running_;
  };

} // namespace auto_encounter
