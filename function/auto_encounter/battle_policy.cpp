#include "battle_policy.hpp"

#include "tools/logger.hpp"

namespace auto_encounter
{
  std::optional<int> select_ability(const Settings& settings)
  {
    if (settings.ability(settings.selected_ability).remaining_uses > 0) {
      return settings.selected_ability;
    }
    if (settings.use_backup && settings.ability(settings.backup_ability).remaining_uses > 0) {
      return settings.backup_ability;
    }
    return std::nullopt;
  }

  BattlePolicy::BattlePolicy(Detector& detector, ScriptRunner& runner, const ScriptTable& scripts,
                             BotConfig& config, tools::Clock& clock,
                             const std::atomic<bool>& running)
      : detector_(detector)
      , runner_(runner)
      , scripts_(scripts)
      , config_(config)
      , clock_(clock)
      , running_(running)
  {
  }

  Outcome BattlePolicy::handle_battle()
  {
    int turns = 0;
    while (running_.load()) {
      auto settings = config_.snapshot();
      if (!detector_.is_in_battle(settings.detection_threshold)) {
        tools::logger()->info("[BattlePolicy] 战斗结束");
        return Outcome::RESOLVED;
      }

      if (settings.max_battle_turns > 0 && turns >= settings.max_battle_turns) {
        tools::logger()->warn("[BattlePolicy] 轮询 {} 次后仍在战斗中, 放弃本场战斗", turns);
        return Outcome::TURN_LIMIT;
      }
      ++turns;

      if (!detector_.is_battle_menu_visible(settings.detection_threshold)) {
        if (!tools::sleep_while(clock_, settings.menu_poll_delay, running_)) {
          break;
        }
        continue;
      }

      auto ability = select_ability(settings);
      if (!ability) {
        tools::logger()->info("[BattlePolicy] 可用技能 PP 耗尽, 逃跑");
        return flee() ? Outcome::FLED : Outcome::INTERRUPTED;
      }

      if (!fight(*ability)) {
        break;
      }
      if (!tools::sleep_while(clock_, settings.attack_wait_time, running_)) {
        break;
      }
    }
    return Outcome::INTERRUPTED;
  }

  bool BattlePolicy::fight(int ability)
  {
    if (!runner_.run(scripts_.fight(ability), "fight_" + std::to_string(ability))) {
      return false;
    }
    if (!config_.consume_pp(ability)) {
      // 出招期间控制端可能修改过 PP
      tools::logger()->warn("[BattlePolicy] 技能 {} 的 PP 已为 0, 未扣除", ability);
    }

    auto remaining = config_.snapshot().ability(ability);
    tools::logger()->info("[BattlePolicy] 使用技能 {}, 剩余 PP {}/{}", ability,
                          remaining.remaining_uses, remaining.max_uses);
    return true;
  }

  bool BattlePolicy::flee() { return runner_.run(scripts_.flee, "flee"); }

} // namespace auto_encounter
