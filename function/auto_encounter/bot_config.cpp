#include "bot_config.hpp"

#include <cmath>
#include <stdexcept>

#include "tools/logger.hpp"
#include "tools/math_tool.hpp"
#include "tools/yaml.hpp"

namespace auto_encounter
{
  namespace
  {
    bool check_seconds(const char* name, double seconds)
    {
      if (!tools::is_positive(seconds)) {
        tools::logger()->warn("[BotConfig] {} 必须为正数, 收到 {}", name, seconds);
        return false;
      }
      return true;
    }

    bool check_ability(const char* name, int id)
    {
      if (!is_valid_ability(id)) {
        tools::logger()->warn("[BotConfig] {} 必须在 1 ~ {} 之间, 收到 {}", name, ABILITY_NUM, id);
        return false;
      }
      return true;
    }

    void require(bool ok, const std::string& key)
    {
      if (!ok) {
        throw std::runtime_error("[BotConfig] 配置项 '" + key + "' 的值非法");
      }
    }
  } // namespace

  bool parse_axis(const std::string& name, Axis& axis)
  {
    if (name == AXES[0]) {
      axis = Axis::HORIZONTAL;
      return true;
    }
    if (name == AXES[1]) {
      axis = Axis::VERTICAL;
      return true;
    }
    return false;
  }

  const Ability& Settings::ability(int id) const
  {
    if (!is_valid_ability(id)) {
      throw std::out_of_range("ability id " + std::to_string(id) + " out of range");
    }
    return abilities[id - 1];
  }

  bool Settings::has_any_pp() const
  {
    for (const auto& ability : abilities) {
      if (ability.remaining_uses > 0) {
        return true;
      }
    }
    return false;
  }

  BotConfig::BotConfig(const Settings& settings)
      : settings_(settings)
  {
  }

  Settings BotConfig::snapshot() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
  }

  bool BotConfig::set_time_per_space(double seconds)
  {
    if (!check_seconds("time_per_space", seconds)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.time_per_space = seconds;
    return true;
  }

  bool BotConfig::set_time_to_turn(double seconds)
  {
    if (!check_seconds("time_to_turn", seconds)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.time_to_turn = seconds;
    return true;
  }

  bool BotConfig::set_movement_delay(double seconds)
  {
    if (!check_seconds("movement_delay", seconds)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.movement_delay = seconds;
    return true;
  }

  bool BotConfig::set_attack_wait_time(double seconds)
  {
    if (!check_seconds("attack_wait_time", seconds)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.attack_wait_time = seconds;
    return true;
  }

  bool BotConfig::set_menu_poll_delay(double seconds)
  {
    if (!check_seconds("menu_poll_delay", seconds)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.menu_poll_delay = seconds;
    return true;
  }

  bool BotConfig::set_startup_delay(double seconds)
  {
    // 启动延时允许为 0
    if (!(seconds >= 0.0) || !std::isfinite(seconds)) {
      tools::logger()->warn("[BotConfig] startup_delay 不能为负数, 收到 {}", seconds);
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.startup_delay = seconds;
    return true;
  }

  bool BotConfig::set_detection_threshold(double threshold)
  {
    if (!tools::is_valid_threshold(threshold)) {
      tools::logger()->warn("[BotConfig] detection_threshold 必须在 [0, 1] 内, 收到 {}", threshold);
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.detection_threshold = threshold;
    return true;
  }

  bool BotConfig::set_selected_ability(int id)
  {
    if (!check_ability("selected_ability", id)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.selected_ability = id;
    return true;
  }

  bool BotConfig::set_backup_ability(int id)
  {
    if (!check_ability("backup_ability", id)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.backup_ability = id;
    return true;
  }

  void BotConfig::set_use_backup(bool use_backup)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.use_backup = use_backup;
  }

  void BotConfig::set_use_teleport(bool use_teleport)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.use_teleport = use_teleport;
  }

  void BotConfig::set_pattern(Axis pattern)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.pattern = pattern;
  }

  bool BotConfig::set_spaces(int spaces)
  {
    if (!tools::inRange(spaces, MIN_SPACES, MAX_SPACES)) {
      tools::logger()->warn("[BotConfig] spaces 必须在 {} ~ {} 之间, 收到 {}", MIN_SPACES, MAX_SPACES,
                            spaces);
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.spaces = spaces;
    return true;
  }

  bool BotConfig::set_max_battle_turns(int turns)
  {
    if (turns < 0) {
      tools::logger()->warn("[BotConfig] max_battle_turns 不能为负数, 收到 {}", turns);
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.max_battle_turns = turns;
    return true;
  }

  bool BotConfig::set_max_pp(int id, int max_uses)
  {
    if (!check_ability("ability", id)) return false;
    if (max_uses <= 0) {
      tools::logger()->warn("[BotConfig] 技能 {} 的最大 PP 必须为正整数, 收到 {}", id, max_uses);
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.abilities[id - 1] = Ability{max_uses, max_uses};
    return true;
  }

  bool BotConfig::consume_pp(int id)
  {
    if (!is_valid_ability(id)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    auto& ability = settings_.abilities[id - 1];
    if (ability.remaining_uses <= 0) {
      return false;
    }
    --ability.remaining_uses;
    return true;
  }

  void BotConfig::reset_pp()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& ability : settings_.abilities) {
      ability.remaining_uses = ability.max_uses;
    }
  }

  Settings load_settings(const std::string& config_path)
  {
    auto yaml = tools::load(config_path);
    BotConfig config;

    require(config.set_time_per_space(tools::read<double>(yaml, "time_per_space")), "time_per_space");
    require(config.set_time_to_turn(tools::read<double>(yaml, "time_to_turn")), "time_to_turn");
    require(config.set_movement_delay(tools::read<double>(yaml, "movement_delay")), "movement_delay");
    require(config.set_attack_wait_time(tools::read<double>(yaml, "attack_wait_time")),
            "attack_wait_time");
    require(config.set_menu_poll_delay(tools::read_or<double>(yaml, "menu_poll_delay", 0.5)),
            "menu_poll_delay");
    require(config.set_startup_delay(tools::read<double>(yaml, "startup_delay")), "startup_delay");
    require(config.set_detection_threshold(tools::read<double>(yaml, "detection_threshold")),
            "detection_threshold");
    require(config.set_selected_ability(tools::read<int>(yaml, "selected_ability")),
            "selected_ability");
    require(config.set_backup_ability(tools::read<int>(yaml, "backup_ability")), "backup_ability");
    config.set_use_backup(tools::read<bool>(yaml, "use_backup"));
    config.set_use_teleport(tools::read<bool>(yaml, "use_teleport"));
    require(config.set_spaces(tools::read<int>(yaml, "spaces")), "spaces");
    require(config.set_max_battle_turns(tools::read_or<int>(yaml, "max_battle_turns", 0)),
            "max_battle_turns");

    Axis pattern = Axis::HORIZONTAL;
    require(parse_axis(tools::read<std::string>(yaml, "pattern"), pattern), "pattern");
    config.set_pattern(pattern);

    auto max_pp = tools::read<std::vector<int>>(yaml, "max_pp");
    require(max_pp.size() == ABILITY_NUM, "max_pp");
    for (int id = 1; id <= ABILITY_NUM; ++id) {
      require(config.set_max_pp(id, max_pp[id - 1]), "max_pp");
    }

    tools::logger()->info("[BotConfig] 已读取配置: {}", config_path);
    return config.snapshot();
  }

} // namespace auto_encounter
