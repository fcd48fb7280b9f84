#pragma once

#include <array>
#include <mutex>
#include <string>
#include <vector>

namespace auto_encounter
{
  // 技能槽数目，技能编号为 1 ~ 4
  constexpr int ABILITY_NUM = 4;
  // 单次移动的格数范围
  constexpr int MIN_SPACES = 1;
  constexpr int MAX_SPACES = 4;

  // 来回移动的轴向：水平为左右，竖直为上下
  enum class Axis { HORIZONTAL, VERTICAL };
  const std::vector<std::string> AXES = {"horizontal", "vertical"};

  bool parse_axis(const std::string& name, Axis& axis);

  inline bool is_valid_ability(int id) { return id >= 1 && id <= ABILITY_NUM; }

  /**
   * @brief 单个技能的使用次数 (PP)，满足 0 <= remaining_uses <= max_uses
   */
  struct Ability {
    int max_uses;
    int remaining_uses;
  };

  /**
   * @brief 全部运行参数，时长单位均为 s
   */
  struct Settings {
    // 移动
    double time_per_space{0.20}; // 已朝向目标方向时移动一格的时间
    double time_to_turn{0.12};   // 转向所需时间
    double movement_delay{0.5};  // 两次移动循环之间的间隔
    Axis pattern{Axis::HORIZONTAL};
    int spaces{1};

    // 战斗
    double detection_threshold{0.8};
    double attack_wait_time{11.0}; // 出招后等待动画与对手回合
    double menu_poll_delay{0.5};   // 战斗菜单未出现时的轮询间隔
    double startup_delay{3.0};     // 启动后留给用户切换到游戏窗口的时间
    int selected_ability{1};
    int backup_ability{2};
    bool use_backup{true};
    bool use_teleport{false}; // PP 耗尽逃跑后是否传送回复
    int max_battle_turns{0};  // 单场战斗最多轮询次数，0 表示不限

    std::array<Ability, ABILITY_NUM> abilities{{{20, 20}, {20, 20}, {20, 20}, {20, 20}}};

    // id 为 1 ~ 4，越界抛出 std::out_of_range
    const Ability& ability(int id) const;
    bool has_any_pp() const;
  };

  /**
   * @brief 控制端与自动化线程共享的配置。所有读写都在同一把锁下完成，
   *        自动化线程通过 snapshot() 取得一致的副本。
   *        setter 校验失败时返回 false 并保留原值。
   */
  class BotConfig
  {
  public:
    explicit BotConfig(const Settings& settings = Settings());

    Settings snapshot() const;

    bool set_time_per_space(double seconds);
    bool set_time_to_turn(double seconds);
    bool set_movement_delay(double seconds);
    bool set_attack_wait_time(double seconds);
    bool set_menu_poll_delay(double seconds);
    bool set_startup_delay(double seconds);
    bool set_detection_threshold(double threshold);
    bool set_selected_ability(int id);
    bool set_backup_ability(int id);
    void set_use_backup(bool use_backup);
    void set_use_teleport(bool use_teleport);
    void set_pattern(Axis pattern);
    bool set_spaces(int spaces);
    bool set_max_battle_turns(int turns);

    // 修改最大 PP 并立即把当前 PP 重置为新的最大值
    bool set_max_pp(int id, int max_uses);

    // 出招成功后扣除一次 PP，PP 已为 0 或编号非法时返回 false
    bool consume_pp(int id);

    void reset_pp();

  private:
    mutable std::mutex mutex_;
    Settings settings_;
  };

  /**
   * @brief 从 yaml 配置文件读取运行参数，非法值抛出 std::runtime_error
   */
  Settings load_settings(const std::string& config_path);

} // namespace auto_encounter
