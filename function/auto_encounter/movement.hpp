#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "bot_config.hpp"
#include "ecu/keyboard.hpp"
#include "tools/clock.hpp"

namespace auto_encounter
{
  enum class Direction { UP, DOWN, LEFT, RIGHT };
  const std::vector<std::string> DIRECTIONS = {"up", "down", "left", "right"};

  ecu::Key key_of(Direction direction);

  // 轴向的起始端：水平为左，竖直为上
  Direction start_pole(Axis axis);

  /**
   * @brief 方向键按住时长。已朝向目标方向时不需要转身
   * @param[in] direction     目标方向
   * @param[in] spaces        移动格数
   * @param[in] facing        当前朝向
   * @param[in] time_per_space 每格耗时
   * @param[in] time_to_turn  转身耗时
   * @return double           单位 s
   */
  double movement_cost(Direction direction, int spaces, Direction facing, double time_per_space,
                       double time_to_turn);

  /**
   * @brief 在两格之间来回走动以触发遇敌。只在自动化线程中使用。
   *        running 变为 false 后不再按下新的方向键，正在按住的键会立即松开
   */
  class Movement
  {
  public:
    Movement(ecu::KeyboardBase& keyboard, tools::Clock& clock, const std::atomic<bool>& running,
             Axis axis = Axis::HORIZONTAL);

    /**
     * @brief 按住方向键走 spaces 格，松开后等待角色停稳，并更新朝向
     * @return double           方向键应按住的时长
     */
    double move(Direction direction, int spaces, const Settings& settings);

    /**
     * @brief 一次循环：先走到轴的起始端，再走回另一端，每端停留片刻
     * @return true             完整走完一个来回
     * @return false            中途被停止
     */
    bool cycle(const Settings& settings);

    // 切换轴向并把朝向重置为新轴的起始端
    void set_axis(Axis axis);

    Direction facing() const { return facing_; }
    Axis axis() const { return axis_; }

  private:
    ecu::KeyboardBase& keyboard_;
    tools::Clock& clock_;
    const std::atomic<bool>& running_;
    Axis axis_;
    Direction facing_;

    inline static const double settle_delay{0.1}; // 松开方向键后
    inline static const double pole_dwell{0.2};   // 在每一端停留
  };

} // namespace auto_encounter
