#include "movement.hpp"

#include "tools/logger.hpp"

namespace auto_encounter
{
  ecu::Key key_of(Direction direction)
  {
    switch (direction) {
      case Direction::UP:
        return ecu::up;
      case Direction::DOWN:
        return ecu::down;
      case Direction::LEFT:
        return ecu::left;
      case Direction::RIGHT:
        return ecu::right;
    }
    return ecu::up;
  }

  Direction start_pole(Axis axis)
  {
    switch (axis) {
      case Axis::HORIZONTAL:
        return Direction::LEFT;
      case Axis::VERTICAL:
        return Direction::UP;
    }
    return Direction::LEFT;
  }

  double movement_cost(Direction direction, int spaces, Direction facing, double time_per_space,
                       double time_to_turn)
  {
    double turn = direction == facing ? 0.0 : time_to_turn;
    return turn + time_per_space * spaces;
  }

  Movement::Movement(ecu::KeyboardBase& keyboard, tools::Clock& clock,
                     const std::atomic<bool>& running, Axis axis)
      : keyboard_(keyboard)
      , clock_(clock)
      , running_(running)
      , axis_(axis)
      , facing_(start_pole(axis))
  {
  }

  double Movement::move(Direction direction, int spaces, const Settings& settings)
  {
    double duration =
        movement_cost(direction, spaces, facing_, settings.time_per_space, settings.time_to_turn);
    facing_ = direction;

    tools::logger()->debug("[Movement] {} {} 格, 按住 {:.2f}s",
                           DIRECTIONS[static_cast<int>(direction)], spaces, duration);

    // 按住期间被停止也要松开方向键
    auto key = key_of(direction);
    keyboard_.key_down(key);
    bool held = tools::sleep_while(clock_, duration, running_);
    keyboard_.key_up(key);

    if (held) {
      tools::sleep_while(clock_, settle_delay, running_);
    }
    return duration;
  }

  bool Movement::cycle(const Settings& settings)
  {
    if (settings.pattern != axis_) {
      set_axis(settings.pattern);
    }

    auto first = start_pole(axis_);
    auto second = first == Direction::LEFT ? Direction::RIGHT : Direction::DOWN;
    for (auto direction : {first, second}) {
      if (!running_.load()) {
        return false;
      }
      move(direction, settings.spaces, settings);
      if (!tools::sleep_while(clock_, pole_dwell, running_)) {
        return false;
      }
    }
    return true;
  }

  void Movement::set_axis(Axis axis)
  {
    axis_ = axis;
    facing_ = start_pole(axis);
    tools::logger()->info("[Movement] 移动轴向切换为 {}", AXES[static_cast<int>(axis)]);
  }

} // namespace auto_encounter
