#include "encounter_bot.hpp"

#include "tools/logger.hpp"

namespace auto_encounter
{
  EncounterBot::EncounterBot(Detector& detector, ecu::KeyboardBase& keyboard, tools::Clock& clock,
                             const Settings& settings, const ScriptTable& scripts)
      : detector_(detector)
      , config_(settings)
      , scripts_(scripts)
      , clock_(clock)
      , runner_(keyboard, clock, running_)
      , movement_(keyboard, clock, running_, settings.pattern)
      , battle_(detector, runner_, scripts_, config_, clock, running_)
  {
  }

  EncounterBot::~EncounterBot() { stop(); }

  bool EncounterBot::start()
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
      return true;
    }
    // 上一次运行可能已经在回复后自行停止
    if (worker_.joinable()) {
      worker_.join();
    }
    if (!begin()) {
      return false;
    }
    worker_ = std::thread(&EncounterBot::loop, this);
    return true;
  }

  bool EncounterBot::run()
  {
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      if (running_.load() || !begin()) {
        return false;
      }
    }
    loop();
    return true;
  }

  void EncounterBot::stop()
  {
    halt();

    // 在自动化线程中调用（例如状态回调）时不能等待自己退出
    if (loop_thread_.load() == std::this_thread::get_id()) {
      return;
    }
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  State EncounterBot::state() const
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
  }

  Stats EncounterBot::stats() const { return Stats{movements_.load(), battles_.load(), flees_.load()}; }

  void EncounterBot::on_state_change(std::function<void(State)> callback)
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    callback_ = std::move(callback);
  }

  bool EncounterBot::begin()
  {
    if (!detector_.has_template(HP_INDICATOR)) {
      tools::logger()->error("[EncounterBot] 请先加载 {} 参考图, 拒绝启动", HP_INDICATOR);
      return false;
    }
    running_ = true;
    set_state(State::MOVING);
    return true;
  }

  void EncounterBot::loop()
  {
    loop_thread_ = std::this_thread::get_id();
    tools::logger()->info("[EncounterBot] 自动化线程启动");

    if (tools::sleep_while(clock_, config_.snapshot().startup_delay, running_)) {
      while (running_.load()) {
        auto settings = config_.snapshot();

        if (detector_.is_in_battle(settings.detection_threshold)) {
          handle_encounter(settings);
        } else if (state() == State::MOVING) {
          if (!movement_.cycle(settings)) {
            break;
          }
          ++movements_;
          if (!tools::sleep_while(clock_, settings.movement_delay, running_)) {
            break;
          }
        }

        if (!tools::sleep_while(clock_, idle_poll_delay, running_)) {
          break;
        }
      }
    }

    halt();
    loop_thread_ = std::thread::id();
    tools::logger()->info("[EncounterBot] 自动化线程退出");
  }

  void EncounterBot::handle_encounter(const Settings& settings)
  {
    set_state(State::IN_BATTLE);
    ++battles_;
    tools::logger()->info("[EncounterBot] 遭遇战斗, 第 {} 场", battles_.load());

    // 四个技能都没有 PP 时直接逃跑
    set_state(settings.has_any_pp() ? State::ATTACKING : State::FLEEING);

    auto outcome = battle_.handle_battle();
    tools::logger()->info("[EncounterBot] 战斗结果: {}", OUTCOMES[static_cast<int>(outcome)]);
    switch (outcome) {
      case Outcome::RESOLVED:
      case Outcome::TURN_LIMIT:
        set_state(State::MOVING);
        break;

      case Outcome::FLED:
        set_state(State::FLEEING);
        ++flees_;
        tools::logger()->info("[EncounterBot] 已逃跑, 累计 {} 次", flees_.load());
        if (config_.snapshot().use_teleport && recover()) {
          break;
        }
        set_state(State::MOVING);
        break;

      case Outcome::INTERRUPTED:
        break;
    }
  }

  bool EncounterBot::recover()
  {
    if (!runner_.run(scripts_.flee_settle, "flee_settle")) {
      return false;
    }
    if (detector_.is_in_battle(config_.snapshot().detection_threshold)) {
      tools::logger()->info("[EncounterBot] 仍在战斗中, 本轮放弃传送");
      return false;
    }

    set_state(State::RECOVERING_TRAVEL);
    if (!runner_.run(scripts_.travel, "travel")) {
      return false;
    }

    set_state(State::RECOVERING_RESTORE);
    if (!runner_.run(scripts_.restore, "restore")) {
      return false;
    }
    config_.reset_pp();

    tools::logger()->info("[EncounterBot] 回复完成, PP 已重置, 自动停止");
    halt();
    return true;
  }

  bool EncounterBot::set_state(State state)
  {
    std::function<void(State)> callback;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      // 停止之后不再离开 STOPPED
      if (!running_.load() && state != State::STOPPED) {
        return false;
      }
      if (state_ == state) {
        return true;
      }
      state_ = state;
      callback = callback_;
    }

    tools::logger()->info("[EncounterBot] 状态 -> {}", STATES[static_cast<int>(state)]);
    if (callback) {
      callback(state);
    }
    return true;
  }

  void EncounterBot::halt()
  {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      running_ = false;
    }
    set_state(State::STOPPED);
  }

} // namespace auto_encounter
