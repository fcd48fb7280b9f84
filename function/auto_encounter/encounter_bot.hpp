#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "action_script.hpp"
#include "battle_policy.hpp"
#include "bot_config.hpp"
#include "ecu/keyboard.hpp"
#include "movement.hpp"
#include "template_detector.hpp"
#include "tools/clock.hpp"

namespace auto_encounter
{
  // 自动化流程的生命周期状态，同一时刻只有一个
  enum class State {
    STOPPED,
    MOVING,
    IN_BATTLE,
    ATTACKING,
    FLEEING,
    RECOVERING_TRAVEL,
    RECOVERING_RESTORE
  };
  const std::vector<std::string> STATES = {"stopped", "moving",  "in_battle",          "attacking",
                                           "fleeing", "recovering(travel)", "recovering(restore)"};

  // 统计量只增不减，进程重启才清零
  struct Stats {
    std::uint64_t movements;
    std::uint64_t battles;
    std::uint64_t flees;
  };

  /**
   * @brief 自动遇敌状态机。
   *        start() 在后台线程中循环：检测到战斗交给 BattlePolicy，否则移动一个来回；
   *        PP 耗尽逃跑且开启传送时，传送到回复点、回复后自行停止。
   *        控制端只通过 config() 修改参数，通过 state()/stats() 读取状态。
   */
  class EncounterBot
  {
  public:
    EncounterBot(Detector& detector, ecu::KeyboardBase& keyboard, tools::Clock& clock,
                 const Settings& settings = Settings(),
                 const ScriptTable& scripts = default_scripts());
    ~EncounterBot();

    EncounterBot(const EncounterBot&) = delete;
    EncounterBot& operator=(const EncounterBot&) = delete;

    /**
     * @brief 在后台线程中启动。未加载 hp_indicator 参考图时拒绝启动，状态不变
     * @return true             已启动或本来就在运行
     * @return false            拒绝启动
     */
    bool start();

    // 在调用线程中同步运行，直到被停止或回复后自行停止
    bool run();

    // 可重复调用；在自动化线程中调用时不会等待线程退出
    void stop();

    bool running() const { return running_.load(); }
    State state() const;
    Stats stats() const;

    BotConfig& config() { return config_; }

    // 状态变化回调，在发生变化的线程中调用。需在 start() 之前设置
    void on_state_change(std::function<void(State)> callback);

  private:
    Detector& detector_;
    BotConfig config_;
    ScriptTable scripts_;
    tools::Clock& clock_;

    std::atomic<bool> running_{false};
    ScriptRunner runner_;
    Movement movement_;
    BattlePolicy battle_;

    mutable std::mutex state_mutex_; // 保护 state_ 与 running_ 的联合修改
    State state_{State::STOPPED};
    std::function<void(State)> callback_;

    std::atomic<std::uint64_t> movements_{0};
    std::atomic<std::uint64_t> battles_{0};
    std::atomic<std::uint64_t> flees_{0};

    std::mutex lifecycle_mutex_; // 串行化 start/stop
    std::thread worker_;
    std::atomic<std::thread::id> loop_thread_{}; // 正在执行 loop() 的线程

    inline static const double idle_poll_delay{0.1};

    bool begin();
    void loop();
    void handle_encounter(const Settings& settings);
    bool recover();
    bool set_state(State state);
    void halt();
  };

} // namespace auto_encounter
