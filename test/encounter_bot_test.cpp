#include <gtest/gtest.h>

#include <algorithm>

#include "fakes.hpp"
#include "function/auto_encounter/encounter_bot.hpp"

using namespace auto_encounter;

namespace
{
  Settings quick_settings()
  {
    Settings settings;
    settings.startup_delay = 0.0;
    return settings;
  }

  Settings depleted(bool use_teleport)
  {
    auto settings = quick_settings();
    for (int i = 0; i < ABILITY_NUM; ++i) {
      settings.abilities[i] = Ability{10 + i, 0};
    }
    settings.use_backup = false;
    settings.use_teleport = use_teleport;
    return settings;
  }

  // 记录状态变化序列
  struct History {
    std::mutex mutex;
    std::vector<State> states;

    void attach(EncounterBot& bot)
    {
      bot.on_state_change([this](State state) {
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back(state);
      });
    }

    std::vector<State> get()
    {
      std::lock_guard<std::mutex> lock(mutex);
      return states;
    }
  };

  std::size_t count(const std::vector<ecu::Key>& keys, ecu::Key key)
  {
    return static_cast<std::size_t>(std::count(keys.begin(), keys.end(), key));
  }
} // namespace

TEST(EncounterBot, StartRequiresHpIndicator)
{
  fakes::ScriptedDetector detector([](const std::string&) { return false; }, {BATTLE_MENU});
  fakes::RecordingKeyboard keyboard;
  tools::VirtualClock clock;
  EncounterBot bot(detector, keyboard, clock, quick_settings());

  EXPECT_FALSE(bot.start());
  EXPECT_FALSE(bot.run());
  EXPECT_FALSE(bot.running());
  EXPECT_EQ(bot.state(), State::STOPPED);
  EXPECT_TRUE(keyboard.events().empty());
}

TEST(EncounterBot, FleesWithoutEscalationAndReturnsToMoving)
{
  EncounterBot* bot = nullptr;
  int battle_polls = 0;
  fakes::ScriptedDetector detector([&](const std::string& name) {
    if (name == BATTLE_MENU) return true;
    ++battle_polls;
    if (battle_polls <= 2) return true;
    if (battle_polls == 4) bot->stop();
    return false;
  });
  fakes::RecordingKeyboard keyboard;
  tools::VirtualClock clock;
  EncounterBot encounter_bot(detector, keyboard, clock, depleted(false));
  bot = &encounter_bot;
  History history;
  history.attach(encounter_bot);

  ASSERT_TRUE(encounter_bot.run());

  std::vector<State> expected = {State::MOVING, State::IN_BATTLE, State::FLEEING, State::MOVING,
                                 State::STOPPED};
  EXPECT_EQ(history.get(), expected);

  auto stats = encounter_bot.stats();
  EXPECT_EQ(stats.battles, 1u);
  EXPECT_EQ(stats.flees, 1u);
  EXPECT_EQ(stats.movements, 1u);
  EXPECT_EQ(encounter_bot.state(), State::STOPPED);

  // 逃跑后没有传送
  EXPECT_EQ(count(keyboard.presses(), ecu::teleport), 0u);
  EXPECT_EQ(encounter_bot.config().snapshot().ability(1).remaining_uses, 0);
}

TEST(EncounterBot, AttacksWhileAnyAbilityHasPp)
{
  EncounterBot* bot = nullptr;
  int battle_polls = 0;
  fakes::ScriptedDetector detector([&](const std::string& name) {
    if (name == BATTLE_MENU) return true;
    ++battle_polls;
    if (battle_polls <= 2) return true;
    bot->stop();
    return false;
  });
  fakes::RecordingKeyboard keyboard;
  tools::VirtualClock clock;
  // 主技能耗尽，未启用备用技能，但 3 号技能还有 PP
  auto settings = depleted(false);
  settings.abilities[2].remaining_uses = 5;
  EncounterBot encounter_bot(detector, keyboard, clock, settings);
  bot = &encounter_bot;
  History history;
  history.attach(encounter_bot);

  ASSERT_TRUE(encounter_bot.run());

  std::vector<State> expected = {State::MOVING,  State::IN_BATTLE, State::ATTACKING,
                                 State::FLEEING, State::MOVING,    State::STOPPED};
  EXPECT_EQ(history.get(), expected);
  EXPECT_EQ(encounter_bot.stats().flees, 1u);
}

TEST(EncounterBot, ResolvedBattleConsumesPpAndResumesMoving)
{
  EncounterBot* bot = nullptr;
  int battle_polls = 0;
  fakes::ScriptedDetector detector([&](const std::string& name) {
    if (name == BATTLE_MENU) return true;
    ++battle_polls;
    if (battle_polls <= 2) return true;
    if (battle_polls == 5) bot->stop();
    return false;
  });
  fakes::RecordingKeyboard keyboard;
  tools::VirtualClock clock;
  EncounterBot encounter_bot(detector, keyboard, clock, quick_settings());
  bot = &encounter_bot;
  History history;
  history.attach(encounter_bot);

  ASSERT_TRUE(encounter_bot.run());

  std::vector<State> expected = {State::MOVING, State::IN_BATTLE, State::ATTACKING, State::MOVING,
                                 State::STOPPED};
  EXPECT_EQ(history.get(), expected);
  EXPECT_EQ(encounter_bot.config().snapshot().ability(1).remaining_uses, 19);
  EXPECT_EQ(encounter_bot.stats().battles, 1u);
  EXPECT_EQ(encounter_bot.stats().flees, 0u);
  EXPECT_EQ(encounter_bot.stats().movements, 1u);
}

TEST(EncounterBot, EscalationTeleportsRestoresAndStops)
{
  int battle_polls = 0;
  fakes::ScriptedDetector detector([&](const std::string& name) {
    if (name == BATTLE_MENU) return true;
    // 进入战斗与回合检查为 true，传送前的检查为 false
    return ++battle_polls <= 2;
  });
  fakes::RecordingKeyboard keyboard;
  tools::VirtualClock clock;
  EncounterBot bot(detector, keyboard, clock, depleted(true));
  History history;
  history.attach(bot);

  ASSERT_TRUE(bot.run());

  std::vector<State> expected = {State::MOVING,
                                 State::IN_BATTLE,
                                 State::FLEEING,
                                 State::RECOVERING_TRAVEL,
                                 State::RECOVERING_RESTORE,
                                 State::STOPPED};
  EXPECT_EQ(history.get(), expected);
  EXPECT_EQ(battle_polls, 3);
  EXPECT_FALSE(bot.running());

  auto settings = bot.config().snapshot();
  for (int id = 1; id <= ABILITY_NUM; ++id) {
    EXPECT_EQ(settings.ability(id).remaining_uses, settings.ability(id).max_uses);
  }

  // 逃跑 4 键，传送 1 键，与 NPC 对话 5 次确认
  auto presses = keyboard.presses();
  EXPECT_EQ(count(presses, ecu::teleport), 1u);
  EXPECT_EQ(count(presses, ecu::confirm), 1u + 5u);
  EXPECT_EQ(bot.stats().movements, 0u);
}

TEST(EncounterBot, RecoverySkippedWhileStillInBattle)
{
  EncounterBot* bot = nullptr;
  int battle_polls = 0;
  fakes::ScriptedDetector detector([&](const std::string& name) {
    if (name == BATTLE_MENU) return true;
    ++battle_polls;
    // 1: 进入战斗，2: 回合检查，3: 传送前仍在战斗
    if (battle_polls <= 3) return true;
    bot->stop();
    return false;
  });
  fakes::RecordingKeyboard keyboard;
  tools::VirtualClock clock;
  EncounterBot encounter_bot(detector, keyboard, clock, depleted(true));
  bot = &encounter_bot;
  History history;
  history.attach(encounter_bot);

  ASSERT_TRUE(encounter_bot.run());

  std::vector<State> expected = {State::MOVING, State::IN_BATTLE, State::FLEEING, State::MOVING,
                                 State::STOPPED};
  EXPECT_EQ(history.get(), expected);
  EXPECT_EQ(count(keyboard.presses(), ecu::teleport), 0u);
  EXPECT_EQ(encounter_bot.config().snapshot().ability(1).remaining_uses, 0);
}

TEST(EncounterBot, StartAndStopFromAnotherThread)
{
  std::atomic<int> battle_polls{0};
  fakes::ScriptedDetector detector([&](const std::string&) {
    ++battle_polls;
    return false;
  });
  fakes::CountingKeyboard keyboard;
  tools::VirtualClock clock;
  EncounterBot bot(detector, keyboard, clock, quick_settings());

  ASSERT_TRUE(bot.start());
  EXPECT_TRUE(bot.start());
  EXPECT_TRUE(bot.running());
  ASSERT_TRUE(fakes::wait_until([&] { return bot.stats().movements >= 3; }));

  bot.stop();
  bot.stop();
  EXPECT_FALSE(bot.running());
  EXPECT_EQ(bot.state(), State::STOPPED);

  // 停止后不再轮询
  int polls = battle_polls;
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(battle_polls, polls);

  // 可以再次启动
  ASSERT_TRUE(bot.start());
  EXPECT_EQ(bot.state(), State::MOVING);
  bot.stop();
}

TEST(EncounterBot, ConfigWritesDuringBattleAreNeverTorn)
{
  // 一直在战斗中，每回合都出 2 号技能
  fakes::ScriptedDetector detector([](const std::string&) { return true; });
  fakes::CountingKeyboard keyboard;
  tools::VirtualClock clock;
  auto settings = quick_settings();
  settings.selected_ability = 2;
  settings.abilities[1] = Ability{1000000, 1000000};
  EncounterBot bot(detector, keyboard, clock, settings);

  ASSERT_TRUE(bot.start());
  ASSERT_TRUE(fakes::wait_until([&] { return bot.state() == State::ATTACKING; }));

  int last = 0;
  for (int i = 0; i < 1000; ++i) {
    last = 500000 + i % 2 * 500000;
    ASSERT_TRUE(bot.config().set_max_pp(2, last));
    auto ability = bot.config().snapshot().ability(2);
    ASSERT_TRUE(ability.max_uses == 500000 || ability.max_uses == 1000000);
    ASSERT_GE(ability.remaining_uses, 0);
    ASSERT_LE(ability.remaining_uses, ability.max_uses);
  }
  ASSERT_TRUE(fakes::wait_until([&] { return bot.config().snapshot().ability(2).remaining_uses < last; }));

  bot.stop();
  auto ability = bot.config().snapshot().ability(2);
  EXPECT_EQ(ability.max_uses, last);
  EXPECT_LT(ability.remaining_uses, last);
  EXPECT_GT(keyboard.count.load(), 0);
}

namespace
{
  class StopBotOnKeyDown : public fakes::RecordingKeyboard
  {
  public:
    void key_down(ecu::Key key) override
    {
      fakes::RecordingKeyboard::key_down(key);
      bot->stop();
    }

    EncounterBot* bot = nullptr;
  };
} // namespace

TEST(EncounterBot, StopDuringMovementIsNotCountedAsCycle)
{
  fakes::ScriptedDetector detector([](const std::string&) { return false; });
  StopBotOnKeyDown keyboard;
  tools::VirtualClock clock;
  auto settings = quick_settings();
  settings.time_per_space = 1000.0;
  EncounterBot bot(detector, keyboard, clock, settings);
  keyboard.bot = &bot;

  ASSERT_TRUE(bot.run());

  EXPECT_EQ(bot.state(), State::STOPPED);
  EXPECT_EQ(bot.stats().movements, 0u);
  auto events = keyboard.events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0], std::make_pair(ecu::left, fakes::Event::DOWN));
  EXPECT_EQ(events[1], std::make_pair(ecu::left, fakes::Event::UP));
  EXPECT_LT(clock.elapsed(), 1.0);
}

TEST(EncounterBot, StopFromStateCallbackOnWorkerThread)
{
  fakes::ScriptedDetector detector([](const std::string&) { return true; });
  fakes::CountingKeyboard keyboard;
  tools::VirtualClock clock;
  EncounterBot bot(detector, keyboard, clock, quick_settings());
  std::atomic<bool> stopped_in_worker{false};
  auto main_thread = std::this_thread::get_id();
  bot.on_state_change([&](State state) {
    if (state == State::IN_BATTLE && std::this_thread::get_id() != main_thread) {
      bot.stop();
      stopped_in_worker = true;
    }
  });

  ASSERT_TRUE(bot.start());
  ASSERT_TRUE(fakes::wait_until([&] { return stopped_in_worker.load(); }));
  bot.stop();

  EXPECT_FALSE(bot.running());
  EXPECT_EQ(bot.state(), State::STOPPED);
  EXPECT_EQ(bot.stats().battles, 1u);
  // 停止后没有出招
  EXPECT_EQ(keyboard.count.load(), 0);
}
