#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "ecu/keyboard.hpp"
#include "ecu/screen.hpp"
#include "function/auto_encounter/action_script.hpp"
#include "function/auto_encounter/control_console.hpp"
#include "function/auto_encounter/encounter_bot.hpp"
#include "function/auto_encounter/template_detector.hpp"
#include "tools/clock.hpp"
#include "tools/exiter.hpp"
#include "tools/logger.hpp"
#include "tools/thread_safe_queue.hpp"
#include "tools/yaml.hpp"

#include <opencv2/core/utility.hpp>

const std::string keys =
    "{help h usage ? |     | 输出命令行参数说明 }"
    "{@config-path c | ../configs/auto_encounter.yaml | yaml配置文件的路径}"
    "{dry-run d      |     | 只打印按键, 不创建虚拟键盘}";

int main(int argc, char* argv[])
{
  cv::CommandLineParser cli(argc, argv, keys);
  if (cli.has("help")) {
    cli.printMessage();
    return 0;
  }
  auto config_path = cli.get<std::string>(0);

  tools::Exiter exiter;

  auto yaml = tools::load(config_path);
  auto template_dir = tools::read<std::string>(yaml, "template_dir");
  auto settings = auto_encounter::load_settings(config_path);
  auto scripts = auto_encounter::load_scripts(yaml, auto_encounter::default_scripts());

  ecu::Screen screen(config_path);
  std::unique_ptr<ecu::KeyboardBase> keyboard;
  if (cli.has("dry-run")) {
    keyboard = std::make_unique<ecu::LogKeyboard>();
  } else {
    keyboard = std::make_unique<ecu::UinputKeyboard>(config_path);
  }

  auto_encounter::TemplateDetector detector(screen);
  detector.load_dir(template_dir);

  tools::SystemClock clock;
  auto_encounter::EncounterBot bot(detector, *keyboard, clock, settings, scripts);
  auto_encounter::ControlConsole console(bot, detector, template_dir);

  std::cout << auto_encounter::ControlConsole::help() << std::endl;

  // std::getline 会阻塞，单独开线程读取命令
  auto commands = std::make_shared<tools::ThreadSafeQueue<std::string>>(64);
  std::thread reader([commands] {
    std::string line;
    while (std::getline(std::cin, line)) {
      commands->push(line);
    }
    commands->push("quit");
  });
  reader.detach();

  // 运行中每秒刷新一次状态
  const auto refresh = std::chrono::seconds(1);
  auto last_display = std::chrono::steady_clock::now();

  while (!exiter.exit() && !console.quit_requested()) {
    std::string line;
    if (commands->pop_for(line, std::chrono::milliseconds(100))) {
      auto reply = console.handle(line);
      if (!reply.empty()) {
        std::cout << reply << std::endl;
      }
    }

    auto now = std::chrono::steady_clock::now();
    if (bot.running() && now - last_display >= refresh) {
      tools::logger()->info(console.status());
      last_display = now;
    }
  }

  bot.stop();
  tools::logger()->info(console.status());
  return 0;
}
