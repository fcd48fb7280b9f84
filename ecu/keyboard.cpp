#include "ecu/keyboard.hpp"

#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>
#include <stdexcept>
#include <thread>

#include "tools/logger.hpp"
#include "tools/yaml.hpp"

namespace ecu
{
  namespace
  {
    // 配置文件中可用的按键名到 linux 键码
    // clang-format off
    const std::map<std::string, int> KEY_CODES = {
        {"a", KEY_A}, {"b", KEY_B}, {"c", KEY_C}, {"d", KEY_D}, {"e", KEY_E}, {"f", KEY_F},
        {"g", KEY_G}, {"h", KEY_H}, {"i", KEY_I}, {"j", KEY_J}, {"k", KEY_K}, {"l", KEY_L},
        {"m", KEY_M}, {"n", KEY_N}, {"o", KEY_O}, {"p", KEY_P}, {"q", KEY_Q}, {"r", KEY_R},
        {"s", KEY_S}, {"t", KEY_T}, {"u", KEY_U}, {"v", KEY_V}, {"w", KEY_W}, {"x", KEY_X},
        {"y", KEY_Y}, {"z", KEY_Z},
        {"0", KEY_0}, {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4},
        {"5", KEY_5}, {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9},
        {"enter", KEY_ENTER}, {"space", KEY_SPACE}, {"backspace", KEY_BACKSPACE},
    };
    // clang-format on

    // 按下与松开之间的间隔
    constexpr auto PRESS_HOLD = std::chrono::milliseconds(10);

    int lookup_code(const std::string& name)
    {
      auto it = KEY_CODES.find(name);
      if (it == KEY_CODES.end()) {
        throw std::runtime_error("[Keyboard] 不支持的按键: " + name);
      }
      return it->second;
    }
  } // namespace

  bool parse_key(const std::string& name, Key& key)
  {
    for (std::size_t i = 0; i < KEYS.size(); ++i) {
      if (KEYS[i] == name) {
        key = static_cast<Key>(i);
        return true;
      }
    }
    return false;
  }

  UinputKeyboard::UinputKeyboard(const std::string& config_path)
      : fd_(-1)
      , confirm_code_(KEY_Z)
      , teleport_code_(KEY_9)
  {
    tools::logger()->info("[Keyboard] 初始化虚拟键盘 ...");
    read_yaml(config_path);

    fd_ = open(device_.c_str(), O_WRONLY | O_NONBLOCK);
    if (fd_ < 0) {
      throw std::runtime_error("[Keyboard] 无法打开设备: " + device_ + " (" + std::strerror(errno) +
                               ")");
    }

    if (ioctl(fd_, UI_SET_EVBIT, EV_KEY) < 0) {
      close(fd_);
      throw std::runtime_error("[Keyboard] 无法启用按键事件");
    }
    for (auto key : {up, down, left, right, confirm, teleport}) {
      if (ioctl(fd_, UI_SET_KEYBIT, code_of(key)) < 0) {
        close(fd_);
        throw std::runtime_error("[Keyboard] 无法注册按键: " + KEYS[key]);
      }
    }

    struct uinput_setup setup{};
    setup.id.bustype = BUS_USB;
    setup.id.vendor = 0x1d6b;
    setup.id.product = 0x0104;
    std::strncpy(setup.name, "auto-encounter-keyboard", UINPUT_MAX_NAME_SIZE - 1);

    if (ioctl(fd_, UI_DEV_SETUP, &setup) < 0 || ioctl(fd_, UI_DEV_CREATE) < 0) {
      close(fd_);
      throw std::runtime_error("[Keyboard] 无法创建虚拟键盘");
    }

    // 给桌面环境识别新设备的时间
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    tools::logger()->info("[Keyboard] 成功创建虚拟键盘: {}", device_);
  }

  UinputKeyboard::~UinputKeyboard()
  {
    if (fd_ >= 0) {
      ioctl(fd_, UI_DEV_DESTROY);
      close(fd_);
    }
  }

  void UinputKeyboard::press(Key key)
  {
    key_down(key);
    std::this_thread::sleep_for(PRESS_HOLD);
    key_up(key);
  }

  void UinputKeyboard::key_down(Key key)
  {
    emit(EV_KEY, code_of(key), 1);
    emit(EV_SYN, SYN_REPORT, 0);
  }

  void UinputKeyboard::key_up(Key key)
  {
    emit(EV_KEY, code_of(key), 0);
    emit(EV_SYN, SYN_REPORT, 0);
  }

  int UinputKeyboard::code_of(Key key) const
  {
    switch (key) {
      case up:
        return KEY_UP;
      case down:
        return KEY_DOWN;
      case left:
        return KEY_LEFT;
      case right:
        return KEY_RIGHT;
      case confirm:
        return confirm_code_;
      case teleport:
        return teleport_code_;
    }
    return KEY_RESERVED;
  }

  void UinputKeyboard::emit(int type, int code, int value) const
  {
    struct input_event event{};
    event.type = static_cast<__u16>(type);
    event.code = static_cast<__u16>(code);
    event.value = value;

    ssize_t written = write(fd_, &event, sizeof(event));
    if (written != static_cast<ssize_t>(sizeof(event))) {
      tools::logger()->warn("[Keyboard] 按键事件发送失败: {}", std::strerror(errno));
    }
  }

  void UinputKeyboard::read_yaml(const std::string& config_path)
  {
    auto yaml = tools::load(config_path);
    device_ = tools::read_or<std::string>(yaml, "keyboard_device", "/dev/uinput");
    confirm_code_ = lookup_code(tools::read_or<std::string>(yaml, "confirm_key", "z"));
    teleport_code_ = lookup_code(tools::read_or<std::string>(yaml, "teleport_key", "9"));
  }

  void LogKeyboard::press(Key key) { tools::logger()->info("[Keyboard] press {}", KEYS[key]); }

  void LogKeyboard::key_down(Key key) { tools::logger()->info("[Keyboard] down  {}", KEYS[key]); }

  void LogKeyboard::key_up(Key key) { tools::logger()->info("[Keyboard] up    {}", KEYS[key]); }

} // namespace ecu
