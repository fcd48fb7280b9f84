#pragma once

#include <string>
#include <vector>

namespace ecu
{
  // 游戏用到的按键，确认键与传送键的物理按键可在配置文件中指定
  enum Key { up, down, left, right, confirm, teleport };
  const std::vector<std::string> KEYS = {"up", "down", "left", "right", "confirm", "teleport"};

  bool parse_key(const std::string& name, Key& key);

  /**
   * @brief 按键输出接口。只管发送，不读取任何反馈
   */
  class KeyboardBase
  {
  public:
    virtual ~KeyboardBase() = default;

    virtual void press(Key key) = 0;
    virtual void key_down(Key key) = 0;
    virtual void key_up(Key key) = 0;
  };

  /**
   * @brief 通过 /dev/uinput 创建虚拟键盘，按键事件由内核注入，对前台窗口生效
   */
  class UinputKeyboard : public KeyboardBase
  {
  public:
    explicit UinputKeyboard(const std::string& config_path);
    ~UinputKeyboard();

    UinputKeyboard(const UinputKeyboard&) = delete;
    UinputKeyboard& operator=(const UinputKeyboard&) = delete;

    void press(Key key) override;
    void key_down(Key key) override;
    void key_up(Key key) override;

  private:
    int fd_; // uinput 文件描述符
    std::string device_;
    int confirm_code_;
    int teleport_code_;

    int code_of(Key key) const;
    void emit(int type, int code, int value) const;
    void read_yaml(const std::string& config_path);
  };

  /**
   * @brief 只打印按键事件的键盘，用于 --dry-run 调试动作脚本
   */
  class LogKeyboard : public KeyboardBase
  {
  public:
    void press(Key key) override;
    void key_down(Key key) override;
    void key_up(Key key) override;
  };

} // namespace ecu
