#pragma once

#include <memory>
#include <opencv2/core.hpp>
#include <string>

struct _XDisplay;

namespace ecu
{
  /**
   * @brief 截图接口。capture() 失败时抛出异常，由调用方决定如何降级
   */
  class ScreenBase
  {
  public:
    virtual ~ScreenBase() = default;

    // 返回 BGR 三通道整屏图像
    virtual cv::Mat capture() = 0;
  };

  /**
   * @brief X11 窗口截图。X 协议错误不会终止进程，capture() 以 std::runtime_error 抛出
   * @param[in] display_name  空串时使用 $DISPLAY
   * @param[in] window        要截取的窗口，0 表示根窗口
   */
  class X11Screen : public ScreenBase
  {
  public:
    explicit X11Screen(const std::string& display_name, unsigned long window = 0);
    ~X11Screen();

    X11Screen(const X11Screen&) = delete;
    X11Screen& operator=(const X11Screen&) = delete;

    cv::Mat capture() override;

  private:
    _XDisplay* display_;
    unsigned long window_;
  };

  /**
   * @brief 每次截图都重新读取同一个图片文件，用于离线调试
   */
  class ImageScreen : public ScreenBase
  {
  public:
    explicit ImageScreen(const std::string& image_path);

    cv::Mat capture() override;

  private:
    std::string image_path_;
  };

  /**
   * @brief 根据配置文件中的 screen_name 选择截图来源
   */
  class Screen : public ScreenBase
  {
  public:
    explicit Screen(const std::string& config_path);

    cv::Mat capture() override;

  private:
    std::unique_ptr<ScreenBase> screen_;
  };

} // namespace ecu
