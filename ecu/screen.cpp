#include "screen.hpp"

#include <atomic>
#include <memory>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

#include "tools/logger.hpp"
#include "tools/yaml.hpp"

// Xlib 的宏 (Status, None ...) 会污染后面的代码，放在最后
#include <X11/Xlib.h>
#include <X11/Xutil.h>

namespace ecu
{
  namespace
  {
    // Xlib 默认的错误处理函数会直接 exit()，这里只记录错误码，由 capture() 转成异常
    std::atomic<int> x_error_code{0};

    int record_x_error(Display*, XErrorEvent* event)
    {
      x_error_code = event->error_code;
      return 0;
    }

    struct ImageDeleter {
      void operator()(XImage* image) const { XDestroyImage(image); }
    };

    // 等待请求处理完毕，期间收到的协议错误以异常抛出
    void check_x_error(Display* display, const std::string& request)
    {
      XSync(display, False);
      int code = x_error_code.exchange(0);
      if (code == 0) {
        return;
      }
      char text[128] = {0};
      XGetErrorText(display, code, text, sizeof(text));
      throw std::runtime_error("[Screen] " + request + " 失败: " + text);
    }
  } // namespace

  X11Screen::X11Screen(const std::string& display_name, unsigned long window)
      : display_(nullptr)
      , window_(window)
  {
    XSetErrorHandler(record_x_error);

    display_ = XOpenDisplay(display_name.empty() ? nullptr : display_name.c_str());
    if (display_ == nullptr) {
      throw std::runtime_error("[Screen] 无法连接 X 显示: " +
                               (display_name.empty() ? std::string("$DISPLAY") : display_name));
    }
    if (window_ == 0) {
      window_ = DefaultRootWindow(display_);
    }
    tools::logger()->info("[Screen] 已连接 X 显示 {}, 截取窗口 {:#x}", DisplayString(display_),
                          window_);
  }

  X11Screen::~X11Screen()
  {
    if (display_ != nullptr) {
      XCloseDisplay(display_);
    }
  }

  cv::Mat X11Screen::capture()
  {
    x_error_code = 0;

    XWindowAttributes attributes{};
    auto status = XGetWindowAttributes(display_, window_, &attributes);
    check_x_error(display_, "XGetWindowAttributes");
    if (status == 0) {
      throw std::runtime_error("[Screen] 无法获取窗口属性");
    }

    // 窗口尺寸可能在两次请求之间改变，此时 XGetImage 产生 BadMatch
    std::unique_ptr<XImage, ImageDeleter> image(XGetImage(
      display_, window_, 0, 0, attributes.width, attributes.height, AllPlanes, ZPixmap));
    check_x_error(display_, "XGetImage");
    if (image == nullptr) {
      throw std::runtime_error("[Screen] XGetImage 失败");
    }
    if (image->bits_per_pixel != 32) {
      throw std::runtime_error("[Screen] 不支持的像素位深: " +
                               std::to_string(image->bits_per_pixel));
    }

    // 小端 TrueColor 下的内存布局为 BGRA
    cv::Mat bgra(image->height, image->width, CV_8UC4, image->data,
                 static_cast<size_t>(image->bytes_per_line));
    cv::Mat bgr;
    cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
    return bgr;
  }

  ImageScreen::ImageScreen(const std::string& image_path)
      : image_path_(image_path)
  {
    tools::logger()->info("[Screen] 使用图片文件作为截图来源: {}", image_path_);
  }

  cv::Mat ImageScreen::capture()
  {
    cv::Mat image = cv::imread(image_path_, cv::IMREAD_COLOR);
    if (image.empty()) {
      throw std::runtime_error("[Screen] 无法读取图片: " + image_path_);
    }
    return image;
  }

  Screen::Screen(const std::string& config_path)
  {
    auto yaml = tools::load(config_path);
    auto screen_name = tools::read<std::string>(yaml, "screen_name");

    if (screen_name == "x11") {
      auto display = tools::read_or<std::string>(yaml, "display", "");
      auto window_id = tools::read_or<unsigned long>(yaml, "window_id", 0);
      screen_ = std::make_unique<X11Screen>(display, window_id);
    }

    else if (screen_name == "image") {
      auto image_path = tools::read<std::string>(yaml, "image_path");
      screen_ = std::make_unique<ImageScreen>(image_path);
    }

    else {
      throw std::runtime_error("Unknow screen_name: " + screen_name + "!");
    }
  }

  cv::Mat Screen::capture() { return screen_->capture(); }

} // namespace ecu
