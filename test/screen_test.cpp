#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <opencv2/imgcodecs.hpp>

#include "ecu/screen.hpp"

namespace
{
  std::filesystem::path temp_dir()
  {
    auto dir = std::filesystem::temp_directory_path() / "auto_encounter_screen_test";
    std::filesystem::create_directories(dir);
    return dir;
  }

  std::string write_config(const std::string& text)
  {
    auto path = (temp_dir() / "screen.yaml").string();
    std::ofstream(path) << text;
    return path;
  }
} // namespace

TEST(ImageScreen, ReturnsBgrImageFromFile)
{
  auto path = (temp_dir() / "frame.png").string();
  ASSERT_TRUE(cv::imwrite(path, cv::Mat(30, 40, CV_8UC3, cv::Scalar(10, 20, 30))));

  ecu::ImageScreen screen(path);
  auto image = screen.capture();
  EXPECT_EQ(image.type(), CV_8UC3);
  EXPECT_EQ(image.cols, 40);
  EXPECT_EQ(image.rows, 30);

  std::filesystem::remove_all(temp_dir());
}

TEST(ImageScreen, MissingFileThrows)
{
  ecu::ImageScreen screen("/nonexistent/frame.png");
  EXPECT_THROW(screen.capture(), std::runtime_error);
}

TEST(Screen, SelectsSourceFromConfig)
{
  auto image_path = (temp_dir() / "frame.png").string();
  ASSERT_TRUE(cv::imwrite(image_path, cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(0))));

  ecu::Screen screen(write_config("screen_name: image\nimage_path: " + image_path + "\n"));
  EXPECT_EQ(screen.capture().cols, 8);

  EXPECT_THROW(ecu::Screen(write_config("screen_name: webcam\n")), std::runtime_error);
  std::filesystem::remove_all(temp_dir());
}

// 需要 X 服务器，没有 $DISPLAY 时跳过
TEST(X11Screen, ProtocolErrorThrowsInsteadOfExiting)
{
  if (std::getenv("DISPLAY") == nullptr) {
    GTEST_SKIP() << "未设置 DISPLAY";
  }

  // 不属于任何客户端的窗口 id，XGetWindowAttributes 会产生 BadWindow
  ecu::X11Screen screen("", 0x0FFFFFFFul);
  EXPECT_THROW(screen.capture(), std::runtime_error);
  // 错误已被记录并清除，进程仍然存活，可以继续截图
  EXPECT_THROW(screen.capture(), std::runtime_error);
}
