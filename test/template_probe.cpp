#include <opencv2/core/utility.hpp>
#include <opencv2/imgcodecs.hpp>

#include "function/auto_encounter/template_detector.hpp"
#include "tools/logger.hpp"

// 离线检查参考图在截图上的匹配分数，用于挑选 detection_threshold
const std::string keys =
    "{help h usage ? |     | 输出命令行参数说明 }"
    "{@screenshot    |     | 截图路径 }"
    "{@template      |     | 参考图路径 }"
    "{threshold t    | 0.8 | 检测阈值 }";

int main(int argc, char* argv[])
{
  cv::CommandLineParser cli(argc, argv, keys);
  if (cli.has("help") || !cli.has("@screenshot") || !cli.has("@template")) {
    cli.printMessage();
    return 0;
  }

  auto screenshot_path = cli.get<std::string>("@screenshot");
  auto template_path = cli.get<std::string>("@template");
  auto threshold = cli.get<double>("threshold");

  cv::Mat screenshot = cv::imread(screenshot_path, cv::IMREAD_COLOR);
  cv::Mat templ = cv::imread(template_path, cv::IMREAD_COLOR);
  if (screenshot.empty() || templ.empty()) {
    tools::logger()->error("无法读取图片: {} / {}", screenshot_path, template_path);
    return -1;
  }

  double score = auto_encounter::TemplateDetector::match(screenshot, templ);
  tools::logger()->info("匹配分数 {:.4f}, 阈值 {:.2f}: {}", score, threshold,
                        score >= threshold ? "检测到" : "未检测到");
  return score >= threshold ? 0 : 1;
}
