#include "template_detector.hpp"

#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "tools/logger.hpp"

namespace auto_encounter
{
  namespace
  {
    // 启动时依次尝试的文件名，第一个能读取的生效
    // clang-format off
    const std::vector<std::pair<std::string, std::vector<std::string>>> TEMPLATE_FILES = {
        {HP_INDICATOR, {"hp_indicator.png", "hp_indicator.jpg", "hp_bar.png", "hp_bar.jpg"}},
        {BATTLE_MENU,  {"battle_menu.png", "battle_options.png", "battle_menu.jpg"}},
    };
    // clang-format on

    constexpr double NO_MATCH = -1.0;
  } // namespace

  TemplateDetector::TemplateDetector(ecu::ScreenBase& screen)
      : screen_(screen)
  {
  }

  bool TemplateDetector::load(const std::string& name, const std::string& path)
  {
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
      tools::logger()->warn("[TemplateDetector] 无法读取参考图 {}: {}", name, path);
      return false;
    }
    auto extension = std::filesystem::path(path).extension().string();
    insert(name, image, extension.empty() ? ".png" : extension);
    tools::logger()->info("[TemplateDetector] 已加载参考图 {} ({}x{}): {}", name, image.cols,
                          image.rows, path);
    return true;
  }

  bool TemplateDetector::load(const std::string& name, const std::vector<uchar>& bytes)
  {
    if (bytes.empty()) {
      tools::logger()->warn("[TemplateDetector] 参考图 {} 数据为空", name);
      return false;
    }
    cv::Mat image;
    try {
      image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
      tools::logger()->warn("[TemplateDetector] 参考图 {} 解码失败: {}", name, e.what());
      return false;
    }
    if (image.empty()) {
      tools::logger()->warn("[TemplateDetector] 参考图 {} 解码失败", name);
      return false;
    }
    insert(name, image, ".png");
    tools::logger()->info("[TemplateDetector] 已加载参考图 {} ({}x{})", name, image.cols, image.rows);
    return true;
  }

  int TemplateDetector::load_dir(const std::string& dir)
  {
    int loaded = 0;
    for (const auto& [name, files] : TEMPLATE_FILES) {
      for (const auto& file : files) {
        auto path = std::filesystem::path(dir) / file;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
          continue;
        }
        if (load(name, path.string())) {
          ++loaded;
          break;
        }
      }
      if (!has_template(name)) {
        tools::logger()->warn("[TemplateDetector] 目录 {} 中没有参考图 {}", dir, name);
      }
    }
    return loaded;
  }

  bool TemplateDetector::save(const std::string& name, const std::string& dir) const
  {
    std::string extension;
    cv::Mat image;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = templates_.find(name);
      if (it == templates_.end()) {
        return false;
      }
      image = it->second.image;
      extension = it->second.extension;
    }

    auto path = (std::filesystem::path(dir) / (name + extension)).string();
    try {
      std::filesystem::create_directories(dir);
      if (!cv::imwrite(path, image)) {
        tools::logger()->warn("[TemplateDetector] 无法写入参考图: {}", path);
        return false;
      }
    } catch (const std::exception& e) {
      tools::logger()->warn("[TemplateDetector] 无法写入参考图 {}: {}", path, e.what());
      return false;
    }
    tools::logger()->info("[TemplateDetector] 参考图 {} 已保存到 {}", name, path);
    return true;
  }

  bool TemplateDetector::detect(const std::string& name, double threshold)
  {
    return score(name) >= threshold;
  }

  bool TemplateDetector::has_template(const std::string& name) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return templates_.count(name) > 0;
  }

  double TemplateDetector::score(const std::string& name)
  {
    cv::Mat templ;
    if (!find(name, templ)) {
      tools::logger()->debug("[TemplateDetector] 未加载参考图 {}", name);
      return NO_MATCH;
    }

    try {
      cv::Mat screen = screen_.capture();
      return match(screen, templ);
    } catch (const cv::Exception& e) {
      tools::logger()->warn("[TemplateDetector] 检测 {} 出错: {}", name, e.what());
    } catch (const std::exception& e) {
      tools::logger()->warn("[TemplateDetector] 检测 {} 出错: {}", name, e.what());
    }
    return NO_MATCH;
  }

  double TemplateDetector::match(const cv::Mat& image, const cv::Mat& templ)
  {
    if (image.empty() || templ.empty() || templ.cols > image.cols || templ.rows > image.rows) {
      return NO_MATCH;
    }

    cv::Mat result;
    cv::matchTemplate(image, templ, result, cv::TM_CCOEFF_NORMED);
    // 纯色区域的相关系数无定义
    cv::patchNaNs(result, NO_MATCH);

    double max_val = NO_MATCH;
    cv::minMaxLoc(result, nullptr, &max_val, nullptr, nullptr);
    return max_val;
  }

  bool TemplateDetector::find(const std::string& name, cv::Mat& image) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = templates_.find(name);
    if (it == templates_.end()) {
      return false;
    }
    // cv::Mat 引用计数，参考图被替换后这里的副本仍然有效
    image = it->second.image;
    return true;
  }

  void TemplateDetector::insert(const std::string& name, const cv::Mat& image,
                                const std::string& extension)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    templates_[name] = Template{image, extension};
  }

} // namespace auto_encounter
