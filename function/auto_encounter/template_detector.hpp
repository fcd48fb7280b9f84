#pragma once

#include <map>
#include <mutex>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "ecu/screen.hpp"

namespace auto_encounter
{
  // 参考图名称
  const std::string HP_INDICATOR = "hp_indicator"; // 战斗中才出现的血条
  const std::string BATTLE_MENU = "battle_menu";   // 战斗指令菜单

  /**
   * @brief 画面状态检测接口。检测永远不会抛出异常，任何失败都视为未检测到
   */
  class Detector
  {
  public:
    virtual ~Detector() = default;

    virtual bool detect(const std::string& name, double threshold) = 0;
    virtual bool has_template(const std::string& name) const = 0;

    bool is_in_battle(double threshold) { return detect(HP_INDICATOR, threshold); }
    bool is_battle_menu_visible(double threshold) { return detect(BATTLE_MENU, threshold); }
  };

  /**
   * @brief 基于归一化互相关模板匹配的检测器。
   *        每次检测都重新截取整屏，不缓存结果；参考图可在运行中替换。
   */
  class TemplateDetector : public Detector
  {
  public:
    explicit TemplateDetector(ecu::ScreenBase& screen);

    bool load(const std::string& name, const std::string& path);
    bool load(const std::string& name, const std::vector<uchar>& bytes);

    /**
     * @brief 启动时按候选文件名从目录中加载全部参考图
     * @param[in] dir           参考图目录
     * @return int              成功加载的参考图数目
     */
    int load_dir(const std::string& dir);

    /**
     * @brief 把参考图写回 <dir>/<name><ext>，使其在重启后仍然可用
     */
    bool save(const std::string& name, const std::string& dir) const;

    bool detect(const std::string& name, double threshold) override;
    bool has_template(const std::string& name) const override;

    /**
     * @brief 截图并计算与参考图的匹配分数
     * @return double           最大相关系数，参考图缺失或截图失败时为 -1
     */
    double score(const std::string& name);

    /**
     * @brief 模板在图像所有位置上的 TM_CCOEFF_NORMED 最大值。
     *        模板比图像大或任一为空时返回 -1；类型不一致时 OpenCV 抛出 cv::Exception
     */
    static double match(const cv::Mat& image, const cv::Mat& templ);

  private:
    struct Template {
      cv::Mat image;
      std::string extension; // 写回磁盘时使用的扩展名
    };

    ecu::ScreenBase& screen_;
    mutable std::mutex mutex_;
    std::map<std::string, Template> templates_;

    bool find(const std::string& name, cv::Mat& image) const;
    void insert(const std::string& name, const cv::Mat& image, const std::string& extension);
  };

} // namespace auto_encounter
