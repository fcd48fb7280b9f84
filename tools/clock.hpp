#pragma once

#include <atomic>
#include <mutex>

namespace tools
{
  /**
   * @brief 时间源。自动化流程中的所有等待都经过它，测试时换成虚拟时钟即可不真正睡眠
   */
  class Clock
  {
  public:
    virtual ~Clock() = default;

    /**
     * @brief 阻塞当前线程
     * @param[in] seconds       等待时长，单位 s，非正数直接返回
     */
    virtual void sleep_for(double seconds) = 0;
  };

  class SystemClock : public Clock
  {
  public:
    void sleep_for(double seconds) override;
  };

  /**
   * @brief 虚拟时钟，只累计等待时长
   */
  class VirtualClock : public Clock
  {
  public:
    void sleep_for(double seconds) override;

    double elapsed() const;

  private:
    mutable std::mutex mutex_;
    double elapsed_{0.0};
  };

  /**
   * @brief 可被打断的等待。按 slice 切片睡眠，每片之间检查 running，
   *        running 变为 false 时提前返回
   * @return true             等待完整结束
   * @return false            中途被停止
   */
  bool sleep_while(Clock& clock, double seconds, const std::atomic<bool>& running,
                   double slice = 0.1);

} // namespace tools
