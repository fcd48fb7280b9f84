#pragma once

#include <algorithm>
#include <cmath>

namespace tools
{
  /**
   * @brief 判断某个值是否在一个闭区间内。
   * @tparam T
   * @param[in] val           判断的值
   * @param[in] lower         下限
   * @param[in] upper         上限
   * @return true
   * @return false
   */
  template <typename T> constexpr inline bool inRange(T val, T lower, T upper)
  {
    if (lower > upper) {
      std::swap(lower, upper);
    }
    return val >= lower && val <= upper;
  }

  /**
   * @brief 判断是否为有限的正数，用于校验各类时长参数
   * @param[in] val
   * @return true
   * @return false
   */
  inline bool is_positive(double val) noexcept { return std::isfinite(val) && val > 0.0; }

  /**
   * @brief 归一化相关系数是否落在 [0, 1] 阈值范围内
   * @param[in] threshold
   * @return true
   * @return false
   */
  inline bool is_valid_threshold(double threshold) noexcept
  {
    return std::isfinite(threshold) && inRange(threshold, 0.0, 1.0);
  }

} // namespace tools
