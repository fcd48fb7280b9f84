#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace tools
{
  /**
   * @brief 有界线程安全队列，队列满时丢弃最早的元素
   * @tparam T
   */
  template <typename T> class ThreadSafeQueue
  {
  public:
    explicit ThreadSafeQueue(std::size_t max_size)
        : max_size_(max_size)
    {
    }

    void push(const T& value)
    {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= max_size_) {
          queue_.pop();
        }
        queue_.push(value);
      }
      not_empty_.notify_one();
    }

    // 等待至多 timeout，超时返回 false
    template <typename Rep, typename Period>
    bool pop_for(T& value, const std::chrono::duration<Rep, Period>& timeout)
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (!not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return false;
      }
      value = queue_.front();
      queue_.pop();
      return true;
    }

  private:
    std::queue<T> queue_;
    std::size_t max_size_;
    std::mutex mutex_;
    std::condition_variable not_empty_;
  };

} // namespace tools
