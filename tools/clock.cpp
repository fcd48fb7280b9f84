#include "clock.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace tools
{
  void SystemClock::sleep_for(double seconds)
  {
    if (seconds <= 0.0) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
  }

  void VirtualClock::sleep_for(double seconds)
  {
    if (seconds > 0.0) {
      std::lock_guard<std::mutex> lock(mutex_);
      elapsed_ += seconds;
    }
    // 让出时间片，避免工作线程在虚拟时间下空转占满 CPU
    std::this_thread::yield();
  }

  double VirtualClock::elapsed() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return elapsed_;
  }

  bool sleep_while(Clock& clock, double seconds, const std::atomic<bool>& running, double slice)
  {
    double remaining = seconds;
    while (remaining > 0.0) {
      if (!running.load()) {
        return false;
      }
      double step = std::min(remaining, slice);
      clock.sleep_for(step);
      remaining -= step;
    }
    return running.load();
  }

} // namespace tools
