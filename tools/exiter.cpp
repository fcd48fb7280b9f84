#include "exiter.hpp"

#include <atomic>
#include <csignal>
#include <stdexcept>

namespace tools
{
  namespace
  {
    std::atomic<bool> EXIT{false};
    bool EXITER_CREATED = false;

    void on_signal(int) { EXIT = true; }
  } // namespace

  Exiter::Exiter()
  {
    if (EXITER_CREATED) {
      throw std::runtime_error("[Exiter] 只允许创建一个 Exiter!");
    }
    EXITER_CREATED = true;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
  }

  bool Exiter::exit() const { return EXIT.load(); }

} // namespace tools
