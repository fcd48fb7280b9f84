#pragma once

namespace tools
{
  /**
   * @brief 捕获 Ctrl-C (SIGINT) 与 SIGTERM，主循环通过 exit() 判断是否退出。进程内只允许一个实例。
   */
  class Exiter
  {
  public:
    Exiter();

    bool exit() const;
  };

} // namespace tools
