// hammer/basic/trace.hpp - Verbose progress output
//
// Library code reports progress through a Trace instead of writing to
// std::cerr. The CLI enables it with --verbose. Safe to share between threads.
//
#pragma once

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <mutex>
#include <ostream>
#include <string>
#include <utility>

namespace hammer
{

class Trace
{
public:
  explicit Trace(std::ostream & os, bool enabled = false) : os_(os), enabled_(enabled) {}

  [[nodiscard]] bool enabled() const noexcept { return enabled_; }

  /// Print "hammer: <formatted message>" when enabled.
  template <typename... Args>
  void log(fmt::format_string<Args...> format, Args &&... args)
  {
    if (!enabled_) {
      return;
    }
    const std::string line = fmt::format(format, std::forward<Args>(args)...);
    const std::lock_guard<std::mutex> lock(mutex_);
    fmt::print(os_, "hammer: {}\n", line);
  }

  /// A Trace that discards everything.
  static Trace & null();

private:
  std::ostream & os_;
  bool enabled_;
  std::mutex mutex_;  // checks may trace from worker threads
};

}  // namespace hammer
