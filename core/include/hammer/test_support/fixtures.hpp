// hammer/test_support/fixtures.hpp - helpers for unit/integration tests
//
// Temporary directories, scripted executables and a canned evaluator.
//
#pragma once

#include <sys/stat.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "hammer/eval/evaluator.hpp"

namespace hammer::test_support
{

[[nodiscard]] inline std::filesystem::path make_temp_dir(std::string_view prefix)
{
  static unsigned counter = 0;
  const auto base = std::filesystem::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::filesystem::path dir =
    base / (std::string(prefix) + "_" + std::to_string(now) + "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

inline void write_file(const std::filesystem::path & p, const std::string & content)
{
  std::ofstream out(p, std::ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error("failed to open file for writing: " + p.string());
  }
  out << content;
}

[[nodiscard]] inline std::string read_file(const std::filesystem::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

/**
 * Write a /bin/sh script and make it executable.
 *
 * @param body Script without the shebang line
 */
inline void write_script(const std::filesystem::path & p, const std::string & body)
{
  write_file(p, "#!/bin/sh\n" + body);
  if (::chmod(p.c_str(), 0755) != 0) {
    throw std::runtime_error("failed to make executable: " + p.string());
  }
}

/// POSIX shell single-quote escaping.
[[nodiscard]] inline std::string shell_quote(const std::string & s)
{
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

/**
 * Evaluator returning a canned response and recording every expression.
 */
class FakeEvaluator : public Evaluator
{
public:
  explicit FakeEvaluator(Json response) : response_(std::move(response)) {}

  [[nodiscard]] Json evaluate(const std::string & expression) override
  {
    expressions.push_back(expression);
    if (on_evaluate) {
      on_evaluate(expression);
    }
    return response_;
  }

  /// Expressions passed to evaluate(), in call order
  std::vector<std::string> expressions;

  /// Optional hook run on each call (may throw)
  std::function<void(const std::string &)> on_evaluate;

private:
  Json response_;
};

}  // namespace hammer::test_support
