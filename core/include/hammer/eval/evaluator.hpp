// hammer/eval/evaluator.hpp - Boundary to the Nix evaluator
//
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "hammer/basic/report_json.hpp"
#include "hammer/basic/trace.hpp"

namespace hammer
{

/**
 * Evaluates one Nix expression to JSON.
 *
 * The resolver only relies on the response shape; tests substitute a fake.
 */
class Evaluator
{
public:
  virtual ~Evaluator() = default;

  /**
   * @throws EvaluatorError when the expression cannot be evaluated
   */
  [[nodiscard]] virtual Json evaluate(const std::string & expression) = 0;
};

struct NixEvaluatorOptions
{
  /// Evaluator executable, looked up in PATH when it has no '/'
  std::string command = "nix-instantiate";

  /// Pass --show-trace
  bool show_trace = false;
};

/**
 * Runs `nix-instantiate --strict --json --eval -` with the expression on stdin.
 */
class NixInstantiateEvaluator : public Evaluator
{
public:
  NixInstantiateEvaluator(NixEvaluatorOptions options, Trace & trace);

  [[nodiscard]] Json evaluate(const std::string & expression) override;

  /// Full command line, argv[0] unresolved.
  [[nodiscard]] std::vector<std::string> command_line() const;

private:
  NixEvaluatorOptions options_;
  Trace & trace_;
};

}  // namespace hammer
