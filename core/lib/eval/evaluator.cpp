// hammer/eval/evaluator.cpp - nix-instantiate invocation
//
#include "hammer/eval/evaluator.hpp"

#include <fmt/core.h>

#include <system_error>
#include <utility>

#include "hammer/basic/error.hpp"
#include "hammer/process/subprocess.hpp"

namespace hammer
{

NixInstantiateEvaluator::NixInstantiateEvaluator(NixEvaluatorOptions options, Trace & trace)
: options_(std::move(options)), trace_(trace)
{
}

std::vector<std::string> NixInstantiateEvaluator::command_line() const
{
  std::vector<std::string> argv{options_.command, "--strict", "--json", "--eval"};
  if (options_.show_trace) {
    argv.emplace_back("--show-trace");
  }
  argv.emplace_back("-");
  return argv;
}

Json NixInstantiateEvaluator::evaluate(const std::string & expression)
{
  const auto executable = find_executable(options_.command, {});
  if (!executable) {
    throw EvaluatorError(fmt::format("evaluator '{}' not found", options_.command));
  }

  ProcessOptions process;
  process.argv = command_line();
  process.argv.front() = executable->string();
  process.input = expression;

  trace_.log("evaluating with {}", executable->string());
  trace_.log("evaluator input:\n{}", expression);

  ProcessResult result;
  try {
    result = run_process(process);
  } catch (const std::system_error & e) {
    throw EvaluatorError(fmt::format("failed to run evaluator '{}': {}", options_.command, e.what()));
  }

  if (!result.success()) {
    throw EvaluatorError(
      fmt::format("evaluator '{}' {}", options_.command, result.describe_failure()));
  }

  try {
    return Json::parse(result.output);
  } catch (const Json::parse_error & e) {
    throw EvaluatorError(fmt::format("evaluator returned invalid JSON: {}", e.what()));
  }
}

}  // namespace hammer
