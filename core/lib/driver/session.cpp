// hammer/driver/session.cpp - Pipeline orchestration
//
#include "hammer/driver/session.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "hammer/basic/error.hpp"
#include "hammer/eval/attribute_resolver.hpp"
#include "hammer/eval/nix_expr.hpp"
#include "hammer/report/merger.hpp"

namespace fs = std::filesystem;

namespace hammer
{

std::vector<fs::path> discover_overlays(const fs::path & dir, const std::set<std::string> & excluded)
{
  std::vector<fs::path> overlays;

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw Error("cannot read overlay directory " + dir.string() + ": " + ec.message());
  }

  for (const auto & entry : it) {
    const fs::path & p = entry.path();
    if (p.extension() != ".nix" || !entry.is_regular_file(ec)) {
      continue;
    }
    if (excluded.count(p.stem().string()) != 0) {
      continue;
    }
    overlays.push_back(p);
  }

  std::sort(overlays.begin(), overlays.end());
  return overlays;
}

Session::Session(SessionOptions options, Evaluator & evaluator, Trace & trace)
: options_(std::move(options)), evaluator_(evaluator), trace_(trace)
{
  options_.checks.excluded.insert(options_.excluded.begin(), options_.excluded.end());
}

SessionResult Session::run()
{
  // 1. Resolution
  EvalRequest request;
  request.package_set = options_.package_set;
  request.attributes = options_.attributes;
  if (options_.overlay_dir) {
    request.overlays = discover_overlays(*options_.overlay_dir, options_.excluded);
  }
  for (const auto & overlay : request.overlays) {
    trace_.log("using rule overlay {}", overlay.stem().string());
  }

  AttributeResolver resolver(evaluator_, trace_);
  ResolverResult resolved = resolver.resolve(std::move(request));

  // 2. Built-in notices
  const DiagnosticBundle notices = builtin_notices(resolved.descriptors, options_.checks.excluded);

  // 3. External checks
  const ExternalCheckRunner runner(options_.checks, trace_);
  std::vector<CheckRun> runs;
  if (resolved.descriptors.empty()) {
    trace_.log("no attribute resolved, skipping external checks");
  } else {
    runs = runner.run(resolved.descriptors);
  }

  // 4. Merge
  SessionResult result;
  result.bundle = merge(resolved.bundle, notices, runs);
  result.descriptors = std::move(resolved.descriptors);
  for (const auto & run : runs) {
    result.checks.push_back(run.check);
  }

  trace_.log(
    "{} diagnostic(s) for {} attribute(s)", result.bundle.diagnostic_count(),
    result.bundle.size());
  return result;
}

}  // namespace hammer
