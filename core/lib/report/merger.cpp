// hammer/report/merger.cpp
#include "hammer/report/merger.hpp"

namespace hammer
{

DiagnosticBundle merge(const std::vector<const DiagnosticBundle *> & sources)
{
  DiagnosticBundle merged;
  for (const auto * source : sources) {
    for (const auto & [name, diags] : *source) {
      merged.append(name, diags);
    }
  }
  return merged;
}

DiagnosticBundle merge(
  const DiagnosticBundle & resolver, const DiagnosticBundle & builtin,
  const std::vector<CheckRun> & checks)
{
  std::vector<const DiagnosticBundle *> sources{&resolver, &builtin};
  sources.reserve(checks.size() + 2);
  for (const auto & run : checks) {
    sources.push_back(&run.bundle);
  }
  return merge(sources);
}

}  // namespace hammer
