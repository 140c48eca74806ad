// hammer/report/merger.hpp - Combine diagnostics from all sources
#pragma once

#include <vector>

#include "hammer/basic/bundle.hpp"
#include "hammer/check/external_checks.hpp"

namespace hammer
{

/**
 * Concatenate bundles in source order.
 *
 * An attribute's list in the result is its resolver diagnostics, then its
 * built-in notices, then each check's diagnostics in registration order.
 * Nothing is deduplicated or re-sorted. Keys appear in the order they are
 * first seen, so the resolver bundle (which holds every requested name)
 * fixes the output order.
 */
[[nodiscard]] DiagnosticBundle merge(
  const DiagnosticBundle & resolver, const DiagnosticBundle & builtin,
  const std::vector<CheckRun> & checks);

/// Generic form: bundles are concatenated in the given order.
[[nodiscard]] DiagnosticBundle merge(const std::vector<const DiagnosticBundle *> & sources);

}  // namespace hammer
