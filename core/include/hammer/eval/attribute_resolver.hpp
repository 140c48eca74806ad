// hammer/eval/attribute_resolver.hpp - Attribute resolution with embedded reports
//
// Resolves all requested attributes with a single evaluator call and
// classifies each one as Failed, NotFound or Resolved.
//
#pragma once

#include <string>
#include <variant>
#include <vector>

#include "hammer/basic/attribute.hpp"
#include "hammer/basic/bundle.hpp"
#include "hammer/basic/report.hpp"
#include "hammer/basic/report_json.hpp"
#include "hammer/basic/trace.hpp"
#include "hammer/eval/evaluator.hpp"
#include "hammer/eval/nix_expr.hpp"

namespace hammer
{

// ============================================================================
// Resolution Outcome
// ============================================================================

/// Evaluating the attribute itself raised an error.
struct ResolveFailed
{
};

/// The attribute path does not exist in the package set.
struct ResolveNotFound
{
};

/// The attribute evaluated; `diagnostics` are its embedded reports.
struct Resolved
{
  AttributeDescriptor descriptor;
  std::vector<Diagnostic> diagnostics;

  /// The embedded report list itself failed to evaluate and was dropped
  bool reports_failed = false;
  std::string reports_error;
};

using ResolveOutcome = std::variant<ResolveFailed, ResolveNotFound, Resolved>;

struct ResolvedAttribute
{
  std::string name;
  ResolveOutcome outcome;
};

/**
 * Everything the resolver contributes to a run.
 */
struct ResolverResult
{
  /// One entry per requested attribute, in request order
  std::vector<ResolvedAttribute> attributes;

  /// Descriptors of the attributes that resolved, in request order
  std::vector<AttributeDescriptor> descriptors;

  /// Embedded and synthetic diagnostics; every requested name is a key
  DiagnosticBundle bundle;
};

// ============================================================================
// AttributeResolver
// ============================================================================

class AttributeResolver
{
public:
  AttributeResolver(Evaluator & evaluator, Trace & trace);

  /**
   * Resolve every attribute of `request` with one evaluation.
   *
   * Duplicate attribute names are collapsed to their first occurrence. A path
   * that split_attr_path() rejects is reported as not found and is left out
   * of the evaluation; the evaluator is not called when nothing is left.
   *
   * @throws EvaluatorError if the evaluator fails or answers with a non-object
   */
  [[nodiscard]] ResolverResult resolve(EvalRequest request);

  /**
   * Classify one entry of the evaluator response.
   *
   * @param attr Attribute name
   * @param entry Response value for `attr`, or nullptr when it was missing
   */
  [[nodiscard]] static ResolveOutcome classify(const std::string & attr, const Json * entry);

  /// Synthetic diagnostic for an attribute that failed to evaluate.
  [[nodiscard]] static Diagnostic eval_error(
    const std::string & attr, const std::string & package_set);

  /// Synthetic diagnostic for a missing attribute path.
  [[nodiscard]] static Diagnostic attr_path_not_found(
    const std::string & attr, const std::string & package_set);

private:
  Evaluator & evaluator_;
  Trace & trace_;
};

}  // namespace hammer
