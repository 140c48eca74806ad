// hammer/eval/attribute_resolver.cpp - Attribute resolution implementation
//
#include "hammer/eval/attribute_resolver.hpp"

#include <fmt/core.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <utility>

#include "hammer/basic/error.hpp"

namespace fs = std::filesystem;

namespace hammer
{
namespace
{

template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::optional<std::string> optional_string(const Json & entry, const char * key)
{
  const auto it = entry.find(key);
  if (it == entry.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::optional<SourceLocation> decode_position(const Json & entry, const std::string & where)
{
  const auto it = entry.find("location");
  if (it == entry.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    return parse_position(it->get<std::string>());
  }
  try {
    return decode_location(*it, where + "/location");
  } catch (const DecodeError &) {
    return std::nullopt;
  }
}

std::vector<std::string> unique_attributes(const std::vector<std::string> & attrs)
{
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto & a : attrs) {
    if (seen.insert(a).second) {
      out.push_back(a);
    }
  }
  return out;
}

}  // namespace

AttributeResolver::AttributeResolver(Evaluator & evaluator, Trace & trace)
: evaluator_(evaluator), trace_(trace)
{
}

Diagnostic AttributeResolver::eval_error(const std::string & attr, const std::string & package_set)
{
  return ReportBuilder(k_eval_error_rule, Severity::Warning)
    .message(fmt::format("Cannot evaluate attribute ‘{}’ in ‘{}’.", attr, package_set))
    .without_link()
    .build();
}

Diagnostic AttributeResolver::attr_path_not_found(
  const std::string & attr, const std::string & package_set)
{
  return ReportBuilder(k_attr_path_not_found_rule, Severity::Error)
    .message(fmt::format("Packages in ‘{}’ do not contain ‘{}’ attribute.", package_set, attr))
    .without_link()
    .build();
}

ResolveOutcome AttributeResolver::classify(const std::string & attr, const Json * entry)
{
  if (entry == nullptr || !entry->is_object()) {
    return ResolveFailed{};
  }

  const std::string where = "/" + attr;
  const auto status = optional_string(*entry, "status");
  if (status == "failed") {
    return ResolveFailed{};
  }
  if (status == "not-found") {
    return ResolveNotFound{};
  }

  Resolved resolved;
  resolved.descriptor.name = attr;
  resolved.descriptor.location = decode_position(*entry, where);

  if (auto drv = optional_string(*entry, "drvPath")) {
    resolved.descriptor.build_plan_path = std::move(*drv);
  }
  if (auto output = optional_string(*entry, "outputPath")) {
    std::error_code ec;
    if (fs::exists(*output, ec)) {
      resolved.descriptor.artifact_path = std::move(*output);
    }
  }

  const auto failed = entry->find("reportFailed");
  resolved.reports_failed = failed != entry->end() && failed->is_boolean() && failed->get<bool>();

  if (const auto report = entry->find("report"); report != entry->end() && !report->is_null()) {
    // A malformed self-check only costs this attribute its embedded reports
    try {
      resolved.diagnostics = decode_reports(*report, where + "/report");
    } catch (const DecodeError & e) {
      resolved.reports_failed = true;
      resolved.reports_error = e.what();
    }
  }

  return resolved;
}

ResolverResult AttributeResolver::resolve(EvalRequest request)
{
  const std::vector<std::string> requested = unique_attributes(request.attributes);

  // Paths that cannot be split never reach the evaluator; they are not found
  std::unordered_set<std::string> malformed;
  request.attributes.clear();
  for (const auto & attr : requested) {
    try {
      (void)split_attr_path(attr);
      request.attributes.push_back(attr);
    } catch (const std::invalid_argument & e) {
      trace_.log("{}: {}", attr, e.what());
      malformed.insert(attr);
    }
  }

  Json response = Json::object();
  if (!request.attributes.empty()) {
    trace_.log(
      "resolving {} attribute(s) with {} overlay(s)", request.attributes.size(),
      request.overlays.size());

    response = evaluator_.evaluate(build_eval_expression(request));
    if (!response.is_object()) {
      throw EvaluatorError(
        fmt::format("evaluator returned {} instead of an object", response.type_name()));
    }
  }

  const std::string package_set = request.package_set.string();

  ResolverResult result;
  for (const auto & attr : requested) {
    ResolveOutcome outcome = ResolveNotFound{};
    if (malformed.count(attr) == 0) {
      const auto it = response.find(attr);
      outcome = classify(attr, it == response.end() ? nullptr : &*it);
    }

    std::visit(
      Overloaded{
        [&](const ResolveFailed &) {
          trace_.log("{}: evaluation failed", attr);
          result.bundle.add(attr, eval_error(attr, package_set));
        },
        [&](const ResolveNotFound &) {
          trace_.log("{}: attribute not found", attr);
          result.bundle.add(attr, attr_path_not_found(attr, package_set));
        },
        [&](const Resolved & r) {
          if (r.reports_failed) {
            trace_.log(
              "{}: embedded reports failed to evaluate, treating as none{}", attr,
              r.reports_error.empty() ? "" : " (" + r.reports_error + ")");
          }
          trace_.log("{}: {} embedded report(s)", attr, r.diagnostics.size());
          result.bundle.append(attr, r.diagnostics);
          result.descriptors.push_back(r.descriptor);
        },
      },
      outcome);

    result.attributes.push_back(ResolvedAttribute{attr, std::move(outcome)});
  }

  return result;
}

}  // namespace hammer
