// hammer/basic/bundle.hpp - Attribute name -> diagnostics mapping
//
// The bundle is the currency exchanged between the resolver, the external
// check protocol, the merger and the renderer.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "hammer/basic/report.hpp"

namespace hammer
{

/**
 * Ordered mapping from attribute name to its diagnostics.
 *
 * Iteration follows insertion order of the attribute names; the list of each
 * attribute keeps the order in which diagnostics were appended.
 */
class DiagnosticBundle
{
public:
  using Entry = std::pair<std::string, std::vector<Diagnostic>>;

  DiagnosticBundle() = default;

  DiagnosticBundle(const DiagnosticBundle &) = default;
  DiagnosticBundle & operator=(const DiagnosticBundle &) = default;
  DiagnosticBundle(DiagnosticBundle &&) = default;
  DiagnosticBundle & operator=(DiagnosticBundle &&) = default;

  /// Ensure `attr` is a key, returning its (possibly empty) list.
  std::vector<Diagnostic> & touch(std::string_view attr);

  /// Append one diagnostic to `attr`, creating the key if needed.
  void add(std::string_view attr, Diagnostic diag);

  /// Append a list of diagnostics to `attr`, creating the key if needed.
  void append(std::string_view attr, std::vector<Diagnostic> diags);

  // Accessors
  [[nodiscard]] bool contains(std::string_view attr) const;
  [[nodiscard]] const std::vector<Diagnostic> * find(std::string_view attr) const;
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] size_t size() const { return entries_.size(); }

  /// Total number of diagnostics across all attributes.
  [[nodiscard]] size_t diagnostic_count() const;

  [[nodiscard]] auto begin() const { return entries_.begin(); }
  [[nodiscard]] auto end() const { return entries_.end(); }

private:
  std::vector<Entry> entries_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace hammer
