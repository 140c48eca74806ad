// hammer/basic/report.cpp - Diagnostic implementation
#include "hammer/basic/report.hpp"

#include <charconv>
#include <utility>

namespace hammer
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Notice:
      return "notice";
    case Severity::Warning:
      return "warning";
    case Severity::Error:
      return "error";
  }
  return "warning";
}

std::optional<Severity> parse_severity(std::string_view text) noexcept
{
  if (text == "notice") return Severity::Notice;
  if (text == "warning") return Severity::Warning;
  if (text == "error") return Severity::Error;
  return std::nullopt;
}

namespace
{

std::optional<uint32_t> parse_positive(std::string_view digits)
{
  if (digits.empty()) {
    return std::nullopt;
  }
  uint32_t value = 0;
  const auto * end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
  if (ec != std::errc() || ptr != end || value == 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<SourceLocation> parse_position(std::string_view position)
{
  const auto last = position.rfind(':');
  if (last == std::string_view::npos) {
    return std::nullopt;
  }

  const auto last_number = parse_positive(position.substr(last + 1));
  if (!last_number) {
    return std::nullopt;
  }

  // "file:line:column" when the component before the last one is numeric too
  const std::string_view head = position.substr(0, last);
  const auto prev = head.rfind(':');
  if (prev != std::string_view::npos) {
    if (const auto line = parse_positive(head.substr(prev + 1)); line && prev > 0) {
      return SourceLocation{std::string(head.substr(0, prev)), *line, *last_number};
    }
  }

  if (head.empty()) {
    return std::nullopt;
  }
  return SourceLocation{std::string(head), *last_number, std::nullopt};
}

std::optional<std::string> documentation_url(const Diagnostic & diag)
{
  if (!diag.has_documentation_link) {
    return std::nullopt;
  }
  std::string url(k_documentation_base_url);
  url += diag.name;
  url += ".md";
  return url;
}

// ============================================================================
// ReportBuilder
// ============================================================================

ReportBuilder::ReportBuilder(std::string name, Severity severity)
{
  diagnostic_.name = std::move(name);
  diagnostic_.severity = severity;
}

ReportBuilder & ReportBuilder::message(std::string text)
{
  diagnostic_.message = std::move(text);
  return *this;
}

ReportBuilder & ReportBuilder::at(SourceLocation location)
{
  diagnostic_.locations.push_back(std::move(location));
  return *this;
}

ReportBuilder & ReportBuilder::without_link()
{
  diagnostic_.has_documentation_link = false;
  return *this;
}

Diagnostic ReportBuilder::build() { return std::move(diagnostic_); }

}  // namespace hammer
