// hammer/report/report_printer.cpp - Annotated terminal output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "hammer/report/report_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>

#include "hammer/basic/error.hpp"
#include "hammer/basic/report_json.hpp"

namespace hammer
{

ReportPrinter::ReportPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  // Force rather than Auto: the CLI renders into a buffer, which rang would
  // not recognize as a terminal
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

void ReportPrinter::print(const std::string & attr, const std::vector<Diagnostic> & diags)
{
  print_attribute_header(attr);

  if (diags.empty()) {
    if (use_color_) {
      os_ << rang::fg::green << "No issues found." << rang::fg::reset << "\n";
    } else {
      fmt::print(os_, "No issues found.\n");
    }
    fmt::print(os_, "\n");
    return;
  }

  for (const auto & diag : diags) {
    print_severity_header(diag);
    print_message(diag.message);

    for (const auto & location : diag.locations) {
      print_location(location);
    }

    if (const auto url = documentation_url(diag)) {
      print_link(*url);
    }

    fmt::print(os_, "\n");
  }
}

void ReportPrinter::print_all(const DiagnosticBundle & bundle)
{
  for (const auto & [attr, diags] : bundle) {
    print(attr, diags);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void ReportPrinter::print_attribute_header(std::string_view attr)
{
  if (use_color_) {
    os_ << rang::style::bold << "When evaluating attribute ‘" << attr << "’:"
        << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "When evaluating attribute ‘{}’:\n", attr);
  }
}

void ReportPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Notice:
        os_ << rang::fg::cyan;
        break;
    }
    os_ << to_string(diag.severity) << ": " << diag.name << rang::fg::reset << rang::style::reset
        << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", to_string(diag.severity), diag.name);
  }
}

void ReportPrinter::print_message(std::string_view message)
{
  while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
    message.remove_suffix(1);
  }
  if (!message.empty()) {
    fmt::print(os_, "{}\n", message);
  }
}

void ReportPrinter::print_location(const SourceLocation & location)
{
  const SourceFile & source = sources_.load(location.file);

  if (location.line == 0 || location.line > source.line_count()) {
    throw RenderError(fmt::format(
      "line {} is out of range for {} ({} lines)", location.line, location.file.string(),
      source.line_count()));
  }
  // One past the last character marks the end of the line
  const size_t line_length = source.get_line(location.line - 1).size();
  if (location.column && *location.column > line_length + 1) {
    throw RenderError(fmt::format(
      "column {} is out of range for {}:{} ({} characters)", *location.column,
      location.file.string(), location.line, line_length));
  }

  // Relative path for cleaner output
  std::error_code ec;
  const auto rel_path =
    std::filesystem::relative(location.file, std::filesystem::current_path(), ec);
  const std::string filename =
    (ec || rel_path.empty() || rel_path.native().rfind("..", 0) == 0) ? location.file.string()
                                                                       : rel_path.string();

  if (location.column) {
    fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, location.line, *location.column);
  } else {
    fmt::print(os_, "{} {}:{}\n", gutter_arrow(), filename, location.line);
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  print_source_line(source, location.line, location.column.value_or(1));
}

void ReportPrinter::print_source_line(const SourceFile & source, uint32_t line, uint32_t column)
{
  const std::string_view text = source.get_line(line - 1);

  // Build cleaned line (tabs -> spaces)
  std::string cleaned_line;
  cleaned_line.reserve(text.size());
  for (const char c : text) {
    if (c == '\t') {
      cleaned_line += "    ";  // 4 spaces per tab
    } else {
      cleaned_line += c;
    }
  }

  // Print line number and source line
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>6} ", line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>6} | ", line);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  // Marker line; tabs before the column widen the prefix like above
  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t i = 0; visual_col < column; ++i, ++visual_col) {
    marker_prefix += (i < text.size() && text[i] == '\t') ? "    " : " ";
  }

  fmt::print(os_, "{} {}", gutter_pipe(), marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold << "^" << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "^");
  }
  fmt::print(os_, "\n");
}

void ReportPrinter::print_link(std::string_view url)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "        = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "see: {}\n", url);
  } else {
    fmt::print(os_, "        = see: {}\n", url);
  }
}

// =============================================================================
// Gutter helpers
// =============================================================================

std::string ReportPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{}-->{}", "\033[1;36m", "  ", "\033[0m");
  }
  return "  -->";
}

std::string ReportPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}        |{}", "\033[1;36m", "\033[0m");
  }
  return "        |";
}

// =============================================================================
// JSON
// =============================================================================

void print_json(std::ostream & os, const DiagnosticBundle & bundle)
{
  os << to_json(bundle).dump(2) << "\n";
}

}  // namespace hammer
