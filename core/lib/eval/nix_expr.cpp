// hammer/eval/nix_expr.cpp - Nix expression builder
//
#include "hammer/eval/nix_expr.hpp"

#include <fmt/core.h>

#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace hammer
{

std::string nix_string(std::string_view text)
{
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '$':
        // "${" would start an interpolation
        if (i + 1 < text.size() && text[i + 1] == '{') {
          out += "\\$";
        } else {
          out += '$';
        }
        break;
      default:
        out += c;
        break;
    }
  }
  out.push_back('"');
  return out;
}

std::vector<std::string> split_attr_path(std::string_view path)
{
  std::vector<std::string> segments;
  std::string current;
  bool quoted_segment = false;

  size_t i = 0;
  while (i <= path.size()) {
    if (i == path.size() || path[i] == '.') {
      if (current.empty() && !quoted_segment) {
        throw std::invalid_argument(fmt::format("empty segment in attribute path '{}'", path));
      }
      segments.push_back(std::move(current));
      current.clear();
      quoted_segment = false;
      ++i;
      continue;
    }

    if (path[i] == '"' && current.empty() && !quoted_segment) {
      ++i;
      bool closed = false;
      while (i < path.size()) {
        if (path[i] == '\\' && i + 1 < path.size()) {
          current += path[i + 1];
          i += 2;
        } else if (path[i] == '"') {
          closed = true;
          ++i;
          break;
        } else {
          current += path[i++];
        }
      }
      if (!closed) {
        throw std::invalid_argument(fmt::format("unterminated quote in attribute path '{}'", path));
      }
      if (i < path.size() && path[i] != '.') {
        throw std::invalid_argument(
          fmt::format("unexpected character after quoted segment in '{}'", path));
      }
      quoted_segment = true;
      continue;
    }

    current += path[i++];
  }

  return segments;
}

namespace
{

std::string absolute_string(const fs::path & p)
{
  std::error_code ec;
  const fs::path abs = fs::absolute(p, ec);
  return (ec ? p : abs).lexically_normal().string();
}

std::string nix_list(const std::vector<std::string> & items)
{
  std::string out = "[";
  for (const auto & item : items) {
    out += ' ';
    out += nix_string(item);
  }
  out += " ]";
  return out;
}

}  // namespace

std::string build_eval_expression(const EvalRequest & request)
{
  std::string overlays;
  for (const auto & overlay : request.overlays) {
    overlays += fmt::format("      (import {})\n", nix_string(absolute_string(overlay)));
  }

  std::string attrs;
  for (const auto & attr : request.attributes) {
    attrs += fmt::format("  {} = resolve {};\n", nix_string(attr), nix_list(split_attr_path(attr)));
  }

  const std::string state = nix_string(request.state_attribute);

  return fmt::format(
    R"(let
  pkgs = import {package_set} {{
    overlays = [
{overlays}    ];
  }};
  attempt = e: let r = builtins.tryEval e; in if r.success then r.value else null;
  resolve = path:
    let
      result = builtins.tryEval (pkgs.lib.attrByPath path null pkgs);
      value = result.value;
      reports = builtins.tryEval (
        let r = value.{state}.reports or [ ]; in builtins.deepSeq r r);
    in
      if !result.success then {{ status = "failed"; }}
      else if value == null then {{ status = "not-found"; }}
      else {{
        status = "resolved";
        report = if reports.success then reports.value else [ ];
        reportFailed = !reports.success;
        location = attempt (value.meta.position or null);
        outputPath = attempt (value.outPath or null);
        drvPath = attempt (value.drvPath or null);
      }};
in
{{
{attrs}}}
)",
    fmt::arg("package_set", nix_string(absolute_string(request.package_set))),
    fmt::arg("overlays", overlays), fmt::arg("state", state), fmt::arg("attrs", attrs));
}

}  // namespace hammer
