// hammer/basic/error.hpp - Fatal error types
//
// Per-attribute problems are reported as diagnostics. The exceptions below
// are reserved for conditions that abort the whole run.
//
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace hammer
{

/// Base of all fatal errors.
class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * A JSON payload does not match the report schema.
 *
 * `where` is a JSON-pointer-like path to the offending value, e.g.
 * "/pkgA/0/severity".
 */
class DecodeError : public Error
{
public:
  DecodeError(std::string where, const std::string & what)
  : Error(where.empty() ? what : where + ": " + what), where_(std::move(where))
  {
  }

  [[nodiscard]] const std::string & where() const noexcept { return where_; }

private:
  std::string where_;
};

/// The Nix evaluator could not be run or returned an unusable response.
class EvaluatorError : public Error
{
public:
  using Error::Error;
};

/**
 * An external check failed.
 *
 * Carries the check name and the exact payload written to its stdin so the
 * failure can be reproduced by hand.
 */
class PluginError : public Error
{
public:
  PluginError(std::string plugin, std::string input, const std::string & what)
  : Error("check '" + plugin + "' " + what), plugin_(std::move(plugin)), input_(std::move(input))
  {
  }

  [[nodiscard]] const std::string & plugin() const noexcept { return plugin_; }
  [[nodiscard]] const std::string & input() const noexcept { return input_; }

private:
  std::string plugin_;
  std::string input_;
};

/// A diagnostic location could not be rendered (missing file or line).
class RenderError : public Error
{
public:
  using Error::Error;
};

}  // namespace hammer
