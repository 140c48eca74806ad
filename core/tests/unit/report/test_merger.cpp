// test_merger.cpp - Source-ordered concatenation of bundles

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "hammer/report/merger.hpp"

using hammer::CheckRun;
using hammer::Diagnostic;
using hammer::DiagnosticBundle;
using hammer::ReportBuilder;
using hammer::Severity;

namespace
{

Diagnostic diag(const std::string & name, Severity severity = Severity::Warning)
{
  return ReportBuilder(name, severity).message(name).build();
}

std::vector<std::string> names_of(const DiagnosticBundle & bundle, const std::string & attr)
{
  std::vector<std::string> out;
  if (const auto * diags = bundle.find(attr)) {
    for (const auto & d : *diags) {
      out.push_back(d.name);
    }
  }
  return out;
}

}  // namespace

TEST(Merger, ResolverThenBuiltinThenChecks)
{
  DiagnosticBundle resolver;
  resolver.add("pkgA", diag("embedded"));
  resolver.touch("pkgB");

  DiagnosticBundle builtin;
  builtin.add("pkgA", diag("no-build-output", Severity::Notice));

  DiagnosticBundle first;
  first.add("pkgB", diag("first-b"));
  first.add("pkgA", diag("first-a"));
  DiagnosticBundle second;
  second.add("pkgA", diag("second-a"));

  const DiagnosticBundle merged =
    hammer::merge(resolver, builtin, {CheckRun{"first", first}, CheckRun{"second", second}});

  EXPECT_EQ(merged.names(), (std::vector<std::string>{"pkgA", "pkgB"}));
  EXPECT_EQ(
    names_of(merged, "pkgA"),
    (std::vector<std::string>{"embedded", "no-build-output", "first-a", "second-a"}));
  EXPECT_EQ(names_of(merged, "pkgB"), (std::vector<std::string>{"first-b"}));
}

TEST(Merger, KeepsDuplicates)
{
  DiagnosticBundle resolver;
  resolver.add("pkgA", diag("same"));
  DiagnosticBundle check;
  check.add("pkgA", diag("same"));

  const DiagnosticBundle merged = hammer::merge(resolver, {}, {CheckRun{"c", check}});
  EXPECT_EQ(names_of(merged, "pkgA"), (std::vector<std::string>{"same", "same"}));
}

TEST(Merger, EmptyListsSurvive)
{
  DiagnosticBundle resolver;
  resolver.touch("clean");

  const DiagnosticBundle merged = hammer::merge(resolver, {}, {});
  ASSERT_TRUE(merged.contains("clean"));
  EXPECT_TRUE(merged.find("clean")->empty());
}

TEST(Merger, GenericFormConcatenatesInGivenOrder)
{
  DiagnosticBundle a;
  a.add("x", diag("1"));
  DiagnosticBundle b;
  b.add("y", diag("2"));
  b.add("x", diag("3"));

  const DiagnosticBundle merged = hammer::merge({&b, &a});
  EXPECT_EQ(merged.names(), (std::vector<std::string>{"y", "x"}));
  EXPECT_EQ(names_of(merged, "x"), (std::vector<std::string>{"3", "1"}));
}
