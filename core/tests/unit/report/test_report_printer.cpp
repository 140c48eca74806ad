// test_report_printer.cpp - Terminal and JSON rendering

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "hammer/basic/error.hpp"
#include "hammer/basic/report_json.hpp"
#include "hammer/report/report_printer.hpp"
#include "hammer/test_support/fixtures.hpp"

namespace fs = std::filesystem;

using hammer::DiagnosticBundle;
using hammer::ReportBuilder;
using hammer::ReportPrinter;
using hammer::Severity;
using hammer::SourceLocation;

namespace
{

class ReportPrinterTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    dir_ = hammer::test_support::make_temp_dir("hammer_printer");
    source_ = dir_ / "default.nix";
    hammer::test_support::write_file(
      source_,
      "{ stdenv, gettext }:\n"
      "\n"
      "stdenv.mkDerivation {\n"
      "  buildInputs = [ gettext ];\n"
      "}\n");
  }
  void TearDown() override { fs::remove_all(dir_); }

  /// File name as the printer shows it (relative only below the working directory)
  static std::string shown(const fs::path & p)
  {
    const fs::path rel = fs::relative(p, fs::current_path());
    return rel.native().rfind("..", 0) == 0 ? p.string() : rel.string();
  }

  fs::path dir_;
  fs::path source_;
};

}  // namespace

// ============================================================================
// Terminal output
// ============================================================================

TEST_F(ReportPrinterTest, CaretUnderColumn)
{
  DiagnosticBundle bundle;
  bundle.add(
    "hello", ReportBuilder("unused-dependency", Severity::Warning)
               .message("‘gettext’ is listed in buildInputs but never used.\n")
               .at(SourceLocation{source_, 4, 5U})
               .build());

  std::ostringstream out;
  ReportPrinter printer(out, false);
  printer.print_all(bundle);

  const std::string expected =
    "When evaluating attribute ‘hello’:\n"
    "warning: unused-dependency\n"
    "‘gettext’ is listed in buildInputs but never used.\n"
    "  --> " + shown(source_) + ":4:5\n"
    "        |\n"
    "      4 |   buildInputs = [ gettext ];\n"
    "        |     ^\n"
    "        |\n"
    "        = see: "
    "https://github.com/jtojnar/nixpkgs-hammering/blob/master/explanations/unused-dependency.md\n"
    "\n";
  EXPECT_EQ(out.str(), expected);
}

TEST_F(ReportPrinterTest, MissingColumnPointsAtLineStart)
{
  DiagnosticBundle bundle;
  bundle.add(
    "hello", ReportBuilder("explicit-phases", Severity::Error)
               .message("m")
               .at(SourceLocation{source_, 3, std::nullopt})
               .without_link()
               .build());

  std::ostringstream out;
  ReportPrinter printer(out, false);
  printer.print_all(bundle);

  const std::string text = out.str();
  EXPECT_NE(text.find("error: explicit-phases\n"), std::string::npos);
  EXPECT_NE(text.find("  --> " + shown(source_) + ":3\n"), std::string::npos);
  EXPECT_NE(text.find("      3 | stdenv.mkDerivation {\n        | ^\n"), std::string::npos);
  EXPECT_EQ(text.find("see:"), std::string::npos);
}

TEST_F(ReportPrinterTest, CleanAttribute)
{
  DiagnosticBundle bundle;
  bundle.touch("zlib");

  std::ostringstream out;
  ReportPrinter printer(out, false);
  printer.print_all(bundle);

  EXPECT_EQ(out.str(), "When evaluating attribute ‘zlib’:\nNo issues found.\n\n");
}

TEST_F(ReportPrinterTest, DiagnosticWithoutLocations)
{
  DiagnosticBundle bundle;
  bundle.add(
    "missingPkg", ReportBuilder("AttrPathNotFound", Severity::Error)
                    .message("Packages in ‘.’ do not contain ‘missingPkg’ attribute.")
                    .without_link()
                    .build());

  std::ostringstream out;
  ReportPrinter printer(out, false);
  printer.print_all(bundle);

  EXPECT_EQ(
    out.str(),
    "When evaluating attribute ‘missingPkg’:\n"
    "error: AttrPathNotFound\n"
    "Packages in ‘.’ do not contain ‘missingPkg’ attribute.\n"
    "\n");
}

TEST_F(ReportPrinterTest, TabsWidenTheCaretPrefix)
{
  const fs::path tabbed = dir_ / "tabbed.nix";
  hammer::test_support::write_file(tabbed, "\tx = 1;\n");

  DiagnosticBundle bundle;
  bundle.add(
    "a", ReportBuilder("r", Severity::Notice).message("m").at(SourceLocation{tabbed, 1, 2U}).build());

  std::ostringstream out;
  ReportPrinter printer(out, false);
  printer.print_all(bundle);

  EXPECT_NE(out.str().find("      1 |     x = 1;\n        |     ^\n"), std::string::npos);
}

TEST_F(ReportPrinterTest, ColorOnlyWhenRequested)
{
  DiagnosticBundle bundle;
  bundle.touch("zlib");

  std::ostringstream plain;
  ReportPrinter(plain, false).print_all(bundle);
  EXPECT_EQ(plain.str().find('\033'), std::string::npos);

  std::ostringstream colored;
  ReportPrinter(colored, true).print_all(bundle);
  EXPECT_NE(colored.str().find('\033'), std::string::npos);
}

// ============================================================================
// Render errors
// ============================================================================

TEST_F(ReportPrinterTest, MissingSourceFileThrows)
{
  DiagnosticBundle bundle;
  bundle.add(
    "hello", ReportBuilder("r", Severity::Warning)
               .message("m")
               .at(SourceLocation{dir_ / "gone.nix", 1, std::nullopt})
               .build());

  std::ostringstream out;
  ReportPrinter printer(out, false);
  EXPECT_THROW(printer.print_all(bundle), hammer::RenderError);
}

TEST_F(ReportPrinterTest, LineOutOfRangeThrows)
{
  DiagnosticBundle bundle;
  bundle.add(
    "hello",
    ReportBuilder("r", Severity::Warning).message("m").at(SourceLocation{source_, 6, 1U}).build());

  std::ostringstream out;
  ReportPrinter printer(out, false);
  EXPECT_THROW(printer.print_all(bundle), hammer::RenderError);
}

TEST_F(ReportPrinterTest, ColumnPastEndOfLineThrows)
{
  DiagnosticBundle bundle;
  bundle.add(
    "hello", ReportBuilder("r", Severity::Warning)
               .message("m")
               .at(SourceLocation{source_, 3, 4294967295U})
               .build());

  std::ostringstream out;
  ReportPrinter printer(out, false);
  EXPECT_THROW(printer.print_all(bundle), hammer::RenderError);
}

TEST_F(ReportPrinterTest, CaretAfterLastCharacter)
{
  // "stdenv.mkDerivation {" has 21 characters
  DiagnosticBundle bundle;
  bundle.add(
    "hello", ReportBuilder("r", Severity::Warning)
               .message("m")
               .at(SourceLocation{source_, 3, 22U})
               .without_link()
               .build());

  std::ostringstream out;
  ReportPrinter printer(out, false);
  printer.print_all(bundle);
  EXPECT_NE(
    out.str().find("      3 | stdenv.mkDerivation {\n        | " + std::string(21, ' ') + "^\n"),
    std::string::npos);
}

// ============================================================================
// JSON output
// ============================================================================

TEST(ReportJsonOutput, PrettyPrintedWithTrailingNewline)
{
  DiagnosticBundle bundle;
  bundle.add(
    "pkgA", ReportBuilder("no-build-output", Severity::Notice).message("m").without_link().build());
  bundle.touch("pkgB");

  std::ostringstream out;
  hammer::print_json(out, bundle);

  const std::string text = out.str();
  ASSERT_FALSE(text.empty());
  EXPECT_EQ(text.back(), '\n');
  EXPECT_NE(text.find("\n  \"pkgA\": ["), std::string::npos);
  EXPECT_LT(text.find("\"pkgA\""), text.find("\"pkgB\""));

  const hammer::Json parsed = hammer::Json::parse(text);
  EXPECT_EQ(parsed, hammer::to_json(bundle));
}
