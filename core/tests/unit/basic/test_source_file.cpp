// test_source_file.cpp - Line table and source cache

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "hammer/basic/error.hpp"
#include "hammer/basic/source_file.hpp"
#include "hammer/test_support/fixtures.hpp"

namespace fs = std::filesystem;

using hammer::SourceCache;
using hammer::SourceFile;

TEST(SourceFileLines, TrailingNewlineDoesNotStartLine)
{
  const SourceFile file("a.nix", "one\ntwo\n");
  EXPECT_EQ(file.line_count(), 2U);
  EXPECT_EQ(file.get_line(0), "one");
  EXPECT_EQ(file.get_line(1), "two");
  EXPECT_EQ(file.get_line(2), "");
}

TEST(SourceFileLines, LastLineWithoutNewline)
{
  const SourceFile file("a.nix", "one\r\ntwo");
  EXPECT_EQ(file.line_count(), 2U);
  EXPECT_EQ(file.get_line(0), "one");
  EXPECT_EQ(file.get_line(1), "two");
}

TEST(SourceFileLines, EmptyContent)
{
  const SourceFile file("a.nix", "");
  EXPECT_EQ(file.line_count(), 1U);
  EXPECT_EQ(file.get_line(0), "");
}

TEST(SourceFileCache, LoadsOnce)
{
  const fs::path dir = hammer::test_support::make_temp_dir("hammer_source_cache");
  const fs::path path = dir / "default.nix";
  hammer::test_support::write_file(path, "{ }\n");

  SourceCache cache;
  const SourceFile & first = cache.load(path);
  EXPECT_EQ(first.get_line(0), "{ }");

  // Cached content survives changes on disk
  hammer::test_support::write_file(path, "changed\n");
  const SourceFile & second = cache.load(path);
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(second.get_line(0), "{ }");

  fs::remove_all(dir);
}

TEST(SourceFileCache, MissingFileThrows)
{
  SourceCache cache;
  EXPECT_THROW((void)cache.load("/nonexistent/hammer/default.nix"), hammer::RenderError);

  const fs::path dir = hammer::test_support::make_temp_dir("hammer_source_dir");
  EXPECT_THROW((void)cache.load(dir), hammer::RenderError);
  fs::remove_all(dir);
}
