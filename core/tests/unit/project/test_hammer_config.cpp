// test_hammer_config.cpp - hammer.yaml loading and discovery

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "hammer/project/hammer_config.hpp"
#include "hammer/test_support/fixtures.hpp"

namespace fs = std::filesystem;

using hammer::test_support::write_file;

namespace
{

class HammerConfigTest : public ::testing::Test
{
protected:
  void SetUp() override { dir_ = hammer::test_support::make_temp_dir("hammer_config"); }
  void TearDown() override { fs::remove_all(dir_); }

  hammer::ConfigLoadResult load(const std::string & yaml)
  {
    const fs::path path = dir_ / "hammer.yaml";
    write_file(path, yaml);
    return hammer::load_hammer_config(path);
  }

  fs::path dir_;
};

}  // namespace

TEST_F(HammerConfigTest, FullFile)
{
  const auto result = load(
    "nixpkgs: ./nixpkgs\n"
    "overlays: /opt/hammer/overlays\n"
    "exclude:\n"
    "  - no-build-output\n"
    "  - explicit-phases\n"
    "evaluator: /run/current-system/sw/bin/nix-instantiate\n"
    "checks:\n"
    "  names: [unused-dependency, license-check]\n"
    "  path: [./checks, /usr/libexec/hammer]\n"
    "  jobs: 4\n"
    "  timeout: 30\n");

  ASSERT_TRUE(result.success) << result.error;
  const auto & config = result.config;

  EXPECT_EQ(config.project_root.string(), fs::absolute(dir_).string());
  ASSERT_TRUE(config.nixpkgs.has_value());
  EXPECT_EQ(config.nixpkgs->string(), (dir_ / "nixpkgs").lexically_normal().string());
  ASSERT_TRUE(config.overlays.has_value());
  EXPECT_EQ(config.overlays->string(), "/opt/hammer/overlays");
  EXPECT_EQ(config.exclude, (std::vector<std::string>{"no-build-output", "explicit-phases"}));
  EXPECT_EQ(config.evaluator, "/run/current-system/sw/bin/nix-instantiate");

  EXPECT_EQ(
    config.checks.names, (std::vector<std::string>{"unused-dependency", "license-check"}));
  ASSERT_EQ(config.checks.path.size(), 2U);
  EXPECT_EQ(config.checks.path[0].string(), (dir_ / "checks").lexically_normal().string());
  EXPECT_EQ(config.checks.path[1].string(), "/usr/libexec/hammer");
  EXPECT_EQ(config.checks.jobs, 4U);
  EXPECT_EQ(config.checks.timeout, 30U);
}

TEST_F(HammerConfigTest, EmptyFileGivesDefaults)
{
  const auto result = load("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_FALSE(result.config.nixpkgs.has_value());
  EXPECT_TRUE(result.config.exclude.empty());
  EXPECT_TRUE(result.config.checks.names.empty());
  EXPECT_FALSE(result.config.checks.jobs.has_value());
}

TEST_F(HammerConfigTest, RejectsBadShapes)
{
  EXPECT_FALSE(load("- just\n- a list\n").success);
  EXPECT_FALSE(load("exclude: no-build-output\n").success);
  EXPECT_FALSE(load("checks: [a, b]\n").success);
  EXPECT_FALSE(load("checks:\n  names: a\n").success);
  EXPECT_FALSE(load("checks:\n  jobs: many\n").success);
}

TEST_F(HammerConfigTest, RejectsInvalidYaml)
{
  const auto result = load("nixpkgs: [unclosed\n");
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error.empty());
}

TEST_F(HammerConfigTest, MissingFile)
{
  const auto result = hammer::load_hammer_config(dir_ / "absent.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST_F(HammerConfigTest, FoundFromSubdirectory)
{
  write_file(dir_ / "hammer.yaml", "exclude: []\n");
  const fs::path nested = dir_ / "pkgs" / "tools";
  fs::create_directories(nested);

  const auto found = hammer::find_hammer_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->string(), (fs::absolute(dir_) / "hammer.yaml").string());
}
