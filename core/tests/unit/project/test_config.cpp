// tests/unit/project/test_config.cpp - Unit tests for syntree.yaml loading

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "syntree/project/config.hpp"

using namespace syntree;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / name)
  {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & path, const std::string & content)
{
  std::ofstream out(path);
  out << content;
}

}  // namespace

TEST(ProjectConfig, DefaultsWhenEmpty)
{
  const auto result = parse_config("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.serialize.tokens, TokenFormat::Full);
  EXPECT_FALSE(result.config.dump.show_trivia);
  EXPECT_FALSE(result.config.dump.use_color);
  EXPECT_TRUE(result.config.verify.check_widths);
}

TEST(ProjectConfig, ParsesAllSections)
{
  const auto result = parse_config(
    "serialize:\n"
    "  tokens: compact\n"
    "dump:\n"
    "  show_trivia: true\n"
    "  color: true\n"
    "verify:\n"
    "  check_widths: false\n");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.serialize.tokens, TokenFormat::Compact);
  EXPECT_TRUE(result.config.dump.show_trivia);
  EXPECT_TRUE(result.config.dump.use_color);
  EXPECT_FALSE(result.config.verify.check_widths);
}

TEST(ProjectConfig, PartialSectionKeepsDefaults)
{
  const auto result = parse_config("dump:\n  show_trivia: yes\n");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.dump.show_trivia);
  EXPECT_FALSE(result.config.dump.use_color);
  EXPECT_EQ(result.config.serialize.tokens, TokenFormat::Full);
}

TEST(ProjectConfig, RejectsUnknownTokenFormat)
{
  const auto result = parse_config("serialize:\n  tokens: verbose\n");
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error, "invalid serialize.tokens: 'verbose' (must be 'full' or 'compact')");
}

TEST(ProjectConfig, RejectsBadValues)
{
  const auto badType = parse_config("verify:\n  check_widths: sometimes\n");
  ASSERT_FALSE(badType.success);
  EXPECT_EQ(badType.error.rfind("invalid configuration value: ", 0), 0U);

  const auto notMap = parse_config("- a\n- b\n");
  ASSERT_FALSE(notMap.success);
  EXPECT_EQ(notMap.error, "configuration root must be a map");

  const auto broken = parse_config("serialize: [unclosed\n");
  ASSERT_FALSE(broken.success);
  EXPECT_EQ(broken.error.rfind("failed to parse YAML: ", 0), 0U);
}

TEST(ProjectConfig, TokenFormatNames)
{
  EXPECT_EQ(token_format_from_name("full"), TokenFormat::Full);
  EXPECT_EQ(token_format_from_name("compact"), TokenFormat::Compact);
  EXPECT_FALSE(token_format_from_name("Full").has_value());
}

TEST(ProjectConfig, LoadFromFile)
{
  TempDir dir("syntree_config_load");
  const auto path = dir.path / k_config_file_name;
  write_file(path, "serialize:\n  tokens: compact\n");

  const auto result = load_config(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.serialize.tokens, TokenFormat::Compact);

  const auto missing = load_config(dir.path / "absent.yaml");
  ASSERT_FALSE(missing.success);
  EXPECT_EQ(missing.error.rfind("configuration file not found: ", 0), 0U);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  TempDir dir("syntree_config_find");
  const auto nested = dir.path / "a" / "b";
  std::filesystem::create_directories(nested);
  write_file(dir.path / k_config_file_name, "dump:\n  color: false\n");
  write_file(nested / "input.src", "x;\n");

  const auto fromDir = find_config(nested);
  ASSERT_TRUE(fromDir.has_value());
  EXPECT_EQ(*fromDir, std::filesystem::absolute(dir.path / k_config_file_name));

  const auto fromFile = find_config(nested / "input.src");
  ASSERT_TRUE(fromFile.has_value());
  EXPECT_EQ(*fromFile, *fromDir);
}

TEST(ProjectConfig, FileAndStringYieldSameConfig)
{
  const std::string text =
    "serialize:\n  tokens: compact\n"
    "dump:\n  show_trivia: true\n"
    "verify:\n  check_widths: false\n";
  TempDir dir("syntree_config_same");
  const auto path = dir.path / k_config_file_name;
  write_file(path, text);

  const auto fromFile = load_config(path);
  const auto fromString = parse_config(text);
  ASSERT_TRUE(fromFile.success) << fromFile.error;
  ASSERT_TRUE(fromString.success) << fromString.error;

  EXPECT_EQ(fromFile.config.serialize.tokens, fromString.config.serialize.tokens);
  EXPECT_EQ(fromFile.config.dump.show_trivia, fromString.config.dump.show_trivia);
  EXPECT_EQ(fromFile.config.dump.use_color, fromString.config.dump.use_color);
  EXPECT_EQ(fromFile.config.verify.check_widths, fromString.config.verify.check_widths);
  EXPECT_FALSE(fromFile.config.verify.check_widths);
}
