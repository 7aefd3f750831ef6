// syntree/project/config.cpp - syntree.yaml loading
//
#include "syntree/project/config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

namespace syntree
{

namespace
{

ConfigLoadResult build_config(const YAML::Node & root)
{
  SyntreeConfig config;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    // Parse 'serialize' section
    if (const auto ser = root["serialize"]) {
      if (ser["tokens"]) {
        const auto name = ser["tokens"].as<std::string>();
        const auto format = token_format_from_name(name);
        if (!format) {
          return ConfigLoadResult::fail(
            "invalid serialize.tokens: '" + name + "' (must be 'full' or 'compact')");
        }
        config.serialize.tokens = *format;
      }
    }

    // Parse 'dump' section
    if (const auto dump = root["dump"]) {
      if (dump["show_trivia"]) {
        config.dump.show_trivia = dump["show_trivia"].as<bool>();
      }
      if (dump["color"]) {
        config.dump.use_color = dump["color"].as<bool>();
      }
    }

    // Parse 'verify' section
    if (const auto verify = root["verify"]) {
      if (verify["check_widths"]) {
        config.verify.check_widths = verify["check_widths"].as<bool>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::optional<TokenFormat> token_format_from_name(std::string_view name) noexcept
{
  if (name == "full") return TokenFormat::Full;
  if (name == "compact") return TokenFormat::Compact;
  return std::nullopt;
}

ConfigLoadResult parse_config(std::string_view yaml)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return build_config(root);
}

ConfigLoadResult load_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return build_config(root);
}

std::optional<std::filesystem::path> find_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;  // filesystem root
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace syntree
