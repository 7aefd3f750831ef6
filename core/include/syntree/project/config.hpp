// syntree/project/config.hpp - Tool configuration (syntree.yaml)
//
// Default options for serialization, dumping and verification, read from a
// syntree.yaml file next to the sources.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "syntree/ast/json_serializer.hpp"
#include "syntree/ast/tree_dumper.hpp"
#include "syntree/ast/tree_verifier.hpp"

namespace syntree
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete configuration (syntree.yaml).
 *
 * @code
 *   serialize:
 *     tokens: compact      # full | compact
 *   dump:
 *     show_trivia: true
 *     color: false
 *   verify:
 *     check_widths: true
 * @endcode
 */
struct SyntreeConfig
{
  SerializeOptions serialize;
  DumpOptions dump;
  VerifyOptions verify;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  SyntreeConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(SyntreeConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load configuration from a syntree.yaml file.
 *
 * Missing sections and keys keep their defaults. An unknown token format or
 * a value of the wrong type fails the load.
 */
[[nodiscard]] ConfigLoadResult load_config(const std::filesystem::path & config_path);

/// Parse configuration from YAML text
[[nodiscard]] ConfigLoadResult parse_config(std::string_view yaml);

/**
 * Find syntree.yaml by searching upward from start_dir (or its parent, if
 * start_dir is a file) to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_config(
  const std::filesystem::path & start_dir);

[[nodiscard]] std::optional<TokenFormat> token_format_from_name(std::string_view name) noexcept;

inline constexpr const char * k_config_file_name = "syntree.yaml";

}  // namespace syntree
