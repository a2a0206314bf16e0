// vfilter/config/tool_config.hpp - Tool configuration (vfilter.yaml)
//
// Settings shared by the command-line tool and embedders that want the same
// defaults. Every key is optional; unknown keys are ignored.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace vfilter
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat : uint8_t {
  Filter,  ///< Backend filter as JSON
  Sql,     ///< Canonical SQL-like text
  Ast,     ///< AST as JSON
};

enum class ColorMode : uint8_t {
  Auto,
  Always,
  Never,
};

[[nodiscard]] std::string_view to_string(OutputFormat f) noexcept;
[[nodiscard]] std::string_view to_string(ColorMode m) noexcept;

struct OutputConfig
{
  OutputFormat format = OutputFormat::Filter;

  /// JSON indent; zero or negative prints compact JSON
  int indent = 2;
};

struct DiagnosticsConfig
{
  ColorMode color = ColorMode::Auto;
};

struct ParserConfig
{
  uint32_t max_depth = 256;
};

/**
 * Complete tool configuration (vfilter.yaml).
 */
struct ToolConfig
{
  OutputConfig output;
  DiagnosticsConfig diagnostics;
  ParserConfig parser;

  /// File the configuration was read from; empty for defaults
  std::filesystem::path source_path;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ToolConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ToolConfig cfg)
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
 * Load a tool configuration from a vfilter.yaml file.
 *
 * @param config_path Path to vfilter.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_tool_config(const std::filesystem::path & config_path);

/// Same as load_tool_config(), reading YAML text from memory.
[[nodiscard]] ConfigLoadResult load_tool_config_from_string(std::string_view yaml_text);

/**
 * Find vfilter.yaml by searching upward from `start_dir` to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_tool_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_tool_config_file_name = "vfilter.yaml";

}  // namespace vfilter
