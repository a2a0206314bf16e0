// vfilter/config/tool_config.cpp - Tool configuration implementation
//
#include "vfilter/config/tool_config.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace vfilter
{

namespace
{

/// Reads `section.key` when present. Returns false and fills `error` when the
/// value does not convert to T.
template <typename T>
bool read_scalar(
  const YAML::Node & section, const char * section_name, const char * key, T & out,
  const char * expected, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    error = std::string(section_name) + "." + key + " must be " + expected;
    return false;
  }
  try {
    out = node.as<T>();
  } catch (const YAML::Exception &) {
    error = std::string(section_name) + "." + key + " must be " + expected;
    return false;
  }
  return true;
}

/// The map under `name`, or an undefined node when the section is absent or
/// null. Fills `error` when the section is present but not a map.
YAML::Node read_section(const YAML::Node & root, const char * name, std::string & error)
{
  const YAML::Node section = root[name];
  if (!section || section.IsNull()) {
    return YAML::Node(YAML::NodeType::Undefined);
  }
  if (!section.IsMap()) {
    error = std::string(name) + " must be a map";
  }
  return section;
}

std::optional<OutputFormat> parse_output_format(const std::string & s)
{
  if (s == "filter") return OutputFormat::Filter;
  if (s == "sql") return OutputFormat::Sql;
  if (s == "ast") return OutputFormat::Ast;
  return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(const std::string & s)
{
  if (s == "auto") return ColorMode::Auto;
  if (s == "always") return ColorMode::Always;
  if (s == "never") return ColorMode::Never;
  return std::nullopt;
}

ConfigLoadResult parse_tool_config(const YAML::Node & root)
{
  ToolConfig config;
  std::string error;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'output' section
  const YAML::Node output = read_section(root, "output", error);
  if (!error.empty()) {
    return ConfigLoadResult::fail(error);
  }
  if (output) {
    std::string format;
    if (!read_scalar(output, "output", "format", format, "a string", error)) {
      return ConfigLoadResult::fail(error);
    }
    if (!format.empty()) {
      const auto f = parse_output_format(format);
      if (!f) {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + format + "' (must be 'filter', 'sql' or 'ast')");
      }
      config.output.format = *f;
    }
    if (!read_scalar(output, "output", "indent", config.output.indent, "an integer", error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'diagnostics' section
  const YAML::Node diagnostics = read_section(root, "diagnostics", error);
  if (!error.empty()) {
    return ConfigLoadResult::fail(error);
  }
  if (diagnostics) {
    std::string color;
    if (!read_scalar(diagnostics, "diagnostics", "color", color, "a string", error)) {
      return ConfigLoadResult::fail(error);
    }
    if (!color.empty()) {
      const auto m = parse_color_mode(color);
      if (!m) {
        return ConfigLoadResult::fail(
          "invalid diagnostics.color: '" + color + "' (must be 'auto', 'always' or 'never')");
      }
      config.diagnostics.color = *m;
    }
  }

  // Parse 'parser' section
  const YAML::Node parser = read_section(root, "parser", error);
  if (!error.empty()) {
    return ConfigLoadResult::fail(error);
  }
  if (parser) {
    int max_depth = static_cast<int>(config.parser.max_depth);
    if (!read_scalar(parser, "parser", "max_depth", max_depth, "an integer", error)) {
      return ConfigLoadResult::fail(error);
    }
    if (max_depth <= 0) {
      return ConfigLoadResult::fail("parser.max_depth must be positive");
    }
    config.parser.max_depth = static_cast<uint32_t>(max_depth);
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::string_view to_string(OutputFormat f) noexcept
{
  switch (f) {
    case OutputFormat::Filter:
      return "filter";
    case OutputFormat::Sql:
      return "sql";
    case OutputFormat::Ast:
      return "ast";
  }
  return "filter";
}

std::string_view to_string(ColorMode m) noexcept
{
  switch (m) {
    case ColorMode::Auto:
      return "auto";
    case ColorMode::Always:
      return "always";
    case ColorMode::Never:
      return "never";
  }
  return "auto";
}

ConfigLoadResult load_tool_config(const std::filesystem::path & config_path)
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

  auto result = parse_tool_config(root);
  if (result.success) {
    result.config.source_path = fs::absolute(config_path);
  }
  return result;
}

ConfigLoadResult load_tool_config_from_string(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_tool_config(root);
}

std::optional<std::filesystem::path> find_tool_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_tool_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace vfilter
