// namecheck/project/project_config.cpp - Project configuration implementation
//
#include "namecheck/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace namecheck
{

namespace
{

/// Parse the 'output' section into `out`.
bool parse_output(const YAML::Node & node, OutputConfig & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "output must be a map";
    return false;
  }

  if (node["format"]) {
    const auto value = node["format"].as<std::string>();
    const auto format = parse_output_format(value);
    if (!format) {
      error = "invalid output.format: '" + value + "' (must be 'text' or 'json')";
      return false;
    }
    out.format = *format;
  }

  if (node["color"]) {
    const auto value = node["color"].as<std::string>();
    const auto color = parse_color_mode(value);
    if (!color) {
      error = "invalid output.color: '" + value + "' (must be 'auto', 'always' or 'never')";
      return false;
    }
    out.color = *color;
  }

  if (node["show_source"]) {
    out.show_source = node["show_source"].as<bool>();
  }

  return true;
}

}  // namespace

std::optional<OutputFormat> parse_output_format(std::string_view s) noexcept
{
  if (s == "text") return OutputFormat::Text;
  if (s == "json") return OutputFormat::Json;
  return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(std::string_view s) noexcept
{
  if (s == "auto") return ColorMode::Auto;
  if (s == "always") return ColorMode::Always;
  if (s == "never") return ColorMode::Never;
  return std::nullopt;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // yaml-cpp reports both syntax errors and bad conversions (as<>) by throwing
  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());

    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
    }

    // Parse 'inputs' section
    if (root["inputs"]) {
      if (!root["inputs"].IsSequence()) {
        return ConfigLoadResult::fail("inputs must be a list");
      }
      for (const auto & input : root["inputs"]) {
        config.inputs.emplace_back(input.as<std::string>());
      }
    }

    // Parse 'output' section
    if (root["output"]) {
      std::string error;
      if (!parse_output(root["output"], config.output, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string starter_project_config(std::string_view package_name)
{
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "package" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << YAML::DoubleQuoted << std::string(package_name);
  out << YAML::EndMap;

  out << YAML::Key << "inputs" << YAML::Value << YAML::BeginSeq << "./decls.json" << YAML::EndSeq;

  out << YAML::Key << "output" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "format" << YAML::Value << "text";
  out << YAML::Key << "color" << YAML::Value << "auto";
  out << YAML::EndMap;

  out << YAML::EndMap;

  return "# Declaration dumps listed under 'inputs' are exported by the front-end\n" +
         std::string(out.c_str()) + "\n";
}

}  // namespace namecheck
