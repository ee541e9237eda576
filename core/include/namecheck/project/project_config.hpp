// namecheck/project/project_config.hpp - Project configuration (namecheck.yaml)
//
// Parses and validates namecheck.yaml project configuration files.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace namecheck
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat : uint8_t {
  Text,  ///< Rust-style human-readable diagnostics
  Json,  ///< One JSON document on stdout
};

enum class ColorMode : uint8_t {
  Auto,    ///< Color when stderr is a terminal
  Always,
  Never,
};

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view s) noexcept;
[[nodiscard]] std::optional<ColorMode> parse_color_mode(std::string_view s) noexcept;

/**
 * Output section.
 */
struct OutputConfig
{
  OutputFormat format = OutputFormat::Text;
  ColorMode color = ColorMode::Auto;

  /// Show the offending source line when the source file is readable
  bool show_source = true;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
};

/**
 * Complete project configuration (namecheck.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;

  /// Declaration dumps to check (relative to project_root unless absolute)
  std::vector<std::filesystem::path> inputs;

  OutputConfig output;

  /// Directory containing namecheck.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Input path resolved against project_root.
  [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path & input) const
  {
    return input.is_absolute() ? input : project_root / input;
  }
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
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
 * Load a project configuration from a namecheck.yaml file.
 *
 * @param config_path Path to namecheck.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find namecheck.yaml by searching upward from start_dir to the filesystem root.
 *
 * @return Path to namecheck.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Contents of a fresh namecheck.yaml for `package_name` (used by `init`).
 *
 * The name is emitted through yaml-cpp, so any quoting it needs is applied
 * and load_project_config() reads it back unchanged.
 */
[[nodiscard]] std::string starter_project_config(std::string_view package_name);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "namecheck.yaml";

}  // namespace namecheck
