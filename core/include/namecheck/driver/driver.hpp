// namecheck/driver/driver.hpp - Check driver
//
// Single entry point for the load-and-check pipeline.
// Used by the CLI and can be embedded into other tools.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

#include "namecheck/basic/diagnostic.hpp"
#include "namecheck/decl/decl_context.hpp"
#include "namecheck/project/project_config.hpp"

namespace namecheck
{

// ============================================================================
// Check Options
// ============================================================================

struct CheckOptions
{
  /// Enable verbose progress output on std::cerr
  bool verbose = false;
};

// ============================================================================
// Check Result
// ============================================================================

struct CheckResult
{
  /// Whether every input was loaded. Naming warnings never clear this.
  bool success = false;

  /// Loading errors and naming warnings, in the order they were produced
  DiagnosticBag diagnostics;

  /// Owns the declarations the diagnostics point at
  std::unique_ptr<DeclContext> decls;

  /// Inputs that were loaded and checked
  std::vector<std::filesystem::path> checked_files;

  /// Number of declarations visited by the checker
  size_t visited_count = 0;
};

// ============================================================================
// Driver
// ============================================================================

/**
 * Loads declaration dumps and runs the NameChecker over them.
 *
 * Each input is checked as soon as it is loaded; a file that fails to load
 * is reported as an error and the remaining inputs are still checked.
 */
class Driver
{
public:
  /**
   * Check a single declaration dump.
   *
   * @param file Path to the JSON dump
   * @param options Check options
   */
  [[nodiscard]] static CheckResult check_file(
    const std::filesystem::path & file, const CheckOptions & options);

  /**
   * Check every input listed in a project configuration.
   */
  [[nodiscard]] static CheckResult check_project(
    const ProjectConfig & config, const CheckOptions & options);

private:
  static bool check_one(
    const std::filesystem::path & file, const CheckOptions & options, CheckResult & result);
};

}  // namespace namecheck
