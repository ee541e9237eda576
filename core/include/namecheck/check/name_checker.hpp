// namecheck/check/name_checker.hpp - Naming convention checker over declaration trees
//
// Walks a forest of declarations depth-first (parent before children,
// siblings in order) and reports a warning for every name that does not
// follow the convention of its role:
// - types: UpperCamelCase
// - ordinary methods, fields, parameters, locals: lowerCamelCase
// - enum constants and constants: ALL_CAPS
// Ordinary methods named like their type get an extra warning.
//
#pragma once

#include <cstddef>
#include <gsl/span>

#include "namecheck/basic/diagnostic.hpp"
#include "namecheck/decl/decl.hpp"

namespace namecheck
{

class NameChecker
{
public:
  explicit NameChecker(DiagnosticSink * diags = nullptr) : diags_(diags) {}

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Check every root and its descendants.
   *
   * Warnings go to the sink as they are found. Counters are reset first,
   * so repeated runs over the same forest behave identically.
   */
  void check_all(gsl::span<const Decl * const> roots);

  /// Check a single subtree (counters are reset as for check_all).
  void check(const Decl & root);

  // ===========================================================================
  // Run Statistics
  // ===========================================================================

  [[nodiscard]] size_t visited_count() const noexcept { return visitedCount_; }
  [[nodiscard]] size_t warning_count() const noexcept { return warningCount_; }
  [[nodiscard]] bool has_warnings() const noexcept { return warningCount_ != 0; }

private:
  class NameScanner;

  void reset() noexcept;
  void check_name(const Decl & decl);
  void check_constructor_lookalike(const Decl & decl);
  void note_visited() noexcept { ++visitedCount_; }

  DiagnosticSink * diags_ = nullptr;
  size_t visitedCount_ = 0;
  size_t warningCount_ = 0;
};

}  // namespace namecheck
