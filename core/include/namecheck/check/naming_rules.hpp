// namecheck/check/naming_rules.hpp - Naming convention rules
//
// Pure functions: given a name (and, for classification, a snapshot of a
// declaration's facts) they decide which convention applies and whether the
// name follows it. Nothing here reports diagnostics; NameChecker does that.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "namecheck/decl/decl_enums.hpp"

namespace namecheck
{

class Decl;

// ============================================================================
// Conventions and Violations
// ============================================================================

enum class ConventionKind : uint8_t {
  UpperCamelCase,     ///< Types: HttpServer
  LowerCamelCase,     ///< Methods, fields, variables: parseLine
  AllCapsUnderscore,  ///< Constants and enum constants: MAX_SIZE
};

enum class NamingViolation : uint8_t {
  ShouldStartUppercase,  ///< camelCase name starting lowercase where uppercase is required
  ShouldStartLowercase,  ///< camelCase name starting uppercase where lowercase is required
  NotCamelCase,          ///< bad first character or two consecutive uppercase letters
  NotAllCaps,            ///< constant not made of uppercase, digits and single underscores
};

// ============================================================================
// Rules
// ============================================================================

/**
 * Check a camelCase name.
 *
 * The first code point decides the start: uppercase when lowercase is
 * required (or the reverse) fails immediately with the matching
 * ShouldStart* violation. A first code point that is neither uppercase nor
 * lowercase (digit, '_', uncased letter, empty name) yields NotCamelCase.
 * Otherwise two consecutive uppercase code points anywhere yield
 * NotCamelCase, so acronym runs like "parseURL" are rejected.
 *
 * @return The violation, or nullopt if the name conforms
 */
[[nodiscard]] std::optional<NamingViolation> check_camel_case(
  std::string_view name, bool require_initial_upper);

/**
 * Check an ALL_CAPS constant name.
 *
 * The first code point must be uppercase; every following code point must be
 * uppercase, a digit, or an underscore not directly after another one.
 */
[[nodiscard]] std::optional<NamingViolation> check_all_caps(std::string_view name);

/// Apply the rule for `convention` to `name`.
[[nodiscard]] std::optional<NamingViolation> check_convention(
  std::string_view name, ConventionKind convention);

// ============================================================================
// Classification
// ============================================================================

/**
 * Facts about a variable declaration that decide whether it is a constant.
 */
struct ConstantFacts
{
  DeclKind kind = DeclKind::Field;
  std::optional<DeclKind> enclosingKind;
  ModifierSet modifiers;
  bool hasConstantValue = false;

  [[nodiscard]] static ConstantFacts of(const Decl & decl) noexcept;
};

/**
 * Decide whether a variable should be named like a constant.
 *
 * First match wins:
 * 1. member of an interface
 * 2. field that is public, static and final
 * 3. has a known compile-time constant value
 */
[[nodiscard]] bool is_heuristically_constant(const ConstantFacts & facts) noexcept;

/**
 * Convention expected for a declaration, or nullopt if its name is not
 * checked (constructors, initializer blocks, type parameters, packages).
 */
[[nodiscard]] std::optional<ConventionKind> convention_for(const Decl & decl) noexcept;

/// True if `decl` is an ordinary method named exactly like its enclosing declaration.
[[nodiscard]] bool shares_enclosing_type_name(const Decl & decl) noexcept;

// ============================================================================
// Presentation
// ============================================================================

/// Stable diagnostic code for a violation ("N001".."N004").
[[nodiscard]] const char * violation_code(NamingViolation violation) noexcept;

/// Diagnostic code for an ordinary method named like its type.
inline constexpr const char * k_constructor_lookalike_code = "N005";

[[nodiscard]] std::string violation_message(NamingViolation violation, std::string_view name);

[[nodiscard]] std::string convention_help(ConventionKind convention);

[[nodiscard]] std::string constructor_lookalike_message(std::string_view name);

}  // namespace namecheck
