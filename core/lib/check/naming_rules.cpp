// namecheck/check/naming_rules.cpp - Naming convention rules
//
#include "namecheck/check/naming_rules.hpp"

#include <fmt/core.h>

#include "namecheck/basic/unicode.hpp"
#include "namecheck/decl/decl.hpp"

namespace namecheck
{

// ============================================================================
// Rules
// ============================================================================

std::optional<NamingViolation> check_camel_case(std::string_view name, bool require_initial_upper)
{
  CodePointReader reader(name);
  if (reader.at_end()) {
    return NamingViolation::NotCamelCase;
  }

  const char32_t first = reader.next();
  bool previous_upper = false;

  if (is_upper(first)) {
    if (!require_initial_upper) {
      return NamingViolation::ShouldStartLowercase;
    }
    previous_upper = true;
  } else if (is_lower(first)) {
    if (require_initial_upper) {
      return NamingViolation::ShouldStartUppercase;
    }
  } else {
    return NamingViolation::NotCamelCase;
  }

  while (!reader.at_end()) {
    const char32_t cp = reader.next();
    if (is_upper(cp)) {
      if (previous_upper) {
        return NamingViolation::NotCamelCase;
      }
      previous_upper = true;
    } else {
      previous_upper = false;
    }
  }

  return std::nullopt;
}

std::optional<NamingViolation> check_all_caps(std::string_view name)
{
  CodePointReader reader(name);
  if (reader.at_end() || !is_upper(reader.next())) {
    return NamingViolation::NotAllCaps;
  }

  bool previous_underscore = false;
  while (!reader.at_end()) {
    const char32_t cp = reader.next();
    if (cp == U'_') {
      if (previous_underscore) {
        return NamingViolation::NotAllCaps;
      }
      previous_underscore = true;
      continue;
    }

    previous_underscore = false;
    if (!is_upper(cp) && !is_digit(cp)) {
      return NamingViolation::NotAllCaps;
    }
  }

  return std::nullopt;
}

std::optional<NamingViolation> check_convention(std::string_view name, ConventionKind convention)
{
  switch (convention) {
    case ConventionKind::UpperCamelCase:
      return check_camel_case(name, true);
    case ConventionKind::LowerCamelCase:
      return check_camel_case(name, false);
    case ConventionKind::AllCapsUnderscore:
      return check_all_caps(name);
  }
  return std::nullopt;
}

// ============================================================================
// Classification
// ============================================================================

ConstantFacts ConstantFacts::of(const Decl & decl) noexcept
{
  ConstantFacts facts;
  facts.kind = decl.kind;
  facts.enclosingKind = decl.enclosing_kind();
  facts.modifiers = decl.modifiers;
  facts.hasConstantValue = decl.hasConstantValue;
  return facts;
}

bool is_heuristically_constant(const ConstantFacts & facts) noexcept
{
  if (facts.enclosingKind == DeclKind::Interface) {
    return true;
  }
  if (
    facts.kind == DeclKind::Field &&
    facts.modifiers.contains_all({Modifier::Public, Modifier::Static, Modifier::Final})) {
    return true;
  }
  return facts.hasConstantValue;
}

std::optional<ConventionKind> convention_for(const Decl & decl) noexcept
{
  switch (decl.get_category()) {
    case DeclCategory::Type:
      return ConventionKind::UpperCamelCase;

    case DeclCategory::Executable:
      if (decl.kind == DeclKind::Method) {
        return ConventionKind::LowerCamelCase;
      }
      return std::nullopt;

    case DeclCategory::Variable:
      if (decl.kind == DeclKind::EnumConstant || is_heuristically_constant(ConstantFacts::of(decl))) {
        return ConventionKind::AllCapsUnderscore;
      }
      return ConventionKind::LowerCamelCase;

    case DeclCategory::Other:
      return std::nullopt;
  }
  return std::nullopt;
}

bool shares_enclosing_type_name(const Decl & decl) noexcept
{
  return decl.kind == DeclKind::Method && decl.enclosing != nullptr &&
         decl.name == decl.enclosing->name;
}

// ============================================================================
// Presentation
// ============================================================================

const char * violation_code(NamingViolation violation) noexcept
{
  switch (violation) {
    case NamingViolation::ShouldStartUppercase:
      return "N001";
    case NamingViolation::ShouldStartLowercase:
      return "N002";
    case NamingViolation::NotCamelCase:
      return "N003";
    case NamingViolation::NotAllCaps:
      return "N004";
  }
  return "N000";
}

std::string violation_message(NamingViolation violation, std::string_view name)
{
  switch (violation) {
    case NamingViolation::ShouldStartUppercase:
      return fmt::format("name '{}' should start with an uppercase letter", name);
    case NamingViolation::ShouldStartLowercase:
      return fmt::format("name '{}' should start with a lowercase letter", name);
    case NamingViolation::NotCamelCase:
      return fmt::format("name '{}' should follow camelCase", name);
    case NamingViolation::NotAllCaps:
      return fmt::format(
        "constant '{}' should be all uppercase letters or underscores, starting with a letter",
        name);
  }
  return fmt::format("name '{}' does not follow naming conventions", name);
}

std::string convention_help(ConventionKind convention)
{
  switch (convention) {
    case ConventionKind::UpperCamelCase:
      return "type names use UpperCamelCase with no two capitals in a row, e.g. 'HttpServer'";
    case ConventionKind::LowerCamelCase:
      return "use lowerCamelCase with no two capitals in a row, e.g. 'parseUrl'";
    case ConventionKind::AllCapsUnderscore:
      return "constants use uppercase words separated by single underscores, e.g. 'MAX_SIZE'";
  }
  return {};
}

std::string constructor_lookalike_message(std::string_view name)
{
  return fmt::format(
    "ordinary method '{}' should not share the name of its type, it may be confused with a "
    "constructor",
    name);
}

}  // namespace namecheck
