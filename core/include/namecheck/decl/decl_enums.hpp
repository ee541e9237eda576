// namecheck/decl/decl_enums.hpp - Declaration kind and modifier enumerations
//
// DeclKind is generated from decl_kinds.def. Kinds are grouped by category
// so category checks are range comparisons.
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace namecheck
{

// ============================================================================
// DeclKind - Identifies all declaration kinds
// ============================================================================

enum class DeclKind : uint8_t {
// === Types ===
#define DECL_KIND_TYPE(Kind, Spelling) Kind,
#include "namecheck/decl/decl_kinds.def"

// === Executables ===
#define DECL_KIND_EXECUTABLE(Kind, Spelling) Kind,
#include "namecheck/decl/decl_kinds.def"

// === Variables ===
#define DECL_KIND_VARIABLE(Kind, Spelling) Kind,
#include "namecheck/decl/decl_kinds.def"

// === Other ===
#define DECL_KIND_OTHER(Kind, Spelling) Kind,
#include "namecheck/decl/decl_kinds.def"
};

/**
 * Coarse grouping used for dispatch.
 */
enum class DeclCategory : uint8_t {
  Type,
  Executable,
  Variable,
  Other,
};

[[nodiscard]] constexpr bool is_type_kind(DeclKind k) noexcept
{
  return k >= DeclKind::Class && k <= DeclKind::Record;
}

[[nodiscard]] constexpr bool is_executable_kind(DeclKind k) noexcept
{
  return k >= DeclKind::Method && k <= DeclKind::InstanceInit;
}

[[nodiscard]] constexpr bool is_variable_kind(DeclKind k) noexcept
{
  return k >= DeclKind::Field && k <= DeclKind::ResourceVariable;
}

[[nodiscard]] constexpr DeclCategory category_of(DeclKind k) noexcept
{
  if (is_type_kind(k)) return DeclCategory::Type;
  if (is_executable_kind(k)) return DeclCategory::Executable;
  if (is_variable_kind(k)) return DeclCategory::Variable;
  return DeclCategory::Other;
}

/// Spelling of a kind as used in JSON dumps ("class", "enum_constant", ...).
[[nodiscard]] std::string_view to_string(DeclKind kind) noexcept;

/// Inverse of to_string(DeclKind). Returns nullopt for unknown spellings.
[[nodiscard]] std::optional<DeclKind> parse_decl_kind(std::string_view spelling) noexcept;

// ============================================================================
// Modifiers
// ============================================================================

enum class Modifier : uint8_t {
  Public,
  Protected,
  Private,
  Abstract,
  Default,
  Static,
  Final,
  Transient,
  Volatile,
  Synchronized,
  Native,
  Strictfp,
};

[[nodiscard]] std::string_view to_string(Modifier modifier) noexcept;
[[nodiscard]] std::optional<Modifier> parse_modifier(std::string_view spelling) noexcept;

/**
 * Small value-type set of modifiers (one bit per Modifier).
 */
class ModifierSet
{
public:
  constexpr ModifierSet() noexcept = default;

  constexpr ModifierSet(std::initializer_list<Modifier> mods) noexcept
  {
    for (const Modifier m : mods) {
      bits_ |= bit(m);
    }
  }

  constexpr ModifierSet & insert(Modifier m) noexcept
  {
    bits_ |= bit(m);
    return *this;
  }

  [[nodiscard]] constexpr bool contains(Modifier m) const noexcept { return (bits_ & bit(m)) != 0; }

  /// True if every modifier of `other` is also in this set.
  [[nodiscard]] constexpr bool contains_all(ModifierSet other) const noexcept
  {
    return (bits_ & other.bits_) == other.bits_;
  }

  [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

  friend constexpr bool operator==(ModifierSet a, ModifierSet b) noexcept
  {
    return a.bits_ == b.bits_;
  }
  friend constexpr bool operator!=(ModifierSet a, ModifierSet b) noexcept { return !(a == b); }

private:
  static constexpr uint16_t bit(Modifier m) noexcept
  {
    return static_cast<uint16_t>(1U << static_cast<unsigned>(m));
  }

  uint16_t bits_ = 0;
};

}  // namespace namecheck
