// namecheck/decl/decl.hpp - Declaration tree node
//
// A Decl is one named program construct (type, method, field, constant...)
// as delivered by the front-end. Nodes are created and owned by DeclContext.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string_view>

#include "namecheck/basic/source_location.hpp"
#include "namecheck/decl/decl_enums.hpp"

namespace namecheck
{

/**
 * Declaration node.
 *
 * Every Decl has:
 * - A DeclKind (closed enumeration, see decl_kinds.def)
 * - A simple name (UTF-8, possibly empty if the front-end could not name it)
 * - Modifiers and the "has compile-time constant value" flag
 * - The enclosing declaration (nullptr for roots) and ordered children
 *
 * Nodes are non-copyable and trivially destructible; all storage (name,
 * children array, file name) lives in the owning DeclContext arena.
 */
class Decl
{
public:
  const DeclKind kind;
  std::string_view name;
  ModifierSet modifiers;
  bool hasConstantValue = false;
  SourceLocation location;

  /// Containing declaration, set by DeclContext::set_children.
  const Decl * enclosing = nullptr;

  /// Nested declarations in source order (type parameters first, then members).
  gsl::span<Decl *> children;

  Decl(DeclKind k, std::string_view n) : kind(k), name(n) {}

  Decl(const Decl &) = delete;
  Decl & operator=(const Decl &) = delete;
  Decl(Decl &&) = delete;
  Decl & operator=(Decl &&) = delete;
  ~Decl() = default;

  [[nodiscard]] DeclCategory get_category() const noexcept { return category_of(kind); }

  [[nodiscard]] std::optional<DeclKind> enclosing_kind() const noexcept
  {
    if (enclosing == nullptr) return std::nullopt;
    return enclosing->kind;
  }

  /// Simple name of the enclosing declaration, empty for roots.
  [[nodiscard]] std::string_view enclosing_name() const noexcept
  {
    return enclosing != nullptr ? enclosing->name : std::string_view{};
  }
};

}  // namespace namecheck
