// namecheck/decl/decl_enums.cpp - Spelling tables for kinds and modifiers
//
#include "namecheck/decl/decl_enums.hpp"

#include <array>
#include <utility>

namespace namecheck
{

namespace
{

constexpr std::array<std::pair<Modifier, std::string_view>, 12> k_modifier_spellings{{
  {Modifier::Public, "public"},
  {Modifier::Protected, "protected"},
  {Modifier::Private, "private"},
  {Modifier::Abstract, "abstract"},
  {Modifier::Default, "default"},
  {Modifier::Static, "static"},
  {Modifier::Final, "final"},
  {Modifier::Transient, "transient"},
  {Modifier::Volatile, "volatile"},
  {Modifier::Synchronized, "synchronized"},
  {Modifier::Native, "native"},
  {Modifier::Strictfp, "strictfp"},
}};

}  // namespace

std::string_view to_string(DeclKind kind) noexcept
{
  switch (kind) {
#define DECL_KIND_TYPE(Kind, Spelling) \
  case DeclKind::Kind:                 \
    return Spelling;
#include "namecheck/decl/decl_kinds.def"

#define DECL_KIND_EXECUTABLE(Kind, Spelling) \
  case DeclKind::Kind:                       \
    return Spelling;
#include "namecheck/decl/decl_kinds.def"

#define DECL_KIND_VARIABLE(Kind, Spelling) \
  case DeclKind::Kind:                     \
    return Spelling;
#include "namecheck/decl/decl_kinds.def"

#define DECL_KIND_OTHER(Kind, Spelling) \
  case DeclKind::Kind:                  \
    return Spelling;
#include "namecheck/decl/decl_kinds.def"
  }
  return "<unknown>";
}

std::optional<DeclKind> parse_decl_kind(std::string_view spelling) noexcept
{
#define DECL_KIND_TYPE(Kind, Spelling) \
  if (spelling == Spelling) return DeclKind::Kind;
#include "namecheck/decl/decl_kinds.def"

#define DECL_KIND_EXECUTABLE(Kind, Spelling) \
  if (spelling == Spelling) return DeclKind::Kind;
#include "namecheck/decl/decl_kinds.def"

#define DECL_KIND_VARIABLE(Kind, Spelling) \
  if (spelling == Spelling) return DeclKind::Kind;
#include "namecheck/decl/decl_kinds.def"

#define DECL_KIND_OTHER(Kind, Spelling) \
  if (spelling == Spelling) return DeclKind::Kind;
#include "namecheck/decl/decl_kinds.def"

  return std::nullopt;
}

std::string_view to_string(Modifier modifier) noexcept
{
  for (const auto & [m, spelling] : k_modifier_spellings) {
    if (m == modifier) return spelling;
  }
  return "<unknown>";
}

std::optional<Modifier> parse_modifier(std::string_view spelling) noexcept
{
  for (const auto & [m, s] : k_modifier_spellings) {
    if (s == spelling) return m;
  }
  return std::nullopt;
}

}  // namespace namecheck
