// namecheck/test_support/decl_builders.hpp - helpers for building declaration trees in tests
//
// Trees are described as nested DeclShape values and materialized into a
// DeclContext, so tests read like the declarations they model:
//
//   auto * root = build(ctx, cls("Parser", {field("MAX_SIZE", {Modifier::Public,
//     Modifier::Static, Modifier::Final}), method("parse", {param("input")})}));
//
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "namecheck/basic/diagnostic.hpp"
#include "namecheck/decl/decl_context.hpp"

namespace namecheck::test_support
{

struct DeclShape
{
  DeclKind kind = DeclKind::Class;
  std::string name;
  ModifierSet modifiers;
  bool constant = false;
  std::vector<DeclShape> members;
};

inline DeclShape decl(DeclKind kind, std::string name, std::vector<DeclShape> members = {})
{
  DeclShape s;
  s.kind = kind;
  s.name = std::move(name);
  s.members = std::move(members);
  return s;
}

inline DeclShape cls(std::string name, std::vector<DeclShape> members = {})
{
  return decl(DeclKind::Class, std::move(name), std::move(members));
}

inline DeclShape iface(std::string name, std::vector<DeclShape> members = {})
{
  return decl(DeclKind::Interface, std::move(name), std::move(members));
}

inline DeclShape enm(std::string name, std::vector<DeclShape> members = {})
{
  return decl(DeclKind::Enum, std::move(name), std::move(members));
}

inline DeclShape method(std::string name, std::vector<DeclShape> params = {})
{
  return decl(DeclKind::Method, std::move(name), std::move(params));
}

inline DeclShape ctor(std::string name, std::vector<DeclShape> params = {})
{
  return decl(DeclKind::Constructor, std::move(name), std::move(params));
}

inline DeclShape field(std::string name, ModifierSet modifiers = {}, bool constant = false)
{
  DeclShape s = decl(DeclKind::Field, std::move(name));
  s.modifiers = modifiers;
  s.constant = constant;
  return s;
}

inline DeclShape enum_constant(std::string name)
{
  return decl(DeclKind::EnumConstant, std::move(name));
}

inline DeclShape param(std::string name) { return decl(DeclKind::Parameter, std::move(name)); }

inline DeclShape local(std::string name, bool constant = false)
{
  DeclShape s = decl(DeclKind::LocalVariable, std::move(name));
  s.constant = constant;
  return s;
}

inline DeclShape type_param(std::string name)
{
  return decl(DeclKind::TypeParameter, std::move(name));
}

inline const ModifierSet k_public_static_final{Modifier::Public, Modifier::Static, Modifier::Final};

/// Materialize `shape` (and its members) into `ctx`. Does not register a root.
inline Decl * build(DeclContext & ctx, const DeclShape & shape)
{
  Decl * d = ctx.create(shape.kind, shape.name);
  d->modifiers = shape.modifiers;
  d->hasConstantValue = shape.constant;

  std::vector<Decl *> children;
  children.reserve(shape.members.size());
  for (const auto & m : shape.members) {
    children.push_back(build(ctx, m));
  }
  ctx.set_children(d, children);
  return d;
}

/// Build `shape` and register it as a root.
inline Decl * build_root(DeclContext & ctx, const DeclShape & shape)
{
  Decl * d = build(ctx, shape);
  ctx.add_root(d);
  return d;
}

/// Diagnostic codes in emission order.
inline std::vector<std::string> codes(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const auto & d : diags) {
    out.push_back(d.code);
  }
  return out;
}

/// Names of the offending declarations in emission order.
inline std::vector<std::string> flagged_names(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const auto & d : diags) {
    out.emplace_back(d.decl != nullptr ? std::string(d.decl->name) : std::string());
  }
  return out;
}

}  // namespace namecheck::test_support
