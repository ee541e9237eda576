// namecheck/decl/json_reader.cpp - JSON declaration dump loader
//
#include "namecheck/decl/json_reader.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <vector>

namespace namecheck
{
namespace
{

using nlohmann::json;

// ============================================================================
// Field helpers
// ============================================================================

bool read_location(
  const json & j, const std::string & path, std::string_view inherited_file, DeclContext & ctx,
  SourceLocation & out, std::string & error)
{
  if (!j.is_object()) {
    error = fmt::format("{}/location: expected an object", path);
    return false;
  }

  out.file = inherited_file;
  if (const auto it = j.find("file"); it != j.end()) {
    if (!it->is_string()) {
      error = fmt::format("{}/location/file: expected a string", path);
      return false;
    }
    out.file = ctx.intern(it->get<std::string>());
  }

  for (const char * key : {"line", "column"}) {
    const auto it = j.find(key);
    if (it == j.end()) {
      continue;
    }
    if (!it->is_number_unsigned()) {
      error = fmt::format("{}/location/{}: expected a positive integer", path, key);
      return false;
    }
    const auto value = it->get<uint32_t>();
    if (std::string_view(key) == "line") {
      out.line = value;
    } else {
      out.column = value;
    }
  }
  return true;
}

bool read_modifiers(const json & j, const std::string & path, ModifierSet & out, std::string & error)
{
  if (!j.is_array()) {
    error = fmt::format("{}/modifiers: expected an array", path);
    return false;
  }

  for (size_t i = 0; i < j.size(); ++i) {
    const auto & m = j[i];
    if (!m.is_string()) {
      error = fmt::format("{}/modifiers/{}: expected a string", path, i);
      return false;
    }
    const auto modifier = parse_modifier(m.get<std::string>());
    if (!modifier) {
      error = fmt::format("{}/modifiers/{}: unknown modifier '{}'", path, i, m.get<std::string>());
      return false;
    }
    out.insert(*modifier);
  }
  return true;
}

Decl * build_decl(
  const json & j, const std::string & path, std::string_view inherited_file, DeclContext & ctx,
  std::string & error);

bool build_children(
  const json & j, const char * key, const std::string & path, std::string_view file,
  DeclContext & ctx, std::vector<Decl *> & out, std::string & error)
{
  const auto it = j.find(key);
  if (it == j.end()) {
    return true;
  }
  if (!it->is_array()) {
    error = fmt::format("{}/{}: expected an array", path, key);
    return false;
  }

  for (size_t i = 0; i < it->size(); ++i) {
    Decl * child = build_decl((*it)[i], fmt::format("{}/{}/{}", path, key, i), file, ctx, error);
    if (!child) {
      return false;
    }
    out.push_back(child);
  }
  return true;
}

// ============================================================================
// Declarations
// ============================================================================

Decl * build_decl(
  const json & j, const std::string & path, std::string_view inherited_file, DeclContext & ctx,
  std::string & error)
{
  if (!j.is_object()) {
    error = fmt::format("{}: expected an object", path);
    return nullptr;
  }

  const auto kind_it = j.find("kind");
  if (kind_it == j.end() || !kind_it->is_string()) {
    error = fmt::format("{}/kind: missing or not a string", path);
    return nullptr;
  }
  const auto kind = parse_decl_kind(kind_it->get<std::string>());
  if (!kind) {
    error = fmt::format("{}/kind: unknown declaration kind '{}'", path, kind_it->get<std::string>());
    return nullptr;
  }

  const auto name_it = j.find("name");
  if (name_it == j.end() || !name_it->is_string()) {
    error = fmt::format("{}/name: missing or not a string", path);
    return nullptr;
  }

  Decl * decl = ctx.create(*kind, name_it->get<std::string>());
  decl->location.file = inherited_file;

  if (const auto it = j.find("modifiers"); it != j.end()) {
    if (!read_modifiers(*it, path, decl->modifiers, error)) {
      return nullptr;
    }
  }

  if (const auto it = j.find("constant_value"); it != j.end()) {
    if (!it->is_boolean()) {
      error = fmt::format("{}/constant_value: expected a boolean", path);
      return nullptr;
    }
    decl->hasConstantValue = it->get<bool>();
  }

  if (const auto it = j.find("location"); it != j.end()) {
    if (!read_location(*it, path, inherited_file, ctx, decl->location, error)) {
      return nullptr;
    }
  }

  std::vector<Decl *> children;
  if (
    !build_children(j, "type_parameters", path, decl->location.file, ctx, children, error) ||
    !build_children(j, "members", path, decl->location.file, ctx, children, error)) {
    return nullptr;
  }
  ctx.set_children(decl, children);

  return decl;
}

}  // namespace

DeclLoadResult load_declarations(
  const nlohmann::json & doc, DeclContext & ctx, std::string_view default_file)
{
  if (!doc.is_object()) {
    return DeclLoadResult::fail("declaration dump must be a JSON object");
  }

  std::string_view file = ctx.intern(default_file);
  if (const auto it = doc.find("source"); it != doc.end()) {
    if (!it->is_string()) {
      return DeclLoadResult::fail("/source: expected a string");
    }
    file = ctx.intern(it->get<std::string>());
  }

  const auto decls_it = doc.find("declarations");
  if (decls_it == doc.end() || !decls_it->is_array()) {
    return DeclLoadResult::fail("/declarations: missing or not an array");
  }

  std::vector<Decl *> roots;
  roots.reserve(decls_it->size());
  for (size_t i = 0; i < decls_it->size(); ++i) {
    std::string error;
    Decl * root = build_decl((*decls_it)[i], fmt::format("/declarations/{}", i), file, ctx, error);
    if (!root) {
      return DeclLoadResult::fail(error);
    }
    roots.push_back(root);
  }

  for (Decl * root : roots) {
    ctx.add_root(root);
  }
  return DeclLoadResult::ok(roots.size());
}

DeclLoadResult load_declarations_text(
  std::string_view text, DeclContext & ctx, std::string_view default_file)
{
  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    return DeclLoadResult::fail("failed to parse JSON: " + std::string(e.what()));
  }
  return load_declarations(doc, ctx, default_file);
}

DeclLoadResult load_declarations_file(const std::filesystem::path & path, DeclContext & ctx)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return DeclLoadResult::fail("declaration file not found: " + path.string());
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return DeclLoadResult::fail("failed to open file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const std::string text = buffer.str();

  auto result = load_declarations_text(text, ctx);
  if (!result.success) {
    result.error = path.string() + ": " + result.error;
  }
  return result;
}

}  // namespace namecheck
