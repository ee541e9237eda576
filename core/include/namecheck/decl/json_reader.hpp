// namecheck/decl/json_reader.hpp - Load declaration trees from JSON dumps
//
// A front-end exports its declarations as JSON; this reader rebuilds the
// forest inside a DeclContext.
//
// {
//   "source": "Parser.java",
//   "declarations": [
//     { "kind": "class", "name": "Parser", "modifiers": ["public"],
//       "location": { "file": "Parser.java", "line": 3, "column": 14 },
//       "type_parameters": [ { "kind": "type_parameter", "name": "T" } ],
//       "members": [
//         { "kind": "field", "name": "MAX_SIZE",
//           "modifiers": ["public", "static", "final"], "constant_value": true }
//       ] }
//   ]
// }
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "namecheck/decl/decl_context.hpp"

namespace namecheck
{

/**
 * Result of loading a declaration dump.
 */
struct DeclLoadResult
{
  /// Whether loading succeeded
  bool success = false;

  /// Number of root declarations added to the context
  size_t root_count = 0;

  /// Error message if loading failed
  std::string error;

  static DeclLoadResult ok(size_t roots)
  {
    DeclLoadResult r;
    r.success = true;
    r.root_count = roots;
    return r;
  }

  static DeclLoadResult fail(std::string msg)
  {
    DeclLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Add the declarations of a parsed dump to `ctx` as new roots.
 *
 * On failure the context may hold partially built nodes, but no roots from
 * this document are registered.
 *
 * A location without "file" inherits the file of its enclosing declaration;
 * for roots it falls back to the document's "source" key, then `default_file`.
 *
 * @param doc Parsed JSON document (object with a "declarations" array)
 * @param ctx Context receiving the nodes
 * @param default_file File name used when nothing else names one
 */
[[nodiscard]] DeclLoadResult load_declarations(
  const nlohmann::json & doc, DeclContext & ctx, std::string_view default_file = {});

/// Parse `text` as JSON and load it with load_declarations().
[[nodiscard]] DeclLoadResult load_declarations_text(
  std::string_view text, DeclContext & ctx, std::string_view default_file = {});

/// Read and load a dump file.
[[nodiscard]] DeclLoadResult load_declarations_file(
  const std::filesystem::path & path, DeclContext & ctx);

}  // namespace namecheck
