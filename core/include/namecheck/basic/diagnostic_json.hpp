// namecheck/basic/diagnostic_json.hpp - JSON serialization of diagnostics
//
// Machine-readable output for editors and CI annotations.
//
#pragma once

#include <nlohmann/json.hpp>

#include "namecheck/basic/diagnostic.hpp"

namespace namecheck
{

/**
 * Serialize one diagnostic.
 *
 * @code
 *   { "severity": "warning", "code": "N003",
 *     "message": "name 'getHTTPCode' should follow camelCase",
 *     "declaration": { "kind": "method", "name": "getHTTPCode" },
 *     "location": { "file": "Parser.java", "line": 12, "column": 17 },
 *     "note": "...", "help": "..." }
 * @endcode
 *
 * "declaration", "location", "note" and "help" are omitted when absent.
 */
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag);

/// Serialize a bag as {"diagnostics": [...], "warning_count": N, "error_count": M}.
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diags);

}  // namespace namecheck
