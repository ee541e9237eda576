// namecheck/basic/diagnostic_json.cpp - JSON serialization of diagnostics
//
#include "namecheck/basic/diagnostic_json.hpp"

#include <string>
#include <utility>

#include "namecheck/decl/decl.hpp"

namespace namecheck
{

using nlohmann::json;

json to_json(const Diagnostic & diag)
{
  json j{
    {"severity", to_string(diag.severity)},
    {"code", diag.code},
    {"message", diag.message},
  };

  if (diag.decl != nullptr) {
    j["declaration"] = json{
      {"kind", std::string(to_string(diag.decl->kind))},
      {"name", std::string(diag.decl->name)},
    };
  }

  if (diag.location.is_valid() || !diag.location.file.empty()) {
    json loc = json::object();
    if (!diag.location.file.empty()) {
      loc["file"] = std::string(diag.location.file);
    }
    if (diag.location.is_valid()) {
      loc["line"] = diag.location.line;
      loc["column"] = diag.location.column;
    }
    j["location"] = std::move(loc);
  }

  if (diag.note_message) {
    j["note"] = *diag.note_message;
  }
  if (diag.help_message) {
    j["help"] = *diag.help_message;
  }
  return j;
}

json to_json(const DiagnosticBag & diags)
{
  json list = json::array();
  for (const auto & d : diags) {
    list.push_back(to_json(d));
  }

  return json{
    {"diagnostics", std::move(list)},
    {"warning_count", diags.warnings().size()},
    {"error_count", diags.errors().size()},
  };
}

}  // namespace namecheck
