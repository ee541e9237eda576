// namecheck/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "namecheck/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <utility>
#include <vector>

#include "namecheck/basic/unicode.hpp"
#include "namecheck/decl/decl.hpp"

namespace namecheck
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color, bool show_source)
: os_(os), use_color_(use_color), show_source_(show_source)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  } else {
    rang::setControlMode(rang::control::Force);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  const SourceLocation & loc = diag.location;

  // === Header line: warning[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (loc.is_valid()) {
    std::string filename = loc.file.empty() ? std::string("<unknown>") : std::string(loc.file);
    if (!loc.file.empty()) {
      std::error_code ec;
      auto rel_path = std::filesystem::relative(
        std::filesystem::path(filename), std::filesystem::current_path(), ec);
      if (!ec && !rel_path.empty()) {
        filename = rel_path.string();
      }
    }
    if (loc.column != 0) {
      fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, loc.line, loc.column);
    } else {
      fmt::print(os_, "{} {}:{}\n", gutter_arrow(), filename, loc.line);
    }
  } else if (!loc.file.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), loc.file);
  }

  // === Source snippet ===
  if (show_source_ && loc.is_valid() && diag.decl != nullptr) {
    print_source_line(loc, diag.decl->name);
  }

  if (diag.note_message || diag.help_message) {
    fmt::print(os_, "{}\n", gutter_pipe());
  }
  if (diag.note_message) {
    print_note(*diag.note_message);
  }
  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  for (const auto & d : diags) {
    print(d);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t warnings = diags.warnings().size();
  const size_t errors = diags.errors().size();

  if (errors > 0) {
    fmt::print(os_, "{} error{} emitted\n", errors, errors == 1 ? "" : "s");
  }
  if (warnings > 0) {
    fmt::print(os_, "{} naming warning{} emitted\n", warnings, warnings == 1 ? "" : "s");
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red << "error";
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow << "warning";
        break;
      case Severity::Info:
        os_ << rang::fg::cyan << "info";
        break;
    }
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", to_string(diag.severity), diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", to_string(diag.severity), diag.message);
    }
  }
}

void DiagnosticPrinter::print_source_line(const SourceLocation & loc, std::string_view name)
{
  const std::string * line = source_line(loc.file, loc.line);
  if (line == nullptr || line->empty()) {
    return;
  }

  // Build cleaned line (tabs -> spaces)
  std::string cleaned_line;
  cleaned_line.reserve(line->size());
  for (const char c : *line) {
    if (c == '\t') {
      cleaned_line += "    ";  // 4 spaces per tab
    } else if (c != '\r' && c != '\n') {
      cleaned_line += c;
    }
  }

  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", loc.line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", loc.line);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  if (loc.column == 0) {
    return;
  }

  // Marker prefix: walk code points up to the column, expanding tabs
  std::string marker_prefix;
  uint32_t col = 1;
  size_t pos = 0;
  while (col < loc.column && pos < line->size()) {
    const auto [cp, consumed] = decode_utf8(*line, pos);
    pos += consumed;
    marker_prefix += (cp == U'\t') ? "    " : " ";
    ++col;
  }

  const size_t marker_len = std::max<size_t>(1, code_point_count(name));

  fmt::print(os_, "      | {}", marker_prefix);
  if (use_color_) {
    os_ << rang::fg::yellow << rang::style::bold;
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", std::string(marker_len, '^'));
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::style::bold << "      = " << rang::style::reset;
    os_ << rang::style::bold << "note" << rang::style::reset;
    fmt::print(os_, ": {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::style::bold << "      = " << rang::style::reset;
    os_ << rang::fg::cyan << rang::style::bold << "help" << rang::style::reset << rang::fg::reset;
    fmt::print(os_, ": {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

const std::string * DiagnosticPrinter::source_line(std::string_view file, uint32_t line)
{
  if (file.empty() || line == 0) {
    return nullptr;
  }

  auto it = fileLines_.find(std::string(file));
  if (it == fileLines_.end()) {
    std::vector<std::string> lines;
    std::ifstream in{std::filesystem::path(std::string(file))};
    if (in.is_open()) {
      std::string text;
      while (std::getline(in, text)) {
        lines.push_back(std::move(text));
      }
    }
    it = fileLines_.emplace(std::string(file), std::move(lines)).first;
  }

  if (line > it->second.size()) {
    return nullptr;
  }
  return &it->second[line - 1];
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace namecheck
