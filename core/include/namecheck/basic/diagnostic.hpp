// namecheck/basic/diagnostic.hpp - Diagnostic types and sinks
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "namecheck/basic/source_location.hpp"

namespace namecheck
{

class Decl;

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 *
 * Naming advisories are always Warning. Error is only used by the driver
 * for input that could not be loaded.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

struct Diagnostic
{
  Severity severity = Severity::Warning;
  std::string code;     // e.g., "N003"
  std::string message;  // main message

  /// Offending declaration (nullptr for driver-level diagnostics).
  const Decl * decl = nullptr;

  /// Location reported for the diagnostic, copied from decl when present.
  SourceLocation location;

  std::optional<std::string> note_message;
  std::optional<std::string> help_message;
};

// ============================================================================
// DiagnosticSink
// ============================================================================

/**
 * Append-only destination for diagnostics.
 *
 * Checkers receive a sink pointer and forward each diagnostic as soon as it
 * is produced.
 */
class DiagnosticSink
{
public:
  virtual ~DiagnosticSink() = default;

  virtual void add(Diagnostic && diag) = 0;

protected:
  DiagnosticSink() = default;
  DiagnosticSink(const DiagnosticSink &) = default;
  DiagnosticSink & operator=(const DiagnosticSink &) = default;
  DiagnosticSink(DiagnosticSink &&) = default;
  DiagnosticSink & operator=(DiagnosticSink &&) = default;
};

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and hands it to the sink on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticSink & sink, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_note(std::string note_msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticSink & sink_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

/// Start a warning attributed to `decl` (which must not be null).
DiagnosticBuilder report_warning(DiagnosticSink & sink, const Decl & decl, std::string message);

/// Start an error that is not attached to any declaration.
DiagnosticBuilder report_error(
  DiagnosticSink & sink, std::string message, SourceLocation location = {});

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Sink that keeps every diagnostic in arrival order.
 */
class DiagnosticBag : public DiagnosticSink
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  void add(Diagnostic && diag) override;
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

// ============================================================================
// CallbackSink
// ============================================================================

/**
 * Sink that forwards each diagnostic to a callback without storing it.
 */
class CallbackSink : public DiagnosticSink
{
public:
  using Callback = std::function<void(const Diagnostic &)>;

  explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

  void add(Diagnostic && diag) override;

private:
  Callback callback_;
};

[[nodiscard]] const char * to_string(Severity severity) noexcept;

}  // namespace namecheck
