// namecheck/check/name_checker.cpp - Naming convention checker

#include "namecheck/check/name_checker.hpp"

#include <fmt/core.h>

#include <string>

#include "namecheck/check/naming_rules.hpp"
#include "namecheck/decl/decl_visitor.hpp"

namespace namecheck
{

namespace
{

std::string role_note(const Decl & decl)
{
  if (decl.enclosing == nullptr) {
    return fmt::format("{} declared at top level", to_string(decl.kind));
  }
  return fmt::format(
    "{} declared in {} '{}'", to_string(decl.kind), to_string(decl.enclosing->kind),
    decl.enclosing->name);
}

}  // namespace

class NameChecker::NameScanner : public DeclVisitor<NameChecker::NameScanner>
{
public:
  explicit NameScanner(NameChecker & checker) : checker_(checker) {}

  void visit_type(const Decl * node)
  {
    checker_.note_visited();
    checker_.check_name(*node);
    scan_children(node);
  }

  void visit_executable(const Decl * node)
  {
    checker_.note_visited();
    if (node->kind == DeclKind::Method) {
      checker_.check_constructor_lookalike(*node);
      checker_.check_name(*node);
    }
    scan_children(node);
  }

  void visit_variable(const Decl * node)
  {
    checker_.note_visited();
    checker_.check_name(*node);
    scan_children(node);
  }

  void visit_other(const Decl * node)
  {
    checker_.note_visited();
    scan_children(node);
  }

private:
  NameChecker & checker_;
};

void NameChecker::check_all(gsl::span<const Decl * const> roots)
{
  reset();

  NameScanner scanner(*this);
  for (const Decl * root : roots) {
    scanner.visit(root);
  }
}

void NameChecker::check(const Decl & root)
{
  reset();

  NameScanner scanner(*this);
  scanner.visit(&root);
}

void NameChecker::check_name(const Decl & decl)
{
  const auto convention = convention_for(decl);
  if (!convention) {
    return;
  }

  const auto violation = check_convention(decl.name, *convention);
  if (!violation) {
    return;
  }

  ++warningCount_;
  if (diags_) {
    report_warning(*diags_, decl, violation_message(*violation, decl.name))
      .with_code(violation_code(*violation))
      .with_note(role_note(decl))
      .with_help(convention_help(*convention));
  }
}

void NameChecker::check_constructor_lookalike(const Decl & decl)
{
  if (!shares_enclosing_type_name(decl)) {
    return;
  }

  ++warningCount_;
  if (diags_) {
    report_warning(*diags_, decl, constructor_lookalike_message(decl.name))
      .with_code(k_constructor_lookalike_code)
      .with_help("rename the method, or declare a constructor if one was intended");
  }
}

void NameChecker::reset() noexcept
{
  visitedCount_ = 0;
  warningCount_ = 0;
}

}  // namespace namecheck
