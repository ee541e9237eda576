// namecheck/decl/decl_visitor.hpp - CRTP visitor for declaration trees
//
// Dispatches on the closed DeclKind enumeration (via its category) without
// virtual calls. The default visit methods simply descend into children,
// so a derived visitor only overrides what it needs.
//
#pragma once

#include "namecheck/decl/decl.hpp"
#include "namecheck/decl/decl_enums.hpp"

namespace namecheck
{

/**
 * Depth-first, parent-before-children declaration visitor.
 *
 * Usage:
 * @code
 *   class TypeCounter : public DeclVisitor<TypeCounter> {
 *   public:
 *     void visit_type(const Decl * d) {
 *       ++count;
 *       scan_children(d);
 *     }
 *     int count = 0;
 *   };
 * @endcode
 *
 * Overrides that want to keep descending must call scan_children()
 * themselves.
 *
 * @tparam Derived The derived visitor class
 */
template <typename Derived>
class DeclVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  /// Visit one node, dispatching on its category.
  void visit(const Decl * node)
  {
    if (!node) {
      return;
    }

    switch (node->get_category()) {
      case DeclCategory::Type:
        get_derived().visit_type(node);
        return;
      case DeclCategory::Executable:
        get_derived().visit_executable(node);
        return;
      case DeclCategory::Variable:
        get_derived().visit_variable(node);
        return;
      case DeclCategory::Other:
        get_derived().visit_other(node);
        return;
    }
  }

  /// Visit every child of `node` in order.
  void scan_children(const Decl * node)
  {
    for (const Decl * child : node->children) {
      visit(child);
    }
  }

  // ===========================================================================
  // Default visit methods
  // ===========================================================================

  void visit_type(const Decl * node) { scan_children(node); }
  void visit_executable(const Decl * node) { scan_children(node); }
  void visit_variable(const Decl * node) { scan_children(node); }
  void visit_other(const Decl * node) { scan_children(node); }

protected:
  DeclVisitor() = default;
  ~DeclVisitor() = default;
};

}  // namespace namecheck
