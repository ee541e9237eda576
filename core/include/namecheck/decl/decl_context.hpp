// namecheck/decl/decl_context.hpp - Declaration arena and string pool
//
// DeclContext owns every Decl of a forest together with the interned
// names and file paths they refer to.
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <new>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "namecheck/decl/decl.hpp"

namespace namecheck
{

/**
 * Context that owns all declaration nodes and interned strings.
 *
 * Nodes are valid as long as the context is alive. There is no individual
 * deallocation; memory is released when the context is destroyed.
 *
 * Example:
 * @code
 *   DeclContext ctx;
 *   Decl * cls = ctx.create(DeclKind::Class, "Parser");
 *   Decl * fld = ctx.create(DeclKind::Field, "MAX_SIZE");
 *   ctx.set_children(cls, {fld});
 * @endcode
 */
class DeclContext
{
public:
  /// Default initial buffer size (16KB)
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit DeclContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~DeclContext() = default;

  // PMR resources are not movable
  DeclContext(const DeclContext &) = delete;
  DeclContext & operator=(const DeclContext &) = delete;
  DeclContext(DeclContext &&) = delete;
  DeclContext & operator=(DeclContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a declaration node. The name is interned into the arena.
   *
   * @return Non-owning pointer valid for the lifetime of the context
   */
  Decl * create(DeclKind kind, std::string_view name)
  {
    static_assert(
      std::is_trivially_destructible_v<Decl>,
      "Decl must be trivially destructible to be managed by the arena");

    void * const mem = arena_.allocate(sizeof(Decl), alignof(Decl));
    Decl * const decl = new (mem) Decl(kind, intern(name));
    ++declCount_;
    return decl;
  }

  /**
   * Attach `children` to `parent` in the given order and set their
   * enclosing pointer. Replaces any previously attached children.
   */
  void set_children(Decl * parent, const std::vector<Decl *> & children)
  {
    parent->children = copy_to_arena(children);
    for (Decl * child : parent->children) {
      child->enclosing = parent;
    }
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a view that is stable for the context lifetime.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (s.empty()) return {};

    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

  // ===========================================================================
  // Roots
  // ===========================================================================

  void add_root(Decl * decl) { roots_.push_back(decl); }

  [[nodiscard]] gsl::span<const Decl * const> roots() const noexcept
  {
    return {roots_.data(), roots_.size()};
  }

  [[nodiscard]] size_t decl_count() const noexcept { return declCount_; }

private:
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * vec.size(), alignof(T)));
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> stringPool_;
  std::vector<const Decl *> roots_;
  size_t declCount_ = 0;
};

}  // namespace namecheck
