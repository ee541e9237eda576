// namecheck/basic/source_location.hpp - Source positions attached to declarations
//
// The front-end that produced the declaration tree owns the source text;
// namecheck only carries the position through so diagnostics can point at it.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace namecheck
{

/**
 * File/line/column of a declaration's name.
 *
 * Lines and columns are 1-based. A default-constructed location is invalid.
 * The file view is owned by the DeclContext the location came from.
 */
struct SourceLocation
{
  std::string_view file;
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return line != 0; }
  [[nodiscard]] bool is_invalid() const noexcept { return !is_valid(); }
};

}  // namespace namecheck
