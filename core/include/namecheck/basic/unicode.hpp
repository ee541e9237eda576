// namecheck/basic/unicode.hpp - UTF-8 decoding and code point classification
//
// Names arrive as UTF-8. Rules look at whole code points, never bytes, so a
// multi-byte letter is one step of the scan.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

namespace namecheck
{

/// Replacement character returned for malformed input.
inline constexpr char32_t k_replacement_char = U'\uFFFD';

/**
 * Decode one UTF-8 code point starting at byte `i` of `s`.
 *
 * Returns {code point, bytes consumed}. Malformed or truncated sequences,
 * overlong forms, surrogates and values above U+10FFFF consume one byte and
 * yield k_replacement_char. `i` must be < s.size().
 */
[[nodiscard]] std::pair<char32_t, size_t> decode_utf8(std::string_view s, size_t i) noexcept;

/**
 * Forward iteration over the code points of a UTF-8 string.
 *
 * @code
 *   CodePointReader reader(name);
 *   while (!reader.at_end()) {
 *     const char32_t cp = reader.next();
 *   }
 * @endcode
 */
class CodePointReader
{
public:
  explicit CodePointReader(std::string_view text) noexcept : text_(text) {}

  [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

  /// Decode the next code point; returns 0 (and stays at end) when exhausted.
  char32_t next() noexcept
  {
    if (at_end()) return 0;
    const auto [cp, consumed] = decode_utf8(text_, pos_);
    pos_ += consumed;
    return cp;
  }

private:
  std::string_view text_;
  size_t pos_ = 0;
};

// Unicode letter-case and digit classification, independent of the locale.
// Upper is Lu plus Other_Uppercase, lower is Ll plus Other_Lowercase and
// digit is Nd. Titlecase letters (Lt) are neither upper nor lower.
[[nodiscard]] bool is_upper(char32_t cp);
[[nodiscard]] bool is_lower(char32_t cp);
[[nodiscard]] bool is_digit(char32_t cp);

/// Number of code points in `s` (malformed bytes count as one each).
[[nodiscard]] size_t code_point_count(std::string_view s) noexcept;

}  // namespace namecheck
